/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Book.hpp"

#include "SimulationException.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

Book::Book(std::string symbol)
    : m_symbol{std::move(symbol)}
{
    if (m_symbol.empty()) {
        throw std::invalid_argument(fmt::format(
            "{}: book symbol must be non-empty", std::source_location::current().function_name()));
    }
}

//-------------------------------------------------------------------------

std::optional<Price> Book::bestBid() const noexcept
{
    if (m_buyQueue.empty()) [[unlikely]] {
        return {};
    }
    return m_buyQueue.back().price();
}

//-------------------------------------------------------------------------

std::optional<Price> Book::bestAsk() const noexcept
{
    if (m_sellQueue.empty()) [[unlikely]] {
        return {};
    }
    return m_sellQueue.front().price();
}

//-------------------------------------------------------------------------

std::optional<Price> Book::midPrice() const noexcept
{
    if (m_buyQueue.empty() || m_sellQueue.empty()) [[unlikely]] {
        return {};
    }
    return (m_buyQueue.back().price() + m_sellQueue.front().price()) / 2;
}

//-------------------------------------------------------------------------

std::optional<LimitOrder> Book::getOrder(OrderID orderId) const
{
    auto it = m_orderIdMap.find(orderId);
    if (it == m_orderIdMap.end()) return {};

    const auto& [direction, price] = it->second;
    const auto& side = direction == OrderDirection::BUY ? m_buyQueue : m_sellQueue;
    auto levelIt = std::lower_bound(side.begin(), side.end(), price);
    if (levelIt == side.end() || levelIt->price() != price) return {};

    auto orderIt = std::find_if(
        levelIt->begin(), levelIt->end(), [orderId](const auto& order) {
            return order.id() == orderId;
        });
    return orderIt != levelIt->end() ? std::make_optional(orderIt->clone()) : std::nullopt;
}

//-------------------------------------------------------------------------

std::vector<LevelSummary> Book::levels(OrderDirection side, size_t depth) const
{
    auto summarize = [](const auto& level) {
        return LevelSummary{
            .price = level.price(), .volume = level.volume(), .orderCount = level.size()};
    };
    if (side == OrderDirection::BUY) {
        return m_buyQueue
            | views::reverse
            | views::take(depth)
            | views::transform(summarize)
            | ranges::to<std::vector>();
    }
    return m_sellQueue
        | views::take(depth)
        | views::transform(summarize)
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

MatchResult Book::placeMarketOrder(const MarketOrder& order, Timestamp timestamp)
{
    validate(order);

    const auto& opposingSide = order.isBuyOrder() ? m_sellQueue : m_buyQueue;
    if (opposingSide.empty()) {
        throw NoLiquidityError{fmt::format(
            "{}: no resting {} interest for market order #{}",
            m_symbol,
            opposite(order.direction()),
            order.id())};
    }

    MatchResult result{.remaining = order.quantity()};
    if (order.isBuyOrder()) {
        processAgainstTheSellQueue(order, MARKET_SENTINEL_PRICE, result, timestamp);
    } else {
        processAgainstTheBuyQueue(order, std::numeric_limits<Price>::min(), result, timestamp);
    }
    return result;
}

//-------------------------------------------------------------------------

MatchResult Book::placeLimitOrder(const LimitOrder& order, Timestamp timestamp)
{
    validate(order);
    if (order.limitPrice() <= 0) {
        throw InvalidOrderError{
            OrderErrorCode::INVALID_PRICE,
            fmt::format("{}: order #{} has limit price {}", m_symbol, order.id(), order.limitPrice())};
    }
    if (m_orderIdMap.contains(order.id())) {
        throw InvalidOrderError{
            OrderErrorCode::DUPLICATE_ORDER_ID,
            fmt::format("{}: order #{} is already resting", m_symbol, order.id())};
    }

    MatchResult result{.remaining = order.quantity()};
    if (order.isBuyOrder()) {
        placeLimitBuy(order, result, timestamp);
    } else {
        placeLimitSell(order, result, timestamp);
    }
    return result;
}

//-------------------------------------------------------------------------

LimitOrder Book::cancelOrder(OrderID orderId)
{
    LimitOrder order = removeLimitOrder(orderId);
    m_signals.cancel(order);
    return order;
}

//-------------------------------------------------------------------------

MatchResult Book::modifyOrder(OrderID orderId, Quantity quantity, Price price, Timestamp timestamp)
{
    if (!m_orderIdMap.contains(orderId)) {
        throw OrderNotFoundError{fmt::format("{}: order #{} is not resting", m_symbol, orderId)};
    }
    if (quantity <= 0) {
        throw InvalidOrderError{
            OrderErrorCode::INVALID_VOLUME,
            fmt::format("{}: order #{} cannot be modified to quantity {}", m_symbol, orderId, quantity)};
    }
    if (price <= 0) {
        throw InvalidOrderError{
            OrderErrorCode::INVALID_PRICE,
            fmt::format("{}: order #{} cannot be modified to price {}", m_symbol, orderId, price)};
    }

    // The old slot is vacated first so the replacement cannot trade against it.
    const LimitOrder old = removeLimitOrder(orderId);
    const LimitOrder replacement{
        old.direction(), old.agentId(), old.symbol(), timestamp, quantity, price, orderId, old.tag()};
    m_signals.modify(old, replacement);
    MatchResult result = placeLimitOrder(replacement, timestamp);
    result.replacement = replacement;
    return result;
}

//-------------------------------------------------------------------------

void Book::placeLimitBuy(const LimitOrder& order, MatchResult& result, Timestamp timestamp)
{
    if (!m_sellQueue.empty() && order.isMatch(m_sellQueue.front().front())) {
        processAgainstTheSellQueue(order, order.limitPrice(), result, timestamp);
    }
    if (result.remaining > 0) {
        const auto remainder = order.withQuantity(result.remaining);
        insertLimitBuy(remainder);
        result.rested = remainder;
    }
}

//-------------------------------------------------------------------------

void Book::placeLimitSell(const LimitOrder& order, MatchResult& result, Timestamp timestamp)
{
    if (!m_buyQueue.empty() && order.isMatch(m_buyQueue.back().front())) {
        processAgainstTheBuyQueue(order, order.limitPrice(), result, timestamp);
    }
    if (result.remaining > 0) {
        const auto remainder = order.withQuantity(result.remaining);
        insertLimitSell(remainder);
        result.rested = remainder;
    }
}

//-------------------------------------------------------------------------

void Book::insertLimitBuy(const LimitOrder& order)
{
    auto firstLessThan = std::find_if(
        m_buyQueue.rbegin(),
        m_buyQueue.rend(),
        [&order](const auto& level) { return level.price() <= order.limitPrice(); });

    if (firstLessThan != m_buyQueue.rend() && firstLessThan->price() == order.limitPrice()) {
        firstLessThan->push_back(order);
    }
    else {
        auto levelIt = m_buyQueue.emplace(firstLessThan.base(), &m_buyQueue, order.limitPrice());
        levelIt->push_back(order);
    }
    registerLimitOrder(order);
}

//-------------------------------------------------------------------------

void Book::insertLimitSell(const LimitOrder& order)
{
    auto firstGreaterThan = std::find_if(
        m_sellQueue.begin(),
        m_sellQueue.end(),
        [&order](const auto& level) { return level.price() >= order.limitPrice(); });

    if (firstGreaterThan != m_sellQueue.end() && firstGreaterThan->price() == order.limitPrice()) {
        firstGreaterThan->push_back(order);
    }
    else {
        auto levelIt = m_sellQueue.emplace(firstGreaterThan, &m_sellQueue, order.limitPrice());
        levelIt->push_back(order);
    }
    registerLimitOrder(order);
}

//-------------------------------------------------------------------------

void Book::registerLimitOrder(const LimitOrder& order)
{
    m_orderIdMap[order.id()] = OrderLocation{order.direction(), order.limitPrice()};
    m_signals.orderRested(order);
}

//-------------------------------------------------------------------------

void Book::unregisterLimitOrder(OrderID orderId)
{
    m_orderIdMap.erase(orderId);
}

//-------------------------------------------------------------------------

LimitOrder Book::removeLimitOrder(OrderID orderId)
{
    auto it = m_orderIdMap.find(orderId);
    if (it == m_orderIdMap.end()) {
        throw OrderNotFoundError{fmt::format("{}: order #{} is not resting", m_symbol, orderId)};
    }

    const auto [direction, price] = it->second;
    auto& orderSideLevels = direction == OrderDirection::BUY ? m_buyQueue : m_sellQueue;
    auto levelIt = std::lower_bound(orderSideLevels.begin(), orderSideLevels.end(), price);

    std::optional<LimitOrder> removed;
    if (levelIt != orderSideLevels.end() && levelIt->price() == price) {
        removed = levelIt->removeOrder(orderId);
    }
    if (!removed) [[unlikely]] {
        throw SimulationException{fmt::format(
            "{}: order #{} indexed at {} but missing from its level", m_symbol, orderId, price)};
    }

    if (levelIt->empty()) {
        orderSideLevels.erase(levelIt);
    }
    m_orderIdMap.erase(it);
    return std::move(*removed);
}

//-------------------------------------------------------------------------

void Book::logTrade(
    OrderDirection direction,
    OrderID aggressorId,
    const LimitOrder& resting,
    Quantity volume,
    Price execPrice,
    Timestamp timestamp,
    MatchResult& result)
{
    const bool aggressorBuys = direction == OrderDirection::BUY;
    const Fill fill{
        .buyOrderId = aggressorBuys ? aggressorId : resting.id(),
        .sellOrderId = aggressorBuys ? resting.id() : aggressorId,
        .price = execPrice,
        .quantity = volume,
        .time = timestamp,
        .aggressorDirection = direction
    };
    result.executions.push_back(Execution{fill, resting.executed(execPrice, volume)});
    m_signals.fill(fill);
}

//-------------------------------------------------------------------------

void Book::validate(const BasicOrder& order) const
{
    if (!order.hasId()) {
        throw std::invalid_argument{fmt::format(
            "{}: orders must carry an id before reaching the book",
            std::source_location::current().function_name())};
    }
    if (order.symbol() != m_symbol) {
        throw InvalidOrderError{
            OrderErrorCode::UNKNOWN_SYMBOL,
            fmt::format("{}: order #{} is for symbol '{}'", m_symbol, order.id(), order.symbol())};
    }
    if (order.quantity() <= 0) {
        throw InvalidOrderError{
            OrderErrorCode::INVALID_VOLUME,
            fmt::format("{}: order #{} has quantity {}", m_symbol, order.id(), order.quantity())};
    }
}

//-------------------------------------------------------------------------
