/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Order.hpp"

#include "util.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

BasicOrder::BasicOrder(
    OrderDirection direction,
    AgentId agentId,
    std::string symbol,
    Timestamp timePlaced,
    Quantity quantity,
    std::optional<OrderID> id,
    OrderTag tag) noexcept
    : m_id{id},
      m_agentId{agentId},
      m_symbol{std::move(symbol)},
      m_timePlaced{timePlaced},
      m_quantity{quantity},
      m_direction{direction},
      m_tag{std::move(tag)}
{}

//-------------------------------------------------------------------------

OrderID BasicOrder::id() const
{
    if (!m_id) {
        throw std::logic_error{fmt::format(
            "{}: order of agent #{} has no id assigned yet",
            std::source_location::current().function_name(),
            m_agentId)};
    }
    return *m_id;
}

//-------------------------------------------------------------------------

void BasicOrder::assignId(OrderID id)
{
    if (m_id) {
        throw std::logic_error{fmt::format(
            "{}: order #{} cannot be renumbered to #{}",
            std::source_location::current().function_name(),
            *m_id,
            id)};
    }
    m_id = id;
}

//-------------------------------------------------------------------------

MarketOrder::MarketOrder(
    OrderDirection direction,
    AgentId agentId,
    std::string symbol,
    Timestamp timePlaced,
    Quantity quantity,
    std::optional<OrderID> id,
    OrderTag tag) noexcept
    : BasicOrder{direction, agentId, std::move(symbol), timePlaced, quantity, id, std::move(tag)}
{}

//-------------------------------------------------------------------------

MarketOrder MarketOrder::clone() const
{
    MarketOrder order{m_direction, m_agentId, m_symbol, m_timePlaced, m_quantity, m_id, m_tag};
    order.m_fillPrice = m_fillPrice;
    return order;
}

//-------------------------------------------------------------------------

MarketOrder MarketOrder::withQuantity(Quantity quantity) const
{
    return MarketOrder{m_direction, m_agentId, m_symbol, m_timePlaced, quantity, m_id, m_tag};
}

//-------------------------------------------------------------------------

MarketOrder MarketOrder::executed(Price price, Quantity quantity) const
{
    auto order = withQuantity(quantity);
    order.setFillPrice(price);
    return order;
}

//-------------------------------------------------------------------------

LimitOrder::LimitOrder(
    OrderDirection direction,
    AgentId agentId,
    std::string symbol,
    Timestamp timePlaced,
    Quantity quantity,
    Price limitPrice,
    std::optional<OrderID> id,
    OrderTag tag) noexcept
    : BasicOrder{direction, agentId, std::move(symbol), timePlaced, quantity, id, std::move(tag)},
      m_limitPrice{limitPrice}
{}

//-------------------------------------------------------------------------

LimitOrder LimitOrder::clone() const
{
    LimitOrder order{
        m_direction, m_agentId, m_symbol, m_timePlaced, m_quantity, m_limitPrice, m_id, m_tag};
    order.m_fillPrice = m_fillPrice;
    return order;
}

//-------------------------------------------------------------------------

LimitOrder LimitOrder::withQuantity(Quantity quantity) const
{
    return LimitOrder{
        m_direction, m_agentId, m_symbol, m_timePlaced, quantity, m_limitPrice, m_id, m_tag};
}

//-------------------------------------------------------------------------

LimitOrder LimitOrder::executed(Price price, Quantity quantity) const
{
    auto order = withQuantity(quantity);
    order.setFillPrice(price);
    return order;
}

//-------------------------------------------------------------------------

bool LimitOrder::isMatch(const LimitOrder& other) const
{
    if (m_direction == other.direction()) {
        spdlog::warn("isMatch() called on limit orders of same direction: {} vs {}", *this, other);
        return false;
    }
    return isBuyOrder() ? m_limitPrice >= other.limitPrice() : m_limitPrice <= other.limitPrice();
}

//-------------------------------------------------------------------------

bool LimitOrder::hasEqPrice(const LimitOrder& other) const noexcept
{
    return m_limitPrice == other.limitPrice();
}

//-------------------------------------------------------------------------

bool LimitOrder::hasBetterPrice(const LimitOrder& other) const
{
    if (m_direction != other.direction()) {
        spdlog::warn(
            "hasBetterPrice() called on limit orders of different direction: {} vs {}",
            *this,
            other);
        return false;
    }
    return isBuyOrder() ? m_limitPrice > other.limitPrice() : m_limitPrice < other.limitPrice();
}

//-------------------------------------------------------------------------

BasketOrder::BasketOrder(
    OrderDirection direction,
    AgentId agentId,
    std::string symbol,
    Timestamp timePlaced,
    Quantity quantity,
    bool dollar,
    std::optional<OrderID> id,
    OrderTag tag) noexcept
    : BasicOrder{direction, agentId, std::move(symbol), timePlaced, quantity, id, std::move(tag)},
      m_dollar{dollar}
{}

//-------------------------------------------------------------------------

BasketOrder BasketOrder::clone() const
{
    BasketOrder order{
        m_direction, m_agentId, m_symbol, m_timePlaced, m_quantity, m_dollar, m_id, m_tag};
    order.m_fillPrice = m_fillPrice;
    return order;
}

//-------------------------------------------------------------------------

AnyOrder cloneOrder(const AnyOrder& order)
{
    return std::visit([](const auto& o) -> AnyOrder { return o.clone(); }, order);
}

//-------------------------------------------------------------------------

const BasicOrder& basicOrder(const AnyOrder& order) noexcept
{
    return std::visit([](const auto& o) -> const BasicOrder& { return o; }, order);
}

//-------------------------------------------------------------------------

BasicOrder& basicOrder(AnyOrder& order) noexcept
{
    return std::visit([](auto& o) -> BasicOrder& { return o; }, order);
}

//-------------------------------------------------------------------------

namespace
{

std::string tagInfo(const OrderTag& tag)
{
    return tag ? fmt::format(" [{}]", *tag) : std::string{};
}

std::string direction2Side(const BasicOrder& order)
{
    return order.isBuyOrder() ? "BUY" : "SELL";
}

}  // namespace

//-------------------------------------------------------------------------

std::string toString(const MarketOrder& order)
{
    return fmt::format(
        "(Agent {} @ {}{}) : MKT Order {} {} {}",
        order.agentId(),
        order.timePlaced(),
        tagInfo(order.tag()),
        direction2Side(order),
        order.quantity(),
        order.symbol());
}

//-------------------------------------------------------------------------

std::string toString(const LimitOrder& order)
{
    const std::string limitInfo = order.limitPrice() < MARKET_SENTINEL_PRICE
        ? mktsim::util::dollarize(order.limitPrice())
        : "MKT";
    const std::string filled = order.fillPrice()
        ? fmt::format(" (filled @ {})", mktsim::util::dollarize(*order.fillPrice()))
        : std::string{};
    return fmt::format(
        "(Agent {} @ {}{}) : {} {} {} @ {}{}",
        order.agentId(),
        order.timePlaced(),
        tagInfo(order.tag()),
        direction2Side(order),
        order.quantity(),
        order.symbol(),
        limitInfo,
        filled);
}

//-------------------------------------------------------------------------

std::string toString(const BasketOrder& order)
{
    std::string filled;
    if (const auto fillPrice = order.fillPrice()) {
        filled = fmt::format(
            " (filled @ {})",
            order.dollar() ? mktsim::util::dollarize(*fillPrice) : std::to_string(*fillPrice));
    }
    return fmt::format(
        "(Order_ID: {} Agent {} @ {}) : {} {} {}{}",
        order.hasId() ? std::to_string(order.id()) : "?",
        order.agentId(),
        order.timePlaced(),
        order.isBuyOrder() ? "CREATE" : "REDEEM",
        order.quantity(),
        order.symbol(),
        filled);
}

//-------------------------------------------------------------------------

std::string toString(const AnyOrder& order)
{
    return std::visit([](const auto& o) { return toString(o); }, order);
}

//-------------------------------------------------------------------------
