/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Exchange.hpp"

#include "PriceTimeBook.hpp"
#include "Simulation.hpp"
#include "SimulationException.hpp"

#include <concepts>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

Exchange::Exchange(Simulation* simulation)
    : m_simulation{simulation},
      m_validator{this}
{}

//-------------------------------------------------------------------------

Book& Exchange::addBook(const std::string& symbol, std::string_view algorithm)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_books.contains(symbol)) {
        throw std::invalid_argument{fmt::format("{}: duplicate book for symbol '{}'", ctx, symbol)};
    }

    Book::Ptr book = [&] -> Book::Ptr {
        if (algorithm == "PriceTime") {
            return std::make_shared<PriceTimeBook>(symbol);
        }
        throw std::invalid_argument{fmt::format(
            "{}: unknown matching algorithm '{}' for symbol '{}'", ctx, algorithm, symbol)};
    }();

    if (m_bookEventLogger != nullptr) {
        m_bookEventLogger->attach(*book);
    }
    m_simulation->logDebug("EXCHANGE : OPENED {} BOOK FOR {}", algorithm, symbol);

    return *m_books.emplace(symbol, std::move(book)).first->second;
}

//-------------------------------------------------------------------------

const Book* Exchange::findBook(const std::string& symbol) const noexcept
{
    auto it = m_books.find(symbol);
    return it != m_books.end() ? it->second.get() : nullptr;
}

//-------------------------------------------------------------------------

const Book& Exchange::book(const std::string& symbol) const
{
    if (const Book* book = findBook(symbol)) {
        return *book;
    }
    throw std::out_of_range{fmt::format(
        "{}: no book for symbol '{}'", std::source_location::current().function_name(), symbol)};
}

//-------------------------------------------------------------------------

std::optional<ClientOrderID> Exchange::clientOrderId(
    const std::string& symbol, OrderID orderId) const
{
    auto it = m_clientOrderIds.find({symbol, orderId});
    if (it == m_clientOrderIds.end()) return {};
    return it->second;
}

//-------------------------------------------------------------------------

std::optional<ClientOrderID> Exchange::ownedClientOrderId(
    AgentId agentId, const std::string& symbol, OrderID orderId) const
{
    const Book* book = findBook(symbol);
    if (book == nullptr) return {};
    const auto order = book->getOrder(orderId);
    if (!order.has_value() || order->agentId() != agentId) return {};
    return clientOrderId(symbol, orderId);
}

//-------------------------------------------------------------------------

void Exchange::placeOrder(AgentId agentId, const PlaceOrder& request, Timestamp now)
{
    std::visit(
        [&](const auto& order) {
            using T = std::remove_cvref_t<decltype(order)>;
            if (order.agentId() != agentId) {
                reject(agentId, order.id(), OrderErrorCode::NONEXISTENT_ORDER, order, request.clientOrderId, now);
            }
            else if constexpr (std::same_as<T, MarketOrder>) {
                placeMarketOrder(agentId, order, request.clientOrderId, now);
            }
            else if constexpr (std::same_as<T, LimitOrder>) {
                placeLimitOrder(agentId, order, request.clientOrderId, now);
            }
            else {
                settleBasketOrder(agentId, order, request.clientOrderId, now);
            }
        },
        request.order);
}

//-------------------------------------------------------------------------

void Exchange::modifyOrder(AgentId agentId, const ModifyOrder& request, Timestamp now)
{
    const auto clientOrderId = ownedClientOrderId(agentId, request.symbol, request.orderId);

    if (auto valid = m_validator.validateModification(agentId, request); !valid) {
        m_simulation->logDebug(
            "{} | AGENT #{} BOOK {} : MODIFY OF ORDER #{} REJECTED ({})",
            now, agentId, request.symbol, request.orderId, valid.error());
        reject(agentId, request.orderId, valid.error(), {}, clientOrderId, now);
        return;
    }

    Book& book = mutableBook(request.symbol);
    try {
        const MatchResult result =
            book.modifyOrder(request.orderId, request.quantity, request.limitPrice, now);
        m_simulation->logDebug(
            "{} | AGENT #{} BOOK {} : MODIFIED ORDER #{} TO {}",
            now, agentId, request.symbol, request.orderId, *result.replacement);
        reportMatch(*result.replacement, book, result, clientOrderId, now);
    }
    catch (const OrderError& e) {
        m_simulation->logDebug("{} | AGENT #{} BOOK {} : {}", now, agentId, request.symbol, e.what());
        reject(agentId, request.orderId, e.code(), {}, clientOrderId, now);
    }
}

//-------------------------------------------------------------------------

void Exchange::cancelOrder(AgentId agentId, const CancelOrder& request, Timestamp now)
{
    const auto clientOrderId = ownedClientOrderId(agentId, request.symbol, request.orderId);

    if (auto valid = m_validator.validateCancellation(agentId, request); !valid) {
        m_simulation->logDebug(
            "{} | AGENT #{} BOOK {} : CANCEL OF ORDER #{} REJECTED ({})",
            now, agentId, request.symbol, request.orderId, valid.error());
        reject(agentId, request.orderId, valid.error(), {}, clientOrderId, now);
        return;
    }

    try {
        const LimitOrder cancelled = mutableBook(request.symbol).cancelOrder(request.orderId);
        m_clientOrderIds.erase({request.symbol, request.orderId});
        m_simulation->logDebug("{} | AGENT #{} BOOK {} : CANCELLED {}", now, agentId, request.symbol, cancelled);

        auto payload = MessagePayload::create<ExecutionReportPayload>(NotificationKind::CANCELLED);
        payload->orderId = cancelled.id();
        payload->quantity = cancelled.quantity();
        payload->order = cancelled;
        payload->clientOrderId = clientOrderId;
        notify(agentId, payload, now);
    }
    catch (const OrderError& e) {
        m_simulation->logDebug("{} | AGENT #{} BOOK {} : {}", now, agentId, request.symbol, e.what());
        reject(agentId, request.orderId, e.code(), {}, clientOrderId, now);
    }
}

//-------------------------------------------------------------------------

void Exchange::setBookEventLogger(BookEventLogger* logger)
{
    m_bookEventLogger = logger;
    if (m_bookEventLogger == nullptr) return;
    for (const auto& [_, book] : m_books) {
        m_bookEventLogger->attach(*book);
    }
}

//-------------------------------------------------------------------------

void Exchange::configure(const pugi::xml_node& node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    m_algorithm = node.attribute("algorithm").as_string(s_defaultAlgorithm.data());

    for (pugi::xml_node bookNode : node.children("Book")) {
        pugi::xml_attribute attr;
        if (attr = bookNode.attribute("symbol"); attr.empty() || std::string_view{attr.as_string()}.empty()) {
            throw std::invalid_argument{fmt::format("{}: 'Book' is missing attribute 'symbol'", ctx)};
        }
        addBook(attr.as_string(), bookNode.attribute("algorithm").as_string(m_algorithm.c_str()));
    }

    if (m_books.empty()) {
        throw std::invalid_argument{fmt::format("{}: 'Exchange' needs at least one 'Book'", ctx)};
    }
}

//-------------------------------------------------------------------------

void Exchange::placeMarketOrder(
    AgentId agentId, const MarketOrder& order, std::optional<ClientOrderID> clientOrderId, Timestamp now)
{
    if (auto valid = m_validator.validateMarketOrderPlacement(order); !valid) {
        m_simulation->logDebug(
            "{} | AGENT #{} BOOK {} : MARKET ORDER #{} REJECTED ({})",
            now, agentId, order.symbol(), order.id(), valid.error());
        reject(agentId, order.id(), valid.error(), order, clientOrderId, now);
        return;
    }

    Book& book = mutableBook(order.symbol());
    try {
        const MatchResult result = book.placeMarketOrder(order, now);
        reportMatch(order, book, result, clientOrderId, now);
        if (result.remaining > 0) {
            auto payload = MessagePayload::create<ExecutionReportPayload>(NotificationKind::REJECTED);
            payload->orderId = order.id();
            payload->quantity = result.remaining;
            payload->reason = OrderErrorCode::EMPTY_BOOK;
            payload->order = order.withQuantity(result.remaining);
            payload->clientOrderId = clientOrderId;
            notify(agentId, payload, now);
        }
    }
    catch (const OrderError& e) {
        m_simulation->logDebug("{} | AGENT #{} BOOK {} : {}", now, agentId, order.symbol(), e.what());
        reject(agentId, order.id(), e.code(), order, clientOrderId, now);
    }
}

//-------------------------------------------------------------------------

void Exchange::placeLimitOrder(
    AgentId agentId, const LimitOrder& order, std::optional<ClientOrderID> clientOrderId, Timestamp now)
{
    if (auto valid = m_validator.validateLimitOrderPlacement(order); !valid) {
        m_simulation->logDebug(
            "{} | AGENT #{} BOOK {} : LIMIT ORDER #{} REJECTED ({})",
            now, agentId, order.symbol(), order.id(), valid.error());
        reject(agentId, order.id(), valid.error(), order, clientOrderId, now);
        return;
    }

    Book& book = mutableBook(order.symbol());
    try {
        const MatchResult result = book.placeLimitOrder(order, now);
        reportMatch(order, book, result, clientOrderId, now);
    }
    catch (const OrderError& e) {
        m_simulation->logDebug("{} | AGENT #{} BOOK {} : {}", now, agentId, order.symbol(), e.what());
        reject(agentId, order.id(), e.code(), order, clientOrderId, now);
    }
}

//-------------------------------------------------------------------------

void Exchange::settleBasketOrder(
    AgentId agentId, const BasketOrder& order, std::optional<ClientOrderID> clientOrderId, Timestamp now)
{
    if (auto valid = m_validator.validateBasketOrderPlacement(order); !valid) {
        reject(agentId, order.id(), valid.error(), order, clientOrderId, now);
        return;
    }

    m_simulation->logDebug("{} | AGENT #{} : SETTLED {}", now, agentId, order);

    auto payload = MessagePayload::create<ExecutionReportPayload>(NotificationKind::EXECUTED);
    payload->orderId = order.id();
    payload->fillPrice = order.fillPrice();
    payload->quantity = order.quantity();
    payload->order = order.clone();
    payload->clientOrderId = clientOrderId;
    notify(agentId, payload, now);
}

//-------------------------------------------------------------------------

template<typename T>
void Exchange::reportMatch(
    const T& incoming,
    const Book& book,
    const MatchResult& result,
    std::optional<ClientOrderID> clientOrderId,
    Timestamp now)
{
    for (const auto& [fill, resting] : result.executions) {
        m_simulation->logDebug(
            "{} | BOOK {} : #{} x #{} {} @ {}",
            now, book.symbol(), fill.aggressingOrderId(), fill.restingOrderId(), fill.quantity, fill.price);

        auto restingPayload = MessagePayload::create<ExecutionReportPayload>(NotificationKind::EXECUTED);
        restingPayload->orderId = resting.id();
        restingPayload->fillPrice = fill.price;
        restingPayload->quantity = fill.quantity;
        restingPayload->order = resting;
        restingPayload->clientOrderId = this->clientOrderId(book.symbol(), resting.id());
        notify(resting.agentId(), restingPayload, now);
        if (!book.contains(resting.id())) {
            m_clientOrderIds.erase({book.symbol(), resting.id()});
        }

        auto incomingPayload = MessagePayload::create<ExecutionReportPayload>(NotificationKind::EXECUTED);
        incomingPayload->orderId = incoming.id();
        incomingPayload->fillPrice = fill.price;
        incomingPayload->quantity = fill.quantity;
        incomingPayload->order = incoming.executed(fill.price, fill.quantity);
        incomingPayload->clientOrderId = clientOrderId;
        notify(incoming.agentId(), incomingPayload, now);
    }

    if (result.rested.has_value()) {
        if (clientOrderId.has_value()) {
            m_clientOrderIds[{book.symbol(), result.rested->id()}] = *clientOrderId;
        }
        auto payload = MessagePayload::create<ExecutionReportPayload>(NotificationKind::ACKED);
        payload->orderId = result.rested->id();
        payload->quantity = result.rested->quantity();
        payload->order = *result.rested;
        payload->clientOrderId = clientOrderId;
        notify(incoming.agentId(), payload, now);
    }
    else {
        m_clientOrderIds.erase({book.symbol(), incoming.id()});
    }
}

//-------------------------------------------------------------------------

void Exchange::reject(
    AgentId agentId,
    std::optional<OrderID> orderId,
    OrderErrorCode reason,
    std::optional<AnyOrder> order,
    std::optional<ClientOrderID> clientOrderId,
    Timestamp now)
{
    auto payload = MessagePayload::create<ExecutionReportPayload>(NotificationKind::REJECTED);
    payload->orderId = orderId;
    payload->reason = reason;
    if (order.has_value()) {
        payload->quantity = basicOrder(*order).quantity();
    }
    payload->order = std::move(order);
    payload->clientOrderId = clientOrderId;
    notify(agentId, payload, now);
}

//-------------------------------------------------------------------------

void Exchange::notify(AgentId target, ExecutionReportPayload::Ptr payload, Timestamp now)
{
    m_simulation->dispatchMessage(
        now,
        0,
        EXCHANGE_AGENT_ID,
        target,
        std::string{NotificationKind2MessageType(payload->kind)},
        payload);
}

//-------------------------------------------------------------------------

Book& Exchange::mutableBook(const std::string& symbol)
{
    auto it = m_books.find(symbol);
    if (it == m_books.end()) {
        throw InvalidOrderError{
            OrderErrorCode::UNKNOWN_SYMBOL, fmt::format("no book for symbol '{}'", symbol)};
    }
    return *it->second;
}

//-------------------------------------------------------------------------
