/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Action.hpp"
#include "Book.hpp"
#include "BookEventLogger.hpp"
#include "IConfigurable.hpp"
#include "common.hpp"
#include "mktsim/exchange/OrderPlacementValidator.hpp"
#include "mktsim/message/ExecutionReportPayload.hpp"

#include <map>
#include <string>
#include <string_view>
#include <utility>

//-------------------------------------------------------------------------

class Simulation;

//-------------------------------------------------------------------------

/**
 * Routes order requests to the per-symbol books and reports every outcome
 * back to the affected agents as notifications due at the current time.
 * Owned by the simulation, which is the only caller of the mutating methods.
 */
class Exchange : public IConfigurable
{
public:
    explicit Exchange(Simulation* simulation);

    Book& addBook(const std::string& symbol, std::string_view algorithm);
    Book& addBook(const std::string& symbol) { return addBook(symbol, m_algorithm); }

    [[nodiscard]] const std::map<std::string, Book::Ptr>& books() const noexcept { return m_books; }
    [[nodiscard]] const Book* findBook(const std::string& symbol) const noexcept;
    [[nodiscard]] const Book& book(const std::string& symbol) const;
    [[nodiscard]] const std::string& algorithm() const noexcept { return m_algorithm; }
    [[nodiscard]] std::optional<ClientOrderID> clientOrderId(
        const std::string& symbol, OrderID orderId) const;

    void placeOrder(AgentId agentId, const PlaceOrder& request, Timestamp now);
    void modifyOrder(AgentId agentId, const ModifyOrder& request, Timestamp now);
    void cancelOrder(AgentId agentId, const CancelOrder& request, Timestamp now);

    // Attaches the logger to every current and future book.
    void setBookEventLogger(BookEventLogger* logger);

    virtual void configure(const pugi::xml_node& node) override;

    static constexpr std::string_view s_defaultAlgorithm = "PriceTime";

private:
    void placeMarketOrder(
        AgentId agentId, const MarketOrder& order, std::optional<ClientOrderID> clientOrderId, Timestamp now);
    void placeLimitOrder(
        AgentId agentId, const LimitOrder& order, std::optional<ClientOrderID> clientOrderId, Timestamp now);
    void settleBasketOrder(
        AgentId agentId, const BasketOrder& order, std::optional<ClientOrderID> clientOrderId, Timestamp now);

    template<typename T>
    void reportMatch(
        const T& incoming,
        const Book& book,
        const MatchResult& result,
        std::optional<ClientOrderID> clientOrderId,
        Timestamp now);

    void reject(
        AgentId agentId,
        std::optional<OrderID> orderId,
        OrderErrorCode reason,
        std::optional<AnyOrder> order,
        std::optional<ClientOrderID> clientOrderId,
        Timestamp now);

    void notify(AgentId target, ExecutionReportPayload::Ptr payload, Timestamp now);

    [[nodiscard]] Book& mutableBook(const std::string& symbol);
    // Client id of a resting order, withheld from anyone but its owner.
    [[nodiscard]] std::optional<ClientOrderID> ownedClientOrderId(
        AgentId agentId, const std::string& symbol, OrderID orderId) const;

    Simulation* m_simulation;
    std::string m_algorithm{s_defaultAlgorithm};
    std::map<std::string, Book::Ptr> m_books;
    // Client ids of resting orders, echoed in every later notification.
    // Order ids are only unique within one book.
    std::map<std::pair<std::string, OrderID>, ClientOrderID> m_clientOrderIds;
    mktsim::exchange::OrderPlacementValidator m_validator;
    BookEventLogger* m_bookEventLogger{};
};

//-------------------------------------------------------------------------
