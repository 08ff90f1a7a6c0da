/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BookSignals.hpp"
#include "Fill.hpp"
#include "Order.hpp"
#include "common.hpp"
#include "mktsim/book/OrderContainer.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

// A fill together with the resting order's record for the filled quantity.
struct Execution
{
    Fill fill;
    LimitOrder resting;
};

struct MatchResult
{
    std::vector<Execution> executions;
    // Quantity of the incoming order left unfilled.
    Quantity remaining{};
    // Remainder inserted into the book, if any.
    std::optional<LimitOrder> rested;
    // Record placed in place of a modified order.
    std::optional<LimitOrder> replacement;
};

struct LevelSummary
{
    Price price;
    Quantity volume;
    size_t orderCount;
};

//-------------------------------------------------------------------------

/**
 * Limit order book for one symbol. Resting orders are owned here exclusively;
 * callers only ever receive copies. The matching rule is supplied by
 * subclasses through processAgainstTheBuyQueue/processAgainstTheSellQueue.
 */
class Book
{
public:
    using Ptr = std::shared_ptr<Book>;

    explicit Book(std::string symbol);
    Book(const Book&) = delete;
    Book& operator=(const Book&) = delete;

    virtual ~Book() noexcept = default;

    [[nodiscard]] const std::string& symbol() const noexcept { return m_symbol; }
    [[nodiscard]] const mktsim::book::OrderContainer& buyQueue() const noexcept { return m_buyQueue; }
    [[nodiscard]] const mktsim::book::OrderContainer& sellQueue() const noexcept { return m_sellQueue; }
    [[nodiscard]] BookSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] std::optional<Price> bestBid() const noexcept;
    [[nodiscard]] std::optional<Price> bestAsk() const noexcept;
    [[nodiscard]] std::optional<Price> midPrice() const noexcept;
    [[nodiscard]] size_t orderCount() const noexcept { return m_orderIdMap.size(); }
    [[nodiscard]] bool contains(OrderID orderId) const noexcept { return m_orderIdMap.contains(orderId); }
    [[nodiscard]] std::optional<LimitOrder> getOrder(OrderID orderId) const;
    [[nodiscard]] std::vector<LevelSummary> levels(OrderDirection side, size_t depth) const;

    MatchResult placeMarketOrder(const MarketOrder& order, Timestamp timestamp);
    MatchResult placeLimitOrder(const LimitOrder& order, Timestamp timestamp);
    LimitOrder cancelOrder(OrderID orderId);
    MatchResult modifyOrder(OrderID orderId, Quantity quantity, Price price, Timestamp timestamp);

protected:
    void placeLimitBuy(const LimitOrder& order, MatchResult& result, Timestamp timestamp);
    void placeLimitSell(const LimitOrder& order, MatchResult& result, Timestamp timestamp);
    void insertLimitBuy(const LimitOrder& order);
    void insertLimitSell(const LimitOrder& order);

    void registerLimitOrder(const LimitOrder& order);
    void unregisterLimitOrder(OrderID orderId);
    [[nodiscard]] LimitOrder removeLimitOrder(OrderID orderId);

    void logTrade(
        OrderDirection direction,
        OrderID aggressorId,
        const LimitOrder& resting,
        Quantity volume,
        Price execPrice,
        Timestamp timestamp,
        MatchResult& result);

    // Both consume result.remaining while the best opposing level is priced
    // within the given bound.
    virtual void processAgainstTheBuyQueue(
        const BasicOrder& order, Price minPrice, MatchResult& result, Timestamp timestamp) = 0;
    virtual void processAgainstTheSellQueue(
        const BasicOrder& order, Price maxPrice, MatchResult& result, Timestamp timestamp) = 0;

    struct OrderLocation
    {
        OrderDirection direction;
        Price price;
    };

    std::string m_symbol;
    BookSignals m_signals;
    mktsim::book::OrderContainer m_buyQueue;
    mktsim::book::OrderContainer m_sellQueue;
    std::map<OrderID, OrderLocation> m_orderIdMap;

private:
    void validate(const BasicOrder& order) const;
};

//-------------------------------------------------------------------------
