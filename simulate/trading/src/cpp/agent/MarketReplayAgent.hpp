/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Agent.hpp"
#include "Order.hpp"
#include "mktsim/message/ExecutionReportPayload.hpp"

#include <map>
#include <queue>

//-------------------------------------------------------------------------

namespace mktsim::agent
{

//-------------------------------------------------------------------------

// One historical order event. Type 'R' marks a new order.
struct ReplayRecord
{
    Timestamp time;
    OrderID orderId;
    Price price;
    Quantity size;
    OrderDirection direction;
    char type{'R'};
};

struct ExecutedTrade
{
    Price fillPrice;
    Quantity quantity;
};

//-------------------------------------------------------------------------

/**
 * Replays recorded order flow into one book. Each distinct record time becomes
 * a wake-up; on waking, every record due at that time is turned into a place,
 * modify or cancel request in record order.
 */
class MarketReplayAgent : public Agent
{
public:
    explicit MarketReplayAgent(const Simulation* simulation, const std::string& name = {}) noexcept;

    [[nodiscard]] const std::string& symbol() const noexcept { return m_symbol; }
    [[nodiscard]] const std::multimap<Timestamp, ReplayRecord>& records() const noexcept { return m_records; }
    [[nodiscard]] const std::map<OrderID, LimitOrder>& openOrders() const noexcept { return m_openOrders; }
    [[nodiscard]] const std::map<Timestamp, ExecutedTrade>& executedTrades() const noexcept
    {
        return m_executedTrades;
    }
    [[nodiscard]] std::optional<Price> lastTradePrice() const noexcept { return m_lastTradePrice; }

    void setSymbol(const std::string& symbol) { m_symbol = symbol; }
    void addRecord(const ReplayRecord& record);

    virtual void configure(const pugi::xml_node& node) override;
    virtual Actions receiveMessage(Message::Ptr msg) override;

private:
    Actions handleSimulationStart();
    Actions handleWakeup(Timestamp now);
    void handleExecution(Timestamp now, const ExecutionReportPayload& payload);
    void handleAcceptance(const ExecutionReportPayload& payload);
    void handleRemoval(const ExecutionReportPayload& payload);

    [[nodiscard]] std::optional<OutgoingAction> replay(const ReplayRecord& record, Timestamp now);

    std::string m_symbol;
    std::multimap<Timestamp, ReplayRecord> m_records;
    std::priority_queue<Timestamp, std::vector<Timestamp>, std::greater<Timestamp>> m_wakeupTimes;
    std::map<OrderID, LimitOrder> m_openOrders;
    std::map<Timestamp, ExecutedTrade> m_executedTrades;
    std::optional<Price> m_lastTradePrice;
};

//-------------------------------------------------------------------------

}  // namespace mktsim::agent

//-------------------------------------------------------------------------
