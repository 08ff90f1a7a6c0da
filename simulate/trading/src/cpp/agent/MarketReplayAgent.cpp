/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "MarketReplayAgent.hpp"

#include "Simulation.hpp"

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace mktsim::agent
{

//-------------------------------------------------------------------------

MarketReplayAgent::MarketReplayAgent(const Simulation* simulation, const std::string& name) noexcept
    : Agent{simulation, name}
{}

//-------------------------------------------------------------------------

void MarketReplayAgent::addRecord(const ReplayRecord& record)
{
    if (!m_records.contains(record.time)) {
        m_wakeupTimes.push(record.time);
    }
    m_records.emplace(record.time, record);
}

//-------------------------------------------------------------------------

void MarketReplayAgent::configure(const pugi::xml_node& node)
{
    Agent::configure(node);

    pugi::xml_attribute attr;
    static constexpr auto ctx = std::source_location::current().function_name();

    if (attr = node.attribute("symbol"); attr.empty()) {
        throw std::invalid_argument{fmt::format("{}: missing required attribute 'symbol'", ctx)};
    }
    m_symbol = attr.as_string();

    for (pugi::xml_node recordNode : node.children("Record")) {
        const auto direction =
            magic_enum::enum_cast<OrderDirection>(recordNode.attribute("direction").as_string());
        if (!direction.has_value()) {
            throw std::invalid_argument{fmt::format(
                "{}: record direction must be BUY or SELL, got '{}'",
                ctx, recordNode.attribute("direction").as_string())};
        }
        const std::string_view type = recordNode.attribute("type").as_string("R");
        addRecord(ReplayRecord{
            .time = recordNode.attribute("time").as_ullong(),
            .orderId = recordNode.attribute("orderId").as_uint(),
            .price = recordNode.attribute("price").as_llong(),
            .size = recordNode.attribute("size").as_llong(),
            .direction = *direction,
            .type = type.empty() ? 'R' : type.front()
        });
    }
}

//-------------------------------------------------------------------------

Actions MarketReplayAgent::receiveMessage(Message::Ptr msg)
{
    if (msg->type == "EVENT_SIMULATION_START") {
        return handleSimulationStart();
    }
    else if (msg->type == "WAKEUP") {
        return handleWakeup(msg->arrival);
    }

    const auto payload = std::dynamic_pointer_cast<ExecutionReportPayload>(msg->payload);
    if (payload == nullptr) return {};

    switch (payload->kind) {
        case NotificationKind::EXECUTED:
            handleExecution(msg->arrival, *payload);
            break;
        case NotificationKind::ACKED:
            handleAcceptance(*payload);
            break;
        case NotificationKind::CANCELLED:
        case NotificationKind::REJECTED:
            handleRemoval(*payload);
            break;
    }
    return {};
}

//-------------------------------------------------------------------------

Actions MarketReplayAgent::handleSimulationStart()
{
    const Timestamp now = simulation()->currentTimestamp();

    // Records before the start can never be delivered.
    while (!m_wakeupTimes.empty() && m_wakeupTimes.top() < now) {
        simulation()->logDebug(
            "{} | {} : DROPPING {} RECORD(S) AT {}",
            now, name(), m_records.count(m_wakeupTimes.top()), m_wakeupTimes.top());
        m_records.erase(m_wakeupTimes.top());
        m_wakeupTimes.pop();
    }

    if (m_wakeupTimes.empty()) return {};

    const Timestamp first = m_wakeupTimes.top();
    m_wakeupTimes.pop();
    return {ScheduleWakeup{.time = first}};
}

//-------------------------------------------------------------------------

Actions MarketReplayAgent::handleWakeup(Timestamp now)
{
    Actions actions;

    if (!m_wakeupTimes.empty()) {
        actions.push_back(ScheduleWakeup{.time = m_wakeupTimes.top()});
        m_wakeupTimes.pop();
    }
    else {
        simulation()->logDebug("{} | {} : SUBMITTED ALL ORDERS", now, name());
    }

    auto [begin, end] = m_records.equal_range(now);
    for (auto it = begin; it != end; ++it) {
        if (auto action = replay(it->second, now)) {
            actions.push_back(std::move(*action));
        }
    }

    return actions;
}

//-------------------------------------------------------------------------

void MarketReplayAgent::handleExecution(Timestamp now, const ExecutionReportPayload& payload)
{
    if (!payload.fillPrice.has_value() || !payload.quantity.has_value()) return;

    m_executedTrades[now] = ExecutedTrade{
        .fillPrice = *payload.fillPrice,
        .quantity = *payload.quantity
    };
    m_lastTradePrice = payload.fillPrice;

    if (!payload.orderId.has_value()) return;
    auto it = m_openOrders.find(*payload.orderId);
    if (it == m_openOrders.end()) return;

    const Quantity remaining = it->second.quantity() - *payload.quantity;
    if (remaining > 0) {
        it->second = it->second.withQuantity(remaining);
    } else {
        m_openOrders.erase(it);
    }
}

//-------------------------------------------------------------------------

void MarketReplayAgent::handleAcceptance(const ExecutionReportPayload& payload)
{
    if (!payload.order.has_value()) return;
    if (const auto* order = std::get_if<LimitOrder>(&*payload.order)) {
        m_openOrders.insert_or_assign(order->id(), *order);
    }
}

//-------------------------------------------------------------------------

void MarketReplayAgent::handleRemoval(const ExecutionReportPayload& payload)
{
    if (payload.orderId.has_value()) {
        m_openOrders.erase(*payload.orderId);
    }
}

//-------------------------------------------------------------------------

std::optional<OutgoingAction> MarketReplayAgent::replay(const ReplayRecord& record, Timestamp now)
{
    auto it = m_openOrders.find(record.orderId);

    if (it == m_openOrders.end() && record.size > 0 && record.type == 'R') {
        LimitOrder order{
            record.direction, id(), m_symbol, now, record.size, record.price, record.orderId};
        m_openOrders.insert_or_assign(record.orderId, order);
        return PlaceOrder{.order = std::move(order)};
    }
    else if (it != m_openOrders.end() && record.size == 0) {
        return CancelOrder{.symbol = m_symbol, .orderId = record.orderId};
    }
    else if (it != m_openOrders.end() && record.size > 0) {
        it->second = LimitOrder{
            it->second.direction(), id(), m_symbol, now, record.size, record.price, record.orderId};
        return ModifyOrder{
            .symbol = m_symbol,
            .orderId = record.orderId,
            .quantity = record.size,
            .limitPrice = record.price
        };
    }

    simulation()->logDebug(
        "{} | {} : SKIPPING RECORD #{} TYPE '{}' SIZE {}",
        now, name(), record.orderId, record.type, record.size);
    return {};
}

//-------------------------------------------------------------------------

}  // namespace mktsim::agent

//-------------------------------------------------------------------------
