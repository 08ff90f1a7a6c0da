/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "NoiseTraderAgent.hpp"

#include "Simulation.hpp"
#include "mktsim/message/ExecutionReportPayload.hpp"

#include <random>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace mktsim::agent
{

//-------------------------------------------------------------------------

NoiseTraderAgent::NoiseTraderAgent(const Simulation* simulation, const std::string& name) noexcept
    : Agent{simulation, name}
{}

//-------------------------------------------------------------------------

void NoiseTraderAgent::configure(const pugi::xml_node& node)
{
    Agent::configure(node);

    pugi::xml_attribute attr;
    static constexpr auto ctx = std::source_location::current().function_name();

    if (attr = node.attribute("symbol"); attr.empty()) {
        throw std::invalid_argument{fmt::format("{}: missing required attribute 'symbol'", ctx)};
    }
    m_symbol = attr.as_string();

    if (simulation()->oracle() == nullptr) {
        throw std::runtime_error{fmt::format("{}: oracle must be configured a priori", ctx)};
    }

    if (attr = node.attribute("wakeInterval"); attr.empty() || attr.as_ullong() == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: attribute 'wakeInterval' should have a value greater than 0", ctx)};
    }
    m_wakeInterval = attr.as_ullong();

    m_quantityMin = node.attribute("minQuantity").as_llong(1);
    m_quantityMax = node.attribute("maxQuantity").as_llong(10);
    if (m_quantityMin <= 0 || m_quantityMax < m_quantityMin) {
        throw std::invalid_argument{fmt::format(
            "{}: need 0 < minQuantity <= maxQuantity, got {} and {}", ctx, m_quantityMin, m_quantityMax)};
    }

    m_spread = node.attribute("spread").as_llong(10);
    if (m_spread < 0) {
        throw std::invalid_argument{fmt::format("{}: attribute 'spread' must not be negative", ctx)};
    }

    m_sigmaN = node.attribute("sigmaN").as_double(0.0);
    if (m_sigmaN < 0.0) {
        throw std::invalid_argument{fmt::format("{}: attribute 'sigmaN' must not be negative", ctx)};
    }
}

//-------------------------------------------------------------------------

Actions NoiseTraderAgent::receiveMessage(Message::Ptr msg)
{
    if (msg->type == "EVENT_SIMULATION_START") {
        return handleSimulationStart(msg->arrival);
    }
    else if (msg->type == "WAKEUP") {
        return handleWakeup(msg->arrival);
    }
    else if (msg->type == "ORDER_EXECUTED") {
        handleExecution(msg);
    }
    return {};
}

//-------------------------------------------------------------------------

Actions NoiseTraderAgent::handleSimulationStart(Timestamp now)
{
    return {ScheduleWakeup{.time = now + m_wakeInterval}};
}

//-------------------------------------------------------------------------

Actions NoiseTraderAgent::handleWakeup(Timestamp now)
{
    Actions actions{ScheduleWakeup{.time = now + m_wakeInterval}};

    auto& rng = simulation()->rng();
    const Price observed = simulation()->oracle()->observe(m_symbol, now, m_sigmaN, rng);

    const auto direction = std::bernoulli_distribution{0.5}(rng)
        ? OrderDirection::BUY
        : OrderDirection::SELL;
    const Quantity quantity =
        std::uniform_int_distribution<Quantity>{m_quantityMin, m_quantityMax}(rng);
    const Price offset = std::uniform_int_distribution<Price>{0, m_spread}(rng);
    const Price limitPrice = direction == OrderDirection::BUY ? observed - offset : observed + offset;

    if (limitPrice <= 0) {
        simulation()->logDebug(
            "{} | {} : OBSERVED {} FOR {}, NOT QUOTING", now, name(), observed, m_symbol);
        return actions;
    }

    actions.push_back(PlaceOrder{
        .order = LimitOrder{direction, id(), m_symbol, now, quantity, limitPrice}
    });
    ++m_ordersPlaced;

    return actions;
}

//-------------------------------------------------------------------------

void NoiseTraderAgent::handleExecution(Message::Ptr msg)
{
    const auto payload = std::dynamic_pointer_cast<ExecutionReportPayload>(msg->payload);
    if (payload == nullptr || !payload->order.has_value() || !payload->quantity.has_value()) return;

    const BasicOrder& order = basicOrder(*payload->order);
    m_position += order.isBuyOrder() ? *payload->quantity : -*payload->quantity;
}

//-------------------------------------------------------------------------

}  // namespace mktsim::agent

//-------------------------------------------------------------------------
