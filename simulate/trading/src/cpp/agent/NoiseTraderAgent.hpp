/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Agent.hpp"
#include "Order.hpp"

//-------------------------------------------------------------------------

namespace mktsim::agent
{

//-------------------------------------------------------------------------

/**
 * Wakes every `wakeInterval`, takes a noisy oracle observation and quotes one
 * limit order of random side and size within `spread` of it: bids at or below
 * the observation, asks at or above.
 */
class NoiseTraderAgent : public Agent
{
public:
    explicit NoiseTraderAgent(const Simulation* simulation, const std::string& name = {}) noexcept;

    [[nodiscard]] const std::string& symbol() const noexcept { return m_symbol; }
    [[nodiscard]] Timestamp wakeInterval() const noexcept { return m_wakeInterval; }
    // Net executed quantity, buys positive.
    [[nodiscard]] Quantity position() const noexcept { return m_position; }
    [[nodiscard]] uint32_t ordersPlaced() const noexcept { return m_ordersPlaced; }

    virtual void configure(const pugi::xml_node& node) override;
    virtual Actions receiveMessage(Message::Ptr msg) override;

private:
    Actions handleSimulationStart(Timestamp now);
    Actions handleWakeup(Timestamp now);
    void handleExecution(Message::Ptr msg);

    std::string m_symbol;
    Timestamp m_wakeInterval;
    Quantity m_quantityMin;
    Quantity m_quantityMax;
    Price m_spread;
    double m_sigmaN;
    Quantity m_position{};
    uint32_t m_ordersPlaced{};
};

//-------------------------------------------------------------------------

}  // namespace mktsim::agent

//-------------------------------------------------------------------------
