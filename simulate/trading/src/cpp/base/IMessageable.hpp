/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Action.hpp"
#include "mktsim/message/Message.hpp"

//-------------------------------------------------------------------------

class Simulation;

//-------------------------------------------------------------------------

class IMessageable
{
public:
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] AgentId id() const noexcept { return m_id; }
    [[nodiscard]] const Simulation* simulation() const noexcept { return m_simulation; }

    // Called once per delivered message; the kernel carries out the returned
    // actions in order.
    virtual Actions receiveMessage(Message::Ptr msg) = 0;

protected:
    IMessageable(const Simulation* simulation, const std::string& name) noexcept
        : m_simulation{simulation}, m_name{name}
    {}

    virtual ~IMessageable() = default;

    void setName(const std::string& name) noexcept { m_name = name; }

private:
    const Simulation* m_simulation;
    std::string m_name;
    AgentId m_id{SIMULATION_AGENT_ID};

    friend class LocalAgentManager;
};

//-------------------------------------------------------------------------
