/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "IConfigurable.hpp"
#include "IMessageable.hpp"
#include "Timestamp.hpp"

#include <string>

//-------------------------------------------------------------------------

/**
 * Participant of a simulation. Agents see the world only through delivered
 * messages and act only through the actions they return.
 */
class Agent : public IConfigurable, public IMessageable
{
public:
    virtual ~Agent() = default;

    virtual void configure(const pugi::xml_node& node) override;

    [[nodiscard]] const std::string& type() const noexcept { return m_type; }

protected:
    Agent(const Simulation* simulation, const std::string& name = {}) noexcept;

    std::string m_type;
};

//-------------------------------------------------------------------------
