/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Agent.hpp"

#include <fmt/format.h>

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

void Agent::configure(const pugi::xml_node& node)
{
    if (auto attr = node.attribute("name"); !attr.empty()) {
        setName(attr.as_string());
    }
    if (name().empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: agent '{}' needs a 'name' attribute",
            std::source_location::current().function_name(),
            node.name())};
    }
    m_type = node.name();
}

//-------------------------------------------------------------------------

Agent::Agent(const Simulation* simulation, const std::string& name) noexcept
    : IMessageable{simulation, name}
{}

//-------------------------------------------------------------------------
