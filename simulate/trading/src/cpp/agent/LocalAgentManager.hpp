/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Agent.hpp"

#include <map>
#include <span>
#include <string_view>

//-------------------------------------------------------------------------

class Simulation;

//-------------------------------------------------------------------------

class LocalAgentManager
{
public:
    explicit LocalAgentManager(Simulation* simulation) noexcept;

    [[nodiscard]] auto begin() const { return m_agents.begin(); }
    [[nodiscard]] auto end() const { return m_agents.end(); }

    [[nodiscard]] std::span<const std::unique_ptr<Agent>> agents() const noexcept { return m_agents; }
    [[nodiscard]] Agent* agent(AgentId id) const noexcept;
    [[nodiscard]] Agent* findAgent(std::string_view name) const noexcept;

    // Registers the agent under the next free id, which is returned.
    AgentId addAgent(std::unique_ptr<Agent> agent);

    void createAgentsInstanced(pugi::xml_node node);

private:
    template<std::derived_from<Agent> T>
    void createAgentInstanced(pugi::xml_node node);

    Simulation* m_simulation;
    // Invariant: m_agents[i]->id() == i.
    std::vector<std::unique_ptr<Agent>> m_agents;
    std::map<std::string, AgentId, std::less<>> m_nameToId;
};

//-------------------------------------------------------------------------
