/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LocalAgentManager.hpp"

#include "MarketReplayAgent.hpp"
#include "NoiseTraderAgent.hpp"
#include "Simulation.hpp"

#include <set>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

LocalAgentManager::LocalAgentManager(Simulation* simulation) noexcept
    : m_simulation{simulation}
{}

//-------------------------------------------------------------------------

Agent* LocalAgentManager::agent(AgentId id) const noexcept
{
    if (id < 0 || static_cast<size_t>(id) >= m_agents.size()) return nullptr;
    return m_agents[id].get();
}

//-------------------------------------------------------------------------

Agent* LocalAgentManager::findAgent(std::string_view name) const noexcept
{
    auto it = m_nameToId.find(name);
    return it != m_nameToId.end() ? m_agents[it->second].get() : nullptr;
}

//-------------------------------------------------------------------------

AgentId LocalAgentManager::addAgent(std::unique_ptr<Agent> agent)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (agent == nullptr) {
        throw std::invalid_argument{fmt::format("{}: agent is null", ctx)};
    }
    if (agent->name().empty()) {
        throw std::invalid_argument{fmt::format("{}: agent has no name", ctx)};
    }
    if (m_nameToId.contains(agent->name())) {
        throw std::invalid_argument{fmt::format(
            "{}: agent name '{}' already in use", ctx, agent->name())};
    }

    const auto id = static_cast<AgentId>(m_agents.size());
    agent->m_id = id;
    m_nameToId.emplace(agent->name(), id);
    m_agents.push_back(std::move(agent));
    return id;
}

//-------------------------------------------------------------------------

void LocalAgentManager::createAgentsInstanced(pugi::xml_node node)
{
    std::set<std::string, std::less<>> baseNames;

    for (pugi::xml_node child : node.children()) {
        std::string_view name = child.name();

        const char* agentBaseName = child.attribute("name").as_string();
        if (baseNames.contains(agentBaseName)) {
            throw std::invalid_argument{fmt::format(
                "{}: {} 'name' attribute '{}' already in use",
                std::source_location::current().function_name(), name, agentBaseName)};
        }
        baseNames.insert(agentBaseName);

        if (name == "MarketReplayAgent") {
            createAgentInstanced<mktsim::agent::MarketReplayAgent>(child);
        }
        else if (name == "NoiseTraderAgent") {
            createAgentInstanced<mktsim::agent::NoiseTraderAgent>(child);
        }
        else {
            throw std::invalid_argument{fmt::format(
                "{}: unknown agent type '{}'",
                std::source_location::current().function_name(), name)};
        }
    }

    m_simulation->signals().agentsCreated();
}

//-------------------------------------------------------------------------

template<std::derived_from<Agent> T>
void LocalAgentManager::createAgentInstanced(pugi::xml_node node)
{
    const uint32_t instanceCount = node.attribute("instanceCount").as_uint(1);
    const std::string baseName = node.attribute("name").as_string();

    for (uint32_t instanceId = 0; instanceId < instanceCount; ++instanceId) {
        if (instanceCount > 1) {
            node.attribute("name").set_value(fmt::format("{}_{}", baseName, instanceId).c_str());
        }
        addAgent([this, node] {
            auto agent = std::make_unique<T>(m_simulation);
            agent->configure(node);
            return agent;
        }());
    }

    node.attribute("name").set_value(baseName.c_str());
}

//-------------------------------------------------------------------------
