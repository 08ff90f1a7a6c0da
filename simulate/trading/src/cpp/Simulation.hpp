/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Agent.hpp"
#include "BookEventLogger.hpp"
#include "Exchange.hpp"
#include "IConfigurable.hpp"
#include "LocalAgentManager.hpp"
#include "OrderIdAllocator.hpp"
#include "common.hpp"
#include "mktsim/message/Message.hpp"
#include "mktsim/message/MessageQueue.hpp"
#include "mktsim/oracle/Oracle.hpp"
#include "mktsim/simulation/SimulationSignals.hpp"
#include "mktsim/simulation/SimulationState.hpp"

#include <fmt/core.h>

#include <span>

//-------------------------------------------------------------------------

/**
 * Discrete-event kernel. Owns the message queue, the exchange and the agents,
 * and is the only component that advances simulated time. Messages are
 * delivered one at a time in (arrival, sequence) order; every action an agent
 * returns is carried out before the next delivery.
 */
class Simulation : public IConfigurable
{
public:
    Simulation();
    Simulation(Timestamp start, Timestamp end);

    void dispatchMessage(
        Timestamp occurrence,
        Timestamp delay,
        AgentId source,
        AgentId target,
        const std::string& type,
        MessagePayload::Ptr payload = MessagePayload::create<EmptyPayload>());

    // Throws InvalidScheduleError, leaving the queue untouched, if the message
    // is due before the current time.
    void queueMessage(Message::Ptr msg);

    AgentId addAgent(std::unique_ptr<Agent> agent);
    void setTime(Timestamp start, Timestamp end);
    void setOracle(std::unique_ptr<mktsim::oracle::Oracle> oracle) noexcept { m_oracle = std::move(oracle); }
    void setSeed(uint64_t seed) noexcept { m_rng.seed(seed); }

    // Runs until the queue is exhausted or the next message is due after the
    // end time.
    void simulate();
    // Delivers at most one message; returns whether one was delivered.
    bool step();

    [[nodiscard]] std::span<const std::unique_ptr<Agent>> agents() const noexcept;
    [[nodiscard]] Agent* agent(AgentId id) const noexcept { return m_localAgentManager->agent(id); }
    [[nodiscard]] Agent* findAgent(std::string_view name) const noexcept;
    [[nodiscard]] Timestamp currentTimestamp() const noexcept { return m_time.current; }
    [[nodiscard]] Timestamp startTimestamp() const noexcept { return m_time.start; }
    [[nodiscard]] Timestamp endTimestamp() const noexcept { return m_time.end; }
    [[nodiscard]] mktsim::simulation::SimulationState state() const noexcept { return m_state; }
    [[nodiscard]] Exchange& exchange() noexcept { return *m_exchange; }
    [[nodiscard]] const Exchange& exchange() const noexcept { return *m_exchange; }
    [[nodiscard]] const mktsim::oracle::Oracle* oracle() const noexcept { return m_oracle.get(); }
    [[nodiscard]] const MessageQueue& messageQueue() const noexcept { return m_messageQueue; }
    [[nodiscard]] const OrderIdAllocator& orderIdAllocator() const noexcept { return m_orderIdAllocator; }
    [[nodiscard]] const BookEventLogger* bookEventLogger() const noexcept { return m_bookEventLogger.get(); }
    [[nodiscard]] mktsim::simulation::SimulationSignals& signals() const noexcept { return m_signals; }
    [[nodiscard]] std::mt19937& rng() const noexcept { return m_rng; }

    virtual void configure(const pugi::xml_node& node) override;

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const noexcept
    {
        if (m_debug) {
            fmt::print("{}\n", fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

    void setDebug(bool flag) noexcept { m_debug = flag; }
    [[nodiscard]] bool debug() const noexcept { return m_debug; }

    [[nodiscard]] static std::unique_ptr<Simulation> fromXML(pugi::xml_node node);

private:
    void configureLogging(pugi::xml_node node);
    void configureExchange(pugi::xml_node node);
    void configureOracle(pugi::xml_node node);
    void configureAgents(pugi::xml_node node);

    void deliverMessage(Message::Ptr msg);
    void processActions(AgentId agentId, Actions& actions);
    void processAction(AgentId agentId, PlaceOrder& action);
    void processAction(AgentId agentId, const ModifyOrder& action);
    void processAction(AgentId agentId, const CancelOrder& action);
    void processAction(AgentId agentId, const ScheduleWakeup& action);
    void start();
    void stop();

    void updateTime(Timestamp newTime)
    {
        if (newTime == m_time.current) [[unlikely]] return;
        Timestamp oldTime = std::exchange(m_time.current, newTime);
        m_signals.time({.begin = oldTime + 1, .end = newTime});
    }

    MessageQueue m_messageQueue;
    mktsim::simulation::SimulationState m_state{mktsim::simulation::SimulationState::INACTIVE};
    struct { Timestamp start, end, current; } m_time{};
    mutable mktsim::simulation::SimulationSignals m_signals;
    std::unique_ptr<BookEventLogger> m_bookEventLogger;
    std::unique_ptr<Exchange> m_exchange;
    std::unique_ptr<mktsim::oracle::Oracle> m_oracle;
    std::unique_ptr<LocalAgentManager> m_localAgentManager;
    OrderIdAllocator m_orderIdAllocator;
    mutable std::mt19937 m_rng;
    bool m_debug = false;
};

//-------------------------------------------------------------------------
