/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Simulation.hpp"

#include "SimulationException.hpp"
#include "mktsim/message/ExecutionReportPayload.hpp"
#include "mktsim/oracle/ExternalSeriesOracle.hpp"

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

using mktsim::simulation::SimulationState;

//-------------------------------------------------------------------------

Simulation::Simulation()
    : Simulation{0, TIMESTAMP_MAX}
{}

//-------------------------------------------------------------------------

Simulation::Simulation(Timestamp start, Timestamp end)
    : m_exchange{std::make_unique<Exchange>(this)},
      m_localAgentManager{std::make_unique<LocalAgentManager>(this)}
{
    setTime(start, end);
}

//-------------------------------------------------------------------------

void Simulation::dispatchMessage(
    Timestamp occurrence,
    Timestamp delay,
    AgentId source,
    AgentId target,
    const std::string& type,
    MessagePayload::Ptr payload)
{
    queueMessage(
        Message::create(occurrence, occurrence + delay, source, target, type, payload));
}

//-------------------------------------------------------------------------

void Simulation::queueMessage(Message::Ptr msg)
{
    if (msg->arrival < m_time.current) {
        throw InvalidScheduleError{fmt::format(
            "{}: '{}' for agent #{} due at {} but current time is {}",
            std::source_location::current().function_name(),
            msg->type,
            msg->target,
            msg->arrival,
            m_time.current)};
    }
    m_messageQueue.push(msg);
}

//-------------------------------------------------------------------------

AgentId Simulation::addAgent(std::unique_ptr<Agent> agent)
{
    if (m_state != SimulationState::INACTIVE) {
        throw std::logic_error{fmt::format(
            "{}: agents can only be added before the simulation starts (state {})",
            std::source_location::current().function_name(),
            mktsim::simulation::SimulationState2StrView(m_state))};
    }
    return m_localAgentManager->addAgent(std::move(agent));
}

//-------------------------------------------------------------------------

void Simulation::setTime(Timestamp start, Timestamp end)
{
    if (m_state != SimulationState::INACTIVE) {
        throw std::logic_error{fmt::format(
            "{}: time bounds are fixed once the simulation starts (state {})",
            std::source_location::current().function_name(),
            mktsim::simulation::SimulationState2StrView(m_state))};
    }
    if (end < start) {
        throw std::invalid_argument{fmt::format(
            "{}: end time {} precedes start time {}",
            std::source_location::current().function_name(), end, start)};
    }
    m_time = {.start = start, .end = end, .current = start};
}

//-------------------------------------------------------------------------

void Simulation::simulate()
{
    if (m_state == SimulationState::STOPPED) return;

    while (step()) {}

    logDebug("{} | SIMULATION STOPPED, {} MESSAGE(S) LEFT", m_time.current, m_messageQueue.size());
}

//-------------------------------------------------------------------------

bool Simulation::step()
{
    if (m_state == SimulationState::STOPPED) return false;
    else if (m_state == SimulationState::INACTIVE) start();

    const auto nextTime = m_messageQueue.peekNextTime();
    if (!nextTime.has_value() || *nextTime > m_time.end) {
        stop();
        return false;
    }

    Message::Ptr msg = m_messageQueue.popNext();
    if (msg->arrival < m_time.current) {
        throw SimulationException{fmt::format(
            "{}: message '{}' due at {} surfaced after time reached {}",
            std::source_location::current().function_name(),
            msg->type,
            msg->arrival,
            m_time.current)};
    }

    updateTime(msg->arrival);
    deliverMessage(msg);
    return true;
}

//-------------------------------------------------------------------------

std::span<const std::unique_ptr<Agent>> Simulation::agents() const noexcept
{
    return m_localAgentManager->agents();
}

//-------------------------------------------------------------------------

Agent* Simulation::findAgent(std::string_view name) const noexcept
{
    return m_localAgentManager->findAgent(name);
}

//-------------------------------------------------------------------------

void Simulation::configure(const pugi::xml_node& node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_attribute attr;

    if (attr = node.attribute("start"); attr.empty()) {
        throw std::invalid_argument(fmt::format("{}: missing required attribute 'start'", ctx));
    }
    const Timestamp start = attr.as_ullong();

    Timestamp end{};
    if (attr = node.attribute("end"); !attr.empty()) {
        end = attr.as_ullong();
    }
    else if (attr = node.attribute("duration"); !attr.empty()) {
        end = start + attr.as_ullong();
    }
    else {
        throw std::invalid_argument(fmt::format(
            "{}: one of the attributes 'end' or 'duration' is required", ctx));
    }
    setTime(start, end);

    if (attr = node.attribute("seed"); !attr.empty()) {
        m_rng = std::mt19937{static_cast<std::mt19937::result_type>(attr.as_ullong())};
    } else {
        m_rng = std::mt19937{std::random_device{}()};
    }

    if (node.attribute("debug").as_bool()) {
        m_debug = true;
    }

    // NOTE: Ordering important!
    configureLogging(node);
    configureExchange(node);
    configureOracle(node);
    configureAgents(node);
}

//-------------------------------------------------------------------------

std::unique_ptr<Simulation> Simulation::fromXML(pugi::xml_node node)
{
    auto simulation = std::make_unique<Simulation>();
    simulation->configure(node);
    return simulation;
}

//-------------------------------------------------------------------------

void Simulation::configureLogging(pugi::xml_node node)
{
    pugi::xml_node loggingNode = node.child("Logging");
    if (!loggingNode) return;

    if (pugi::xml_attribute attr = loggingNode.attribute("events"); !attr.empty()) {
        m_bookEventLogger = std::make_unique<BookEventLogger>(attr.as_string(), this);
        m_exchange->setBookEventLogger(m_bookEventLogger.get());
    }
}

//-------------------------------------------------------------------------

void Simulation::configureExchange(pugi::xml_node node)
{
    pugi::xml_node exchangeNode;

    if (exchangeNode = node.child("Exchange"); !exchangeNode) {
        throw std::invalid_argument{fmt::format(
            "{}: missing required child 'Exchange'",
            std::source_location::current().function_name())};
    }

    m_exchange->configure(exchangeNode);
}

//-------------------------------------------------------------------------

void Simulation::configureOracle(pugi::xml_node node)
{
    if (pugi::xml_node oracleNode = node.child("Oracle")) {
        m_oracle = mktsim::oracle::ExternalSeriesOracle::fromXML(oracleNode);
    }
}

//-------------------------------------------------------------------------

void Simulation::configureAgents(pugi::xml_node node)
{
    pugi::xml_node agentsNode;

    if (agentsNode = node.child("Agents"); !agentsNode) {
        throw std::invalid_argument{fmt::format(
            "{}: missing required child 'Agents'",
            std::source_location::current().function_name())};
    }

    m_localAgentManager->createAgentsInstanced(agentsNode);
}

//-------------------------------------------------------------------------

void Simulation::deliverMessage(Message::Ptr msg)
{
    Agent* target = m_localAgentManager->agent(msg->target);
    if (target == nullptr) {
        throw SimulationException{fmt::format(
            "{}: unknown message target #{}",
            std::source_location::current().function_name(),
            msg->target)};
    }

    logDebug("{}", *msg);

    Actions actions = target->receiveMessage(msg);
    processActions(target->id(), actions);
}

//-------------------------------------------------------------------------

void Simulation::processActions(AgentId agentId, Actions& actions)
{
    for (OutgoingAction& action : actions) {
        std::visit([&](auto& a) { processAction(agentId, a); }, action);
    }
}

//-------------------------------------------------------------------------

void Simulation::processAction(AgentId agentId, PlaceOrder& action)
{
    m_orderIdAllocator.assign(basicOrder(action.order));
    m_exchange->placeOrder(agentId, action, m_time.current);
}

//-------------------------------------------------------------------------

void Simulation::processAction(AgentId agentId, const ModifyOrder& action)
{
    m_exchange->modifyOrder(agentId, action, m_time.current);
}

//-------------------------------------------------------------------------

void Simulation::processAction(AgentId agentId, const CancelOrder& action)
{
    m_exchange->cancelOrder(agentId, action, m_time.current);
}

//-------------------------------------------------------------------------

void Simulation::processAction(AgentId agentId, const ScheduleWakeup& action)
{
    try {
        queueMessage(Message::create(
            m_time.current,
            action.time,
            agentId,
            agentId,
            "WAKEUP",
            MessagePayload::create<WakeupPayload>(action.tag)));
    }
    catch (const InvalidScheduleError& e) {
        logDebug("{} | AGENT #{} : {}", m_time.current, agentId, e.what());
        auto payload = MessagePayload::create<ExecutionReportPayload>(NotificationKind::REJECTED);
        payload->reason = OrderErrorCode::INVALID_SCHEDULE;
        dispatchMessage(
            m_time.current,
            0,
            SIMULATION_AGENT_ID,
            agentId,
            std::string{NotificationKind2MessageType(NotificationKind::REJECTED)},
            payload);
    }
}

//-------------------------------------------------------------------------

void Simulation::start()
{
    m_state = SimulationState::STARTED;

    for (const auto& agent : agents()) {
        dispatchMessage(
            m_time.start, 0, SIMULATION_AGENT_ID, agent->id(), "EVENT_SIMULATION_START");
    }
    for (const auto& agent : agents()) {
        dispatchMessage(
            m_time.start,
            m_time.end - m_time.start,
            SIMULATION_AGENT_ID,
            agent->id(),
            "EVENT_SIMULATION_END");
    }

    m_signals.start();
}

//-------------------------------------------------------------------------

void Simulation::stop()
{
    m_state = SimulationState::STOPPED;
    m_signals.stop();
}

//-------------------------------------------------------------------------
