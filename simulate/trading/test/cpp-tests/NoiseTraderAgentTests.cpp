/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "NoiseTraderAgent.hpp"
#include "Simulation.hpp"
#include "mktsim/oracle/ExternalSeriesOracle.hpp"
#include "util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <numeric>

//-------------------------------------------------------------------------

using namespace testing;
using mktsim::agent::NoiseTraderAgent;

//-------------------------------------------------------------------------

namespace
{

const auto kTestDataPath = fs::path{__FILE__}.parent_path() / "data";

struct RunSummary
{
    std::vector<Quantity> positions;
    std::vector<uint32_t> ordersPlaced;
    std::vector<std::pair<Price, Quantity>> bids;
    std::vector<std::pair<Price, Quantity>> asks;

    bool operator==(const RunSummary&) const = default;
};

std::unique_ptr<Simulation> loadNoiseSimulation()
{
    const auto nodes = mktsim::util::parseSimulationFile(kTestDataPath / "noise.xml");
    return Simulation::fromXML(nodes.simulation);
}

RunSummary runNoiseSimulation()
{
    auto simulation = loadNoiseSimulation();
    simulation->simulate();

    RunSummary summary;
    for (const auto& agent : simulation->agents()) {
        const auto& trader = dynamic_cast<const NoiseTraderAgent&>(*agent);
        summary.positions.push_back(trader.position());
        summary.ordersPlaced.push_back(trader.ordersPlaced());
    }
    const Book& book = simulation->exchange().book("JPM");
    for (const auto& level : book.levels(OrderDirection::BUY, 10)) {
        summary.bids.emplace_back(level.price, level.volume);
    }
    for (const auto& level : book.levels(OrderDirection::SELL, 10)) {
        summary.asks.emplace_back(level.price, level.volume);
    }
    return summary;
}

}  // namespace

//-------------------------------------------------------------------------

TEST(NoiseTraderAgentTest, InstancesAreNamedByIndex)
{
    const auto simulation = loadNoiseSimulation();

    ASSERT_EQ(simulation->agents().size(), 3);
    for (AgentId id = 0; id < 3; ++id) {
        const Agent* agent = simulation->agent(id);
        ASSERT_NE(agent, nullptr);
        EXPECT_EQ(agent->name(), fmt::format("noise_{}", id));
        EXPECT_EQ(agent->id(), id);
        EXPECT_EQ(simulation->findAgent(agent->name()), agent);
    }
    const auto& trader = dynamic_cast<const NoiseTraderAgent&>(*simulation->agent(0));
    EXPECT_EQ(trader.symbol(), "JPM");
    EXPECT_EQ(trader.wakeInterval(), Timestamp{250});
}

//-------------------------------------------------------------------------

TEST(NoiseTraderAgentTest, QuotesOnEveryWakeup)
{
    const RunSummary summary = runNoiseSimulation();

    EXPECT_THAT(summary.ordersPlaced, Each(40u));
    EXPECT_EQ(std::accumulate(summary.positions.begin(), summary.positions.end(), Quantity{}), 0);
    if (!summary.bids.empty() && !summary.asks.empty()) {
        EXPECT_LT(summary.bids.front().first, summary.asks.front().first);
    }
}

//-------------------------------------------------------------------------

TEST(NoiseTraderAgentTest, SeededRunsAreReproducible)
{
    EXPECT_EQ(runNoiseSimulation(), runNoiseSimulation());
}

//-------------------------------------------------------------------------

TEST(NoiseTraderAgentTest, InvalidConfigurationThrows)
{
    const auto configureFrom = [](const char* xml, bool withOracle) {
        pugi::xml_document doc;
        doc.load_string(xml);
        Simulation simulation;
        if (withOracle) {
            auto oracle = std::make_unique<mktsim::oracle::ExternalSeriesOracle>();
            oracle->addSeries("JPM", {{0, 100.0}});
            simulation.setOracle(std::move(oracle));
        }
        NoiseTraderAgent agent{&simulation};
        agent.configure(doc.first_child());
    };

    EXPECT_NO_THROW(configureFrom(R"(<NoiseTraderAgent name="n" symbol="JPM" wakeInterval="5"/>)", true));
    EXPECT_THROW(
        configureFrom(R"(<NoiseTraderAgent name="n" symbol="JPM" wakeInterval="5"/>)", false),
        std::runtime_error);
    EXPECT_THROW(
        configureFrom(R"(<NoiseTraderAgent name="n" symbol="JPM" wakeInterval="0"/>)", true),
        std::invalid_argument);
    EXPECT_THROW(
        configureFrom(R"(<NoiseTraderAgent name="n" symbol="JPM" wakeInterval="5" minQuantity="4" maxQuantity="2"/>)", true),
        std::invalid_argument);
    EXPECT_THROW(
        configureFrom(R"(<NoiseTraderAgent name="n" symbol="JPM" wakeInterval="5" spread="-1"/>)", true),
        std::invalid_argument);
}

//-------------------------------------------------------------------------
