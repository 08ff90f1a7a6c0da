/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "MarketReplayAgent.hpp"
#include "Simulation.hpp"
#include "util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace testing;
using mktsim::agent::MarketReplayAgent;
using mktsim::agent::ReplayRecord;

//-------------------------------------------------------------------------

namespace
{

const auto kTestDataPath = fs::path{__FILE__}.parent_path() / "data";

//-------------------------------------------------------------------------

class MarketReplayAgentTest : public testing::Test
{
protected:
    void SetUp() override
    {
        const auto nodes = mktsim::util::parseSimulationFile(kTestDataPath / "replay.xml");
        simulation = Simulation::fromXML(nodes.simulation);
        agent = dynamic_cast<MarketReplayAgent*>(simulation->findAgent("replay"));
        ASSERT_NE(agent, nullptr);
    }

    std::unique_ptr<Simulation> simulation;
    MarketReplayAgent* agent{};
};

}  // namespace

//-------------------------------------------------------------------------

TEST_F(MarketReplayAgentTest, ConfiguredFromXML)
{
    EXPECT_EQ(agent->symbol(), "JPM");
    EXPECT_EQ(agent->type(), "MarketReplayAgent");
    EXPECT_EQ(agent->records().size(), 8);
    EXPECT_EQ(simulation->startTimestamp(), Timestamp{50});
    EXPECT_EQ(simulation->endTimestamp(), Timestamp{1000});

    const auto [begin, end] = agent->records().equal_range(100);
    ASSERT_EQ(std::distance(begin, end), 2);
    EXPECT_EQ(begin->second.orderId, 1001);
    EXPECT_EQ(begin->second.direction, OrderDirection::SELL);
    EXPECT_EQ(std::next(begin)->second.orderId, 1002);
    EXPECT_EQ(agent->records().find(400)->second.type, 'D');
}

//-------------------------------------------------------------------------

TEST_F(MarketReplayAgentTest, ReplaysHistoricalOrderFlow)
{
    simulation->simulate();

    EXPECT_EQ(agent->records().size(), 7);
    EXPECT_FALSE(agent->records().contains(10));

    const Book& book = simulation->exchange().book("JPM");
    EXPECT_EQ(book.orderCount(), 1);
    EXPECT_EQ(book.bestBid(), Price{9995});
    EXPECT_EQ(book.bestAsk(), std::nullopt);
    ASSERT_TRUE(book.getOrder(1002).has_value());
    EXPECT_EQ(book.getOrder(1002)->quantity(), 7);

    EXPECT_THAT(agent->openOrders(), ElementsAre(Key(1002)));
    EXPECT_EQ(agent->openOrders().at(1002).quantity(), 7);
    EXPECT_EQ(agent->openOrders().at(1002).limitPrice(), 9995);

    ASSERT_THAT(agent->executedTrades(), ElementsAre(Key(200)));
    EXPECT_EQ(agent->executedTrades().at(200).fillPrice, 10000);
    EXPECT_EQ(agent->executedTrades().at(200).quantity, 4);
    EXPECT_EQ(agent->lastTradePrice(), Price{10000});
}

//-------------------------------------------------------------------------

TEST_F(MarketReplayAgentTest, StopsAtTheEndWithLaterRecordsPending)
{
    simulation->simulate();

    EXPECT_EQ(simulation->state(), mktsim::simulation::SimulationState::STOPPED);
    EXPECT_EQ(simulation->currentTimestamp(), Timestamp{1000});
    ASSERT_EQ(simulation->messageQueue().size(), 1);
    EXPECT_EQ(simulation->messageQueue().peekNextTime(), Timestamp{2000});
    EXPECT_EQ(simulation->messageQueue().top()->type, "WAKEUP");
    EXPECT_FALSE(simulation->exchange().book("JPM").contains(1005));
}

//-------------------------------------------------------------------------

TEST(MarketReplayAgentStandaloneTest, RecordsAddedInCode)
{
    Simulation simulation{0, 100};
    simulation.exchange().addBook("ABC");

    auto agent = std::make_unique<MarketReplayAgent>(&simulation, "replay");
    agent->setSymbol("ABC");
    agent->addRecord(ReplayRecord{
        .time = 30, .orderId = 5, .price = 50, .size = 2, .direction = OrderDirection::BUY});
    agent->addRecord(ReplayRecord{
        .time = 10, .orderId = 4, .price = 49, .size = 1, .direction = OrderDirection::SELL});
    agent->addRecord(ReplayRecord{
        .time = 20, .orderId = 4, .price = 49, .size = 0, .direction = OrderDirection::SELL});
    auto ptr = agent.get();
    simulation.addAgent(std::move(agent));

    simulation.simulate();

    const Book& book = simulation.exchange().book("ABC");
    EXPECT_EQ(book.orderCount(), 1);
    EXPECT_EQ(book.bestBid(), Price{50});
    EXPECT_TRUE(ptr->executedTrades().empty());
    EXPECT_THAT(ptr->openOrders(), ElementsAre(Key(5)));
}

//-------------------------------------------------------------------------

TEST(MarketReplayAgentStandaloneTest, InvalidConfigurationThrows)
{
    const auto configureFrom = [](const char* xml) {
        pugi::xml_document doc;
        doc.load_string(xml);
        Simulation simulation;
        MarketReplayAgent agent{&simulation};
        agent.configure(doc.first_child());
    };

    EXPECT_NO_THROW(configureFrom(R"(<MarketReplayAgent name="r" symbol="JPM"/>)"));
    EXPECT_THROW(configureFrom(R"(<MarketReplayAgent name="r"/>)"), std::invalid_argument);
    EXPECT_THROW(configureFrom(R"(<MarketReplayAgent symbol="JPM"/>)"), std::invalid_argument);
    EXPECT_THROW(
        configureFrom(R"(<MarketReplayAgent name="r" symbol="JPM">
            <Record time="1" orderId="1" price="1" size="1" direction="HOLD"/>
        </MarketReplayAgent>)"),
        std::invalid_argument);
}

//-------------------------------------------------------------------------
