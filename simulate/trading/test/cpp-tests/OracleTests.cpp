/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "mktsim/oracle/ExternalSeriesOracle.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <numeric>

//-------------------------------------------------------------------------

using namespace testing;
using namespace mktsim::oracle;

//-------------------------------------------------------------------------

namespace
{

class ExternalSeriesOracleTest : public testing::Test
{
protected:
    void SetUp() override
    {
        oracle.addSeries("JPM", {{100, 200.0}, {0, 100.0}, {200, 200.0}});
    }

    ExternalSeriesOracle oracle;
};

}  // namespace

//-------------------------------------------------------------------------

TEST_F(ExternalSeriesOracleTest, PriceAtInterpolatesBetweenPoints)
{
    EXPECT_EQ(oracle.priceAt("JPM", 0), 100);
    EXPECT_EQ(oracle.priceAt("JPM", 25), 125);
    EXPECT_EQ(oracle.priceAt("JPM", 50), 150);
    EXPECT_EQ(oracle.priceAt("JPM", 100), 200);
    EXPECT_EQ(oracle.priceAt("JPM", 150), 200);
}

//-------------------------------------------------------------------------

TEST_F(ExternalSeriesOracleTest, PriceAtClampsOutsideTheSeries)
{
    ExternalSeriesOracle shifted;
    shifted.addSeries("MSFT", {{1000, 310.0}, {2000, 320.0}});

    EXPECT_EQ(shifted.priceAt("MSFT", 0), 310);
    EXPECT_EQ(shifted.priceAt("MSFT", 5000), 320);
    EXPECT_EQ(oracle.priceAt("JPM", 10'000), 200);
}

//-------------------------------------------------------------------------

TEST_F(ExternalSeriesOracleTest, UnknownSymbolThrows)
{
    EXPECT_FALSE(oracle.contains("XYZ"));
    EXPECT_THROW(static_cast<void>(oracle.priceAt("XYZ", 0)), std::out_of_range);
    EXPECT_THROW(oracle.addSeries("XYZ", {}), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST_F(ExternalSeriesOracleTest, ObservationsAreNoisyButReproducible)
{
    std::mt19937 rng{1234};
    EXPECT_EQ(oracle.observe("JPM", 50, 0.0, rng), 150);

    std::mt19937 rng1{1234}, rng2{1234};
    std::vector<Price> first, second;
    for (int i = 0; i < 200; ++i) {
        first.push_back(oracle.observe("JPM", 50, 25.0, rng1));
        second.push_back(oracle.observe("JPM", 50, 25.0, rng2));
    }
    EXPECT_EQ(first, second);

    const double mean = std::accumulate(first.begin(), first.end(), 0.0) / first.size();
    EXPECT_NEAR(mean, 150.0, 2.0);
    EXPECT_THAT(first, Contains(Ne(150)));
}

//-------------------------------------------------------------------------

TEST(ExternalSeriesOracleConfigTest, FromXML)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(R"(
        <Oracle>
            <Series symbol="JPM">
                <Point time="0" price="100.0"/>
                <Point time="10" price="110.0"/>
            </Series>
        </Oracle>)"));

    const auto oracle = ExternalSeriesOracle::fromXML(doc.child("Oracle"));

    ASSERT_NE(oracle, nullptr);
    EXPECT_TRUE(oracle->contains("JPM"));
    EXPECT_EQ(oracle->priceAt("JPM", 5), 105);
}

//-------------------------------------------------------------------------

TEST(ExternalSeriesOracleConfigTest, FromXMLRejectsIncompleteSeries)
{
    const auto fromString = [](const char* xml) {
        pugi::xml_document doc;
        doc.load_string(xml);
        return ExternalSeriesOracle::fromXML(doc.child("Oracle"));
    };

    EXPECT_THROW(fromString(R"(<Oracle><Series><Point time="0" price="1"/></Series></Oracle>)"), std::invalid_argument);
    EXPECT_THROW(fromString(R"(<Oracle><Series symbol="JPM"><Point time="0"/></Series></Oracle>)"), std::invalid_argument);
    EXPECT_THROW(fromString(R"(<Oracle><Series symbol="JPM"/></Oracle>)"), std::invalid_argument);
}

//-------------------------------------------------------------------------
