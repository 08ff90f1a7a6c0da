/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

const auto kTestDataPath = fs::path{__FILE__}.parent_path() / "data";

}  // namespace

//-------------------------------------------------------------------------

TEST(UtilTest, Dollarize)
{
    EXPECT_EQ(mktsim::util::dollarize(12345), "$123.45");
    EXPECT_EQ(mktsim::util::dollarize(5), "$0.05");
    EXPECT_EQ(mktsim::util::dollarize(0), "$0.00");
    EXPECT_EQ(mktsim::util::dollarize(-250), "-$2.50");
    EXPECT_EQ(
        mktsim::util::dollarize(std::numeric_limits<Price>::min()), "-$92233720368547758.08");
}

//-------------------------------------------------------------------------

TEST(UtilTest, ParseSimulationFile)
{
    const auto nodes = mktsim::util::parseSimulationFile(kTestDataPath / "replay.xml");

    ASSERT_TRUE(nodes.simulation);
    EXPECT_STREQ(nodes.simulation.name(), "Simulation");
    EXPECT_EQ(nodes.simulation.attribute("start").as_ullong(), 50ull);
    EXPECT_TRUE(nodes.simulation.child("Exchange"));
}

//-------------------------------------------------------------------------

TEST(UtilTest, ParseSimulationFileFailures)
{
    EXPECT_THROW(
        static_cast<void>(mktsim::util::parseSimulationFile(kTestDataPath / "missing.xml")),
        std::invalid_argument);
    EXPECT_THROW(
        static_cast<void>(mktsim::util::parseSimulationFile(kTestDataPath / "norootnode.xml")),
        std::invalid_argument);
}

//-------------------------------------------------------------------------
