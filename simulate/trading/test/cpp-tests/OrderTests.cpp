/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Order.hpp"
#include "OrderIdAllocator.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

const std::string kSymbol{"JPM"};

LimitOrder bid(Price price, Quantity quantity = 1)
{
    return LimitOrder{OrderDirection::BUY, 0, kSymbol, 0, quantity, price, 1};
}

LimitOrder ask(Price price, Quantity quantity = 1)
{
    return LimitOrder{OrderDirection::SELL, 0, kSymbol, 0, quantity, price, 2};
}

}  // namespace

//-------------------------------------------------------------------------

struct IsMatchTest : public TestWithParam<std::pair<Price, Price>>
{
    virtual void SetUp() override
    {
        std::tie(bidPrice, askPrice) = GetParam();
    }

    Price bidPrice;
    Price askPrice;
};

INSTANTIATE_TEST_SUITE_P(
    OrderTest,
    IsMatchTest,
    Values(
        std::pair{Price{100}, Price{100}},
        std::pair{Price{101}, Price{100}},
        std::pair{Price{99}, Price{100}},
        std::pair{Price{1}, Price{100'000}},
        std::pair{MARKET_SENTINEL_PRICE, Price{100}}));

TEST_P(IsMatchTest, SymmetricAcrossSides)
{
    const bool expected = bidPrice >= askPrice;
    EXPECT_EQ(bid(bidPrice).isMatch(ask(askPrice)), expected);
    EXPECT_EQ(ask(askPrice).isMatch(bid(bidPrice)), expected);
}

//-------------------------------------------------------------------------

TEST(OrderTest, IsMatchOnSameDirectionYieldsFalse)
{
    EXPECT_FALSE(bid(100).isMatch(bid(100)));
    EXPECT_FALSE(ask(100).isMatch(ask(90)));
}

//-------------------------------------------------------------------------

TEST(OrderTest, HasBetterPrice)
{
    EXPECT_TRUE(ask(10).hasBetterPrice(ask(100)));
    EXPECT_FALSE(ask(100).hasBetterPrice(ask(10)));
    EXPECT_FALSE(bid(10).hasBetterPrice(bid(100)));
    EXPECT_TRUE(bid(100).hasBetterPrice(bid(10)));

    EXPECT_FALSE(bid(100).hasBetterPrice(bid(100)));
    EXPECT_FALSE(ask(100).hasBetterPrice(ask(100)));

    EXPECT_FALSE(bid(100).hasBetterPrice(ask(10)));
    EXPECT_FALSE(ask(10).hasBetterPrice(bid(100)));
}

//-------------------------------------------------------------------------

TEST(OrderTest, HasEqPrice)
{
    EXPECT_TRUE(bid(100).hasEqPrice(ask(100)));
    EXPECT_FALSE(bid(100).hasEqPrice(bid(101)));
}

//-------------------------------------------------------------------------

TEST(OrderTest, CloneIsIndependent)
{
    LimitOrder original{OrderDirection::BUY, 3, kSymbol, 42, 10, 2500, 7, "init"};
    LimitOrder copy = original.clone();

    EXPECT_EQ(copy.id(), original.id());
    EXPECT_EQ(copy.agentId(), original.agentId());
    EXPECT_EQ(copy.quantity(), original.quantity());
    EXPECT_EQ(copy.limitPrice(), original.limitPrice());
    EXPECT_EQ(copy.tag(), original.tag());
    EXPECT_EQ(copy.timePlaced(), original.timePlaced());

    copy.setFillPrice(2499);
    EXPECT_EQ(copy.fillPrice(), Price{2499});
    EXPECT_EQ(original.fillPrice(), std::nullopt);

    AnyOrder any = MarketOrder{OrderDirection::SELL, 1, kSymbol, 0, 5, 9};
    AnyOrder anyCopy = cloneOrder(any);
    basicOrder(anyCopy).setFillPrice(100);
    EXPECT_EQ(basicOrder(anyCopy).id(), 9);
    EXPECT_FALSE(basicOrder(any).fillPrice().has_value());
    EXPECT_TRUE(std::holds_alternative<MarketOrder>(anyCopy));
}

//-------------------------------------------------------------------------

TEST(OrderTest, ExecutedRecordKeepsIdentity)
{
    const LimitOrder order{OrderDirection::SELL, 2, kSymbol, 5, 10, 300, 11};
    const LimitOrder partial = order.executed(300, 4);

    EXPECT_EQ(partial.id(), order.id());
    EXPECT_EQ(partial.quantity(), 4);
    EXPECT_EQ(partial.fillPrice(), Price{300});
    EXPECT_EQ(order.quantity(), 10);

    const LimitOrder rest = order.withQuantity(6);
    EXPECT_EQ(rest.quantity(), 6);
    EXPECT_FALSE(rest.fillPrice().has_value());
}

//-------------------------------------------------------------------------

TEST(OrderTest, IdAssignedOnce)
{
    MarketOrder order{OrderDirection::BUY, 0, kSymbol, 0, 1};

    EXPECT_FALSE(order.hasId());
    EXPECT_THROW(static_cast<void>(order.id()), std::logic_error);

    order.assignId(5);
    EXPECT_EQ(order.id(), 5);
    EXPECT_THROW(order.assignId(6), std::logic_error);
}

//-------------------------------------------------------------------------

TEST(OrderTest, Display)
{
    const LimitOrder limit{OrderDirection::BUY, 4, kSymbol, 100, 10, 12345, 1};
    EXPECT_THAT(fmt::format("{}", limit), StrEq("(Agent 4 @ 100) : BUY 10 JPM @ $123.45"));

    const LimitOrder sentinel{OrderDirection::SELL, 4, kSymbol, 100, 10, MARKET_SENTINEL_PRICE, 2, "x"};
    EXPECT_THAT(fmt::format("{}", sentinel), StrEq("(Agent 4 @ 100 [x]) : SELL 10 JPM @ MKT"));

    const MarketOrder market{OrderDirection::SELL, 4, kSymbol, 7, 3, 3};
    EXPECT_THAT(fmt::format("{}", market), StrEq("(Agent 4 @ 7) : MKT Order SELL 3 JPM"));

    BasketOrder basket{OrderDirection::SELL, 4, "ETF", 7, 3, true, 8};
    basket.setFillPrice(250);
    EXPECT_THAT(
        fmt::format("{}", basket), StrEq("(Order_ID: 8 Agent 4 @ 7) : REDEEM 3 ETF (filled @ $2.50)"));

    const LimitOrder filled = limit.executed(12300, 2);
    EXPECT_THAT(toString(AnyOrder{filled}), HasSubstr("(filled @ $123.00)"));
}

//-------------------------------------------------------------------------

TEST(OrderIdAllocatorTest, FreshIdsSkipReservedOnes)
{
    OrderIdAllocator allocator;

    EXPECT_EQ(allocator.next(), 0);
    EXPECT_EQ(allocator.next(), 1);

    allocator.reserve(10);
    EXPECT_EQ(allocator.next(), 11);

    allocator.reserve(3);
    EXPECT_EQ(allocator.next(), 12);

    MarketOrder fresh{OrderDirection::BUY, 0, kSymbol, 0, 1};
    allocator.assign(fresh);
    EXPECT_EQ(fresh.id(), 13);

    LimitOrder supplied{OrderDirection::BUY, 0, kSymbol, 0, 1, 100, 50};
    allocator.assign(supplied);
    EXPECT_EQ(supplied.id(), 50);
    EXPECT_EQ(allocator.next(), 51);
}

//-------------------------------------------------------------------------
