/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "mktsim/message/MessageQueue.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

//-------------------------------------------------------------------------

namespace
{

Message::Ptr makeMessage(Timestamp arrival, const std::string& type)
{
    return Message::create(0, arrival, 0, 1, type, MessagePayload::create<EmptyPayload>());
}

}  // namespace

//-------------------------------------------------------------------------

TEST(MessageQueueTest, API)
{
    MessageQueue messageQueue;

    EXPECT_TRUE(messageQueue.empty());
    EXPECT_EQ(messageQueue.size(), 0);
    EXPECT_EQ(messageQueue.peekNextTime(), std::nullopt);

    static constexpr int pushCount = 4;
    for (int i = 0; i < pushCount; ++i) {
        messageQueue.push(makeMessage(0, "baz"));
    }

    EXPECT_FALSE(messageQueue.empty());
    EXPECT_EQ(messageQueue.size(), pushCount);
    EXPECT_EQ(messageQueue.sequenceCounter(), pushCount);

    static constexpr int popCount = 3;
    for (int i = 0; i < popCount; ++i) {
        messageQueue.pop();
    }

    EXPECT_FALSE(messageQueue.empty());
    EXPECT_EQ(messageQueue.size(), pushCount - popCount);

    messageQueue.clear();
    EXPECT_TRUE(messageQueue.empty());
    EXPECT_THROW(static_cast<void>(messageQueue.popNext()), std::logic_error);
}

//-------------------------------------------------------------------------

TEST(MessageQueueTest, EqualArrivals)
{
    MessageQueue messageQueue;

    for (auto testId : {"1st", "2nd", "3rd", "4th"}) {
        messageQueue.push(makeMessage(0, testId));
    }

    std::vector<std::string> poppedTestIds;
    for (int i = 0; i < 3; ++i) {
        poppedTestIds.push_back(messageQueue.popNext()->type);
    }

    EXPECT_THAT(poppedTestIds, testing::ElementsAre("1st", "2nd", "3rd"));
}

//-------------------------------------------------------------------------

TEST(MessageQueueTest, DifferingArrivals)
{
    MessageQueue messageQueue;

    for (auto testId : {"1st", "2nd", "3rd", "4th"}) {
        messageQueue.push(makeMessage(Timestamp{4} - (testId[0] - '0'), testId));
    }

    EXPECT_EQ(messageQueue.peekNextTime(), 0);

    std::vector<std::string> poppedTestIds;
    for (int i = 0; i < 3; ++i) {
        poppedTestIds.push_back(messageQueue.popNext()->type);
    }

    EXPECT_THAT(poppedTestIds, testing::ElementsAre("4th", "3rd", "2nd"));
    EXPECT_EQ(messageQueue.peekNextTime(), 3);
}

//-------------------------------------------------------------------------

TEST(MessageQueueTest, TiesBrokenByPushOrderAcrossInterleavedTimes)
{
    MessageQueue messageQueue;

    messageQueue.push(makeMessage(5, "a5"));
    messageQueue.push(makeMessage(2, "a2"));
    messageQueue.push(makeMessage(5, "b5"));
    messageQueue.push(makeMessage(2, "b2"));
    messageQueue.push(makeMessage(7, "a7"));
    messageQueue.push(makeMessage(5, "c5"));

    std::vector<std::string> popped;
    std::vector<Timestamp> arrivals;
    while (!messageQueue.empty()) {
        const auto msg = messageQueue.popNext();
        popped.push_back(msg->type);
        arrivals.push_back(msg->arrival);
    }

    EXPECT_THAT(popped, testing::ElementsAre("a2", "b2", "a5", "b5", "c5", "a7"));
    EXPECT_TRUE(std::is_sorted(arrivals.begin(), arrivals.end()));
}

//-------------------------------------------------------------------------

TEST(MessageQueueTest, SequenceKeepsGrowingAfterPops)
{
    MessageQueue messageQueue;

    messageQueue.push(makeMessage(1, "first"));
    static_cast<void>(messageQueue.popNext());
    messageQueue.push(makeMessage(1, "second"));
    messageQueue.push(makeMessage(1, "third"));

    EXPECT_EQ(messageQueue.sequenceCounter(), 3);
    EXPECT_EQ(messageQueue.popNext()->type, "second");
    EXPECT_EQ(messageQueue.popNext()->type, "third");
}

//-------------------------------------------------------------------------
