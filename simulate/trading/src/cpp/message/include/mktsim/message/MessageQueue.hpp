/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "mktsim/message/Message.hpp"

#include <queue>

//-------------------------------------------------------------------------

/**
 * Min-heap of messages keyed by (arrival, sequence). The sequence number is
 * assigned on push and grows over the whole run, so messages due at the same
 * time pop in the order they were pushed.
 */
class MessageQueue
{
public:
    MessageQueue() noexcept = default;

    [[nodiscard]] Message::Ptr top() const { return m_queue.top().msg; }
    [[nodiscard]] bool empty() const noexcept { return m_queue.empty(); }
    [[nodiscard]] size_t size() const noexcept { return m_queue.size(); }
    [[nodiscard]] uint64_t sequenceCounter() const noexcept { return m_idCounter; }
    [[nodiscard]] std::optional<Timestamp> peekNextTime() const;

    void push(Message::Ptr msg) { m_queue.emplace(std::move(msg), m_idCounter++); }
    void pop() { m_queue.pop(); }
    [[nodiscard]] Message::Ptr popNext();
    void clear() { m_queue = QueueType{}; }

private:
    struct MessageWithId
    {
        Message::Ptr msg;
        uint64_t id;

        MessageWithId(Message::Ptr msg, uint64_t id) noexcept
            : msg{std::move(msg)}, id{id}
        {}
    };

    struct CompareQueueMessages
    {
        bool operator()(const MessageWithId& lhs, const MessageWithId& rhs) const noexcept;
    };

    using QueueType = std::priority_queue<
        MessageWithId,
        std::vector<MessageWithId>,
        CompareQueueMessages>;

    QueueType m_queue;
    uint64_t m_idCounter{};
};

//-------------------------------------------------------------------------
