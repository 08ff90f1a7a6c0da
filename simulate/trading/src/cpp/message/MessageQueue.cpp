/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "mktsim/message/MessageQueue.hpp"

//-------------------------------------------------------------------------

std::optional<Timestamp> MessageQueue::peekNextTime() const
{
    if (m_queue.empty()) return {};
    return m_queue.top().msg->arrival;
}

//-------------------------------------------------------------------------

Message::Ptr MessageQueue::popNext()
{
    if (m_queue.empty()) [[unlikely]] {
        throw std::logic_error{fmt::format(
            "{}: queue is empty", std::source_location::current().function_name())};
    }
    Message::Ptr msg = m_queue.top().msg;
    m_queue.pop();
    return msg;
}

//-------------------------------------------------------------------------

bool MessageQueue::CompareQueueMessages::operator()(
    const MessageWithId& lhs, const MessageWithId& rhs) const noexcept
{
    if (lhs.msg->arrival != rhs.msg->arrival) [[likely]] {
        return lhs.msg->arrival > rhs.msg->arrival;
    }
    return lhs.id > rhs.id;
}

//-------------------------------------------------------------------------
