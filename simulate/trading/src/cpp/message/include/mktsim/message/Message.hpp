/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "mktsim/message/MessagePayload.hpp"

//-------------------------------------------------------------------------

/**
 * A scheduled delivery: payload for agent `target`, due at `arrival`.
 */
struct Message
{
    using Ptr = std::shared_ptr<Message>;

    Timestamp occurrence;
    Timestamp arrival;
    AgentId source;
    AgentId target;
    std::string type;
    MessagePayload::Ptr payload;

    Message(
        Timestamp occurrence,
        Timestamp arrival,
        AgentId source,
        AgentId target,
        std::string type,
        MessagePayload::Ptr payload) noexcept
        : occurrence{occurrence},
          arrival{arrival},
          source{source},
          target{target},
          type{std::move(type)},
          payload{std::move(payload)}
    {}

    template<typename... Args>
    requires std::constructible_from<Message, Args...>
    [[nodiscard]] static Ptr create(Args&&... args)
    {
        return std::make_shared<Message>(std::forward<Args>(args)...);
    }
};

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<Message>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const Message& msg, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{} -> {} | {} -> {} | {} {}",
            msg.occurrence,
            msg.arrival,
            msg.source,
            msg.target,
            msg.type,
            msg.payload ? msg.payload->toString() : "{}");
    }
};

//-------------------------------------------------------------------------
