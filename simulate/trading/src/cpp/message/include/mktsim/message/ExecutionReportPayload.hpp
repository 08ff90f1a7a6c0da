/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Order.hpp"
#include "OrderErrorCode.hpp"
#include "common.hpp"
#include "mktsim/message/MessagePayload.hpp"

//-------------------------------------------------------------------------

enum class NotificationKind : uint32_t
{
    EXECUTED,
    ACKED,
    CANCELLED,
    REJECTED
};

[[nodiscard]] constexpr std::string_view NotificationKind2StrView(NotificationKind kind) noexcept
{
    return magic_enum::enum_name(kind);
}

// Message type under which a notification of the given kind is delivered.
[[nodiscard]] constexpr std::string_view NotificationKind2MessageType(NotificationKind kind) noexcept
{
    switch (kind) {
        case NotificationKind::EXECUTED:
            return "ORDER_EXECUTED";
        case NotificationKind::ACKED:
            return "ORDER_ACCEPTED";
        case NotificationKind::CANCELLED:
            return "ORDER_CANCELLED";
        case NotificationKind::REJECTED:
            return "ORDER_REJECTED";
    }
    return "ORDER_UNKNOWN";
}

template<>
struct fmt::formatter<NotificationKind>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(NotificationKind kind, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", NotificationKind2StrView(kind));
    }
};

//-------------------------------------------------------------------------

/**
 * Outcome of an order request as seen by one affected agent. For EXECUTED,
 * `order` is the record for the filled quantity with its fill price set.
 */
struct ExecutionReportPayload : public MessagePayload
{
    using Ptr = std::shared_ptr<ExecutionReportPayload>;

    NotificationKind kind;
    std::optional<OrderID> orderId;
    std::optional<Price> fillPrice;
    std::optional<Quantity> quantity;
    std::optional<OrderErrorCode> reason;
    std::optional<AnyOrder> order;
    std::optional<ClientOrderID> clientOrderId;

    explicit ExecutionReportPayload(NotificationKind kind) noexcept : kind{kind} {}

    [[nodiscard]] virtual std::string toString() const override;
};

//-------------------------------------------------------------------------
