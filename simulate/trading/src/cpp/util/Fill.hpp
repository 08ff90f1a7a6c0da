/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Order.hpp"
#include "Timestamp.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

/**
 * One match between a buy and a sell order at one price for one quantity.
 * The price is always the resting order's limit price.
 */
struct Fill
{
    OrderID buyOrderId;
    OrderID sellOrderId;
    Price price;
    Quantity quantity;
    Timestamp time;
    // Side of the order that triggered the match.
    OrderDirection aggressorDirection;

    [[nodiscard]] OrderID aggressingOrderId() const noexcept
    {
        return aggressorDirection == OrderDirection::BUY ? buyOrderId : sellOrderId;
    }

    [[nodiscard]] OrderID restingOrderId() const noexcept
    {
        return aggressorDirection == OrderDirection::BUY ? sellOrderId : buyOrderId;
    }

    bool operator==(const Fill&) const noexcept = default;
};

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<Fill>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const Fill& fill, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{},{},{},{},{},{}",
            fill.time,
            fill.aggressorDirection,
            fill.buyOrderId,
            fill.sellOrderId,
            fill.quantity,
            fill.price);
    }
};

//-------------------------------------------------------------------------
