/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <cstdint>
#include <string_view>

//-------------------------------------------------------------------------

enum class OrderErrorCode : uint32_t
{
    INVALID_VOLUME,
    INVALID_PRICE,
    UNKNOWN_SYMBOL,
    DUPLICATE_ORDER_ID,
    EMPTY_BOOK,
    NONEXISTENT_ORDER,
    INVALID_SCHEDULE
};

[[nodiscard]] constexpr std::string_view OrderErrorCode2StrView(OrderErrorCode ec) noexcept
{
    return magic_enum::enum_name(ec);
}

template<>
struct fmt::formatter<OrderErrorCode>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(OrderErrorCode ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", OrderErrorCode2StrView(ec));
    }
};

//-------------------------------------------------------------------------
