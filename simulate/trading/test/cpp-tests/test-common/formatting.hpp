/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Fill.hpp"
#include "Order.hpp"
#include "mktsim/message/Message.hpp"

#include <ostream>

//-------------------------------------------------------------------------

inline void PrintTo(const LimitOrder& order, std::ostream* os)
{
    *os << toString(order);
}

inline void PrintTo(const MarketOrder& order, std::ostream* os)
{
    *os << toString(order);
}

inline void PrintTo(const Fill& fill, std::ostream* os)
{
    *os << fmt::format("{}", fill);
}

inline void PrintTo(const Message& msg, std::ostream* os)
{
    *os << fmt::format("{}", msg);
}

//-------------------------------------------------------------------------
