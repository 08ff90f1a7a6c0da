/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>
#include <limits>

//-------------------------------------------------------------------------

using Timestamp = uint64_t;

inline constexpr Timestamp TIMESTAMP_MAX = std::numeric_limits<Timestamp>::max();

struct Timespan
{
    Timestamp begin, end;
};

//-------------------------------------------------------------------------
