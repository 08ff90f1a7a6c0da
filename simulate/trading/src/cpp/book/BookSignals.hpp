/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Fill.hpp"
#include "Order.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

struct BookSignals
{
    UnsyncSignal<void(const LimitOrder&)> orderRested;
    UnsyncSignal<void(const Fill&)> fill;
    UnsyncSignal<void(const LimitOrder&)> cancel;
    // Old record, replacement record.
    UnsyncSignal<void(const LimitOrder&, const LimitOrder&)> modify;
};

//-------------------------------------------------------------------------
