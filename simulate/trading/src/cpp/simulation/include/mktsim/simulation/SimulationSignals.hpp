/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace mktsim::simulation
{

//-------------------------------------------------------------------------

struct SimulationSignals
{
    UnsyncSignal<void()> start;
    UnsyncSignal<void()> stop;
    // Emitted whenever simulated time advances, with the span just entered.
    UnsyncSignal<void(Timespan)> time;
    UnsyncSignal<void()> agentsCreated;
};

//-------------------------------------------------------------------------

}  // namespace mktsim::simulation

//-------------------------------------------------------------------------
