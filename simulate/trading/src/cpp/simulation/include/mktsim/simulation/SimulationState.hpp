/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <magic_enum.hpp>

#include <cstdint>
#include <string_view>

//-------------------------------------------------------------------------

namespace mktsim::simulation
{

//-------------------------------------------------------------------------

enum class SimulationState : uint32_t
{
    INACTIVE,
    STARTED,
    STOPPED
};

[[nodiscard]] constexpr std::string_view SimulationState2StrView(SimulationState state) noexcept
{
    return magic_enum::enum_name(state);
}

//-------------------------------------------------------------------------

}  // namespace mktsim::simulation

//-------------------------------------------------------------------------
