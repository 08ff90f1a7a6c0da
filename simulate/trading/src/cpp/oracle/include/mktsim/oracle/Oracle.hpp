/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace mktsim::oracle
{

//-------------------------------------------------------------------------

/**
 * Source of fundamental prices for agents. The kernel never consults it.
 */
class Oracle
{
public:
    virtual ~Oracle() noexcept = default;

    [[nodiscard]] virtual Price priceAt(const std::string& symbol, Timestamp time) const = 0;
    // Noisy observation; sigmaN is the variance of the observation noise.
    [[nodiscard]] virtual Price observe(
        const std::string& symbol, Timestamp time, double sigmaN, std::mt19937& rng) const = 0;

protected:
    Oracle() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace mktsim::oracle

//-------------------------------------------------------------------------
