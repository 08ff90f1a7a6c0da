/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "mktsim/book/TickContainer.hpp"

#include <deque>

//-------------------------------------------------------------------------

namespace mktsim::book
{

//-------------------------------------------------------------------------

// One side of a book: price levels in ascending price order.
class OrderContainer : public std::deque<TickContainer>
{
public:
    [[nodiscard]] Quantity volume() const noexcept { return m_volume; }

    void updateVolume(Quantity deltaVolume) noexcept { m_volume += deltaVolume; }

private:
    Quantity m_volume{};
};

//-------------------------------------------------------------------------

}  // namespace mktsim::book

//-------------------------------------------------------------------------
