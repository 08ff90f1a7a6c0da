/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Order.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

/**
 * Hands out order ids for one simulation run. Ids supplied from outside
 * (e.g. replayed order flow) are reserved so that fresh ids never collide
 * with them.
 */
class OrderIdAllocator
{
public:
    OrderIdAllocator() noexcept = default;

    [[nodiscard]] OrderID getCounterState() const noexcept { return m_idCounter; }

    [[nodiscard]] OrderID next();
    void reserve(OrderID id) noexcept;

    // Assigns a fresh id if the order has none, otherwise reserves its id.
    void assign(BasicOrder& order);

private:
    OrderID m_idCounter{};
};

//-------------------------------------------------------------------------
