/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "OrderIdAllocator.hpp"

//-------------------------------------------------------------------------

OrderID OrderIdAllocator::next()
{
    if (m_idCounter == std::numeric_limits<OrderID>::max()) [[unlikely]] {
        throw std::overflow_error{fmt::format(
            "{}: order id space exhausted", std::source_location::current().function_name())};
    }
    return m_idCounter++;
}

//-------------------------------------------------------------------------

void OrderIdAllocator::reserve(OrderID id) noexcept
{
    if (id >= m_idCounter && id < std::numeric_limits<OrderID>::max()) {
        m_idCounter = id + 1;
    }
}

//-------------------------------------------------------------------------

void OrderIdAllocator::assign(BasicOrder& order)
{
    if (order.hasId()) {
        reserve(order.id());
        return;
    }
    order.assignId(next());
}

//-------------------------------------------------------------------------
