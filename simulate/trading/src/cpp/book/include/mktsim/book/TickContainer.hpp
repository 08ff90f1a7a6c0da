/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Order.hpp"

#include <list>

//-------------------------------------------------------------------------

namespace mktsim::book
{

//-------------------------------------------------------------------------

class OrderContainer;

//-------------------------------------------------------------------------

/**
 * Resting orders at one price, oldest first. Aggregate volume is kept in step
 * with the owning side.
 */
class TickContainer : public std::list<LimitOrder>
{
public:
    using ContainerType = std::list<value_type>;

    TickContainer(OrderContainer* orderContainer, Price price) noexcept;

    [[nodiscard]] Price price() const noexcept { return m_price; }
    [[nodiscard]] Quantity volume() const noexcept { return m_volume; }

    bool operator<(const TickContainer& rhs) const noexcept { return m_price < rhs.price(); }
    bool operator<(Price price) const noexcept { return m_price < price; }

    void push_back(const value_type& order);
    void pop_front();
    // Swaps the oldest order for its partially filled successor.
    void replaceFront(value_type order);
    [[nodiscard]] std::optional<value_type> removeOrder(OrderID orderId);

private:
    void updateVolume(Quantity deltaVolume) noexcept;

    OrderContainer* m_orderContainer;
    Price m_price;
    Quantity m_volume{};
};

//-------------------------------------------------------------------------

}  // namespace mktsim::book

//-------------------------------------------------------------------------
