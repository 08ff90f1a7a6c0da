/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "mktsim/book/OrderContainer.hpp"
#include "mktsim/book/TickContainer.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace mktsim::book
{

//-------------------------------------------------------------------------

TickContainer::TickContainer(OrderContainer* orderContainer, Price price) noexcept
    : list{}, m_orderContainer{orderContainer}, m_price{price}
{}

//-------------------------------------------------------------------------

void TickContainer::push_back(const TickContainer::value_type& order)
{
    ContainerType::push_back(order);
    updateVolume(order.quantity());
}

//-------------------------------------------------------------------------

void TickContainer::pop_front()
{
    updateVolume(-front().quantity());
    ContainerType::pop_front();
}

//-------------------------------------------------------------------------

void TickContainer::replaceFront(TickContainer::value_type order)
{
    updateVolume(order.quantity() - front().quantity());
    front() = std::move(order);
}

//-------------------------------------------------------------------------

std::optional<TickContainer::value_type> TickContainer::removeOrder(OrderID orderId)
{
    auto it = std::find_if(
        begin(), end(), [orderId](const auto& order) { return order.id() == orderId; });
    if (it == end()) return {};
    value_type removed = std::move(*it);
    erase(it);
    updateVolume(-removed.quantity());
    return removed;
}

//-------------------------------------------------------------------------

void TickContainer::updateVolume(Quantity deltaVolume) noexcept
{
    m_volume += deltaVolume;
    m_orderContainer->updateVolume(deltaVolume);
}

//-------------------------------------------------------------------------

}  // namespace mktsim::book

//-------------------------------------------------------------------------
