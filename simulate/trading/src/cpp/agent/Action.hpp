/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Order.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

// Orders without an id get one from the kernel. clientOrderId is echoed back
// in every notification about the order.
struct PlaceOrder
{
    AnyOrder order;
    std::optional<ClientOrderID> clientOrderId{};
};

struct ModifyOrder
{
    std::string symbol;
    OrderID orderId;
    Quantity quantity;
    Price limitPrice;
};

struct CancelOrder
{
    std::string symbol;
    OrderID orderId;
};

struct ScheduleWakeup
{
    Timestamp time;
    std::optional<std::string> tag{};
};

using OutgoingAction = std::variant<PlaceOrder, ModifyOrder, CancelOrder, ScheduleWakeup>;
using Actions = std::vector<OutgoingAction>;

//-------------------------------------------------------------------------
