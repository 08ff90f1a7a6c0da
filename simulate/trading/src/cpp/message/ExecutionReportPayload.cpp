/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "mktsim/message/ExecutionReportPayload.hpp"

//-------------------------------------------------------------------------

std::string ExecutionReportPayload::toString() const
{
    std::string out = fmt::format("{{kind: {}", kind);
    if (orderId) {
        out += fmt::format(", orderId: {}", *orderId);
    }
    if (fillPrice) {
        out += fmt::format(", fillPrice: {}", *fillPrice);
    }
    if (quantity) {
        out += fmt::format(", quantity: {}", *quantity);
    }
    if (reason) {
        out += fmt::format(", reason: {}", *reason);
    }
    if (clientOrderId) {
        out += fmt::format(", clientOrderId: {}", *clientOrderId);
    }
    if (order) {
        out += fmt::format(", order: {}", *order);
    }
    return out + "}";
}

//-------------------------------------------------------------------------
