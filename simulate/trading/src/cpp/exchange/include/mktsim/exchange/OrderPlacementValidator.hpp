/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Action.hpp"
#include "Book.hpp"
#include "Order.hpp"
#include "OrderErrorCode.hpp"

#include <expected>

//-------------------------------------------------------------------------

class Exchange;

//-------------------------------------------------------------------------

namespace mktsim::exchange
{

//-------------------------------------------------------------------------

/**
 * Checks order requests against the exchange state before any book is
 * touched. A failed check names the OrderErrorCode the request is rejected
 * with.
 */
class OrderPlacementValidator
{
public:
    using ExpectedResult = std::expected<void, OrderErrorCode>;

    explicit OrderPlacementValidator(const Exchange* exchange) noexcept;

    [[nodiscard]] ExpectedResult validateMarketOrderPlacement(const MarketOrder& order) const;
    [[nodiscard]] ExpectedResult validateLimitOrderPlacement(const LimitOrder& order) const;
    [[nodiscard]] ExpectedResult validateBasketOrderPlacement(const BasketOrder& order) const;
    [[nodiscard]] ExpectedResult validateModification(AgentId agentId, const ModifyOrder& request) const;
    [[nodiscard]] ExpectedResult validateCancellation(AgentId agentId, const CancelOrder& request) const;

private:
    [[nodiscard]] ExpectedResult checkOwnership(
        AgentId agentId, const std::string& symbol, OrderID orderId) const;

    const Exchange* m_exchange;
};

//-------------------------------------------------------------------------

}  // namespace mktsim::exchange

//-------------------------------------------------------------------------
