/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "mktsim/exchange/OrderPlacementValidator.hpp"

#include "Exchange.hpp"

//-------------------------------------------------------------------------

namespace mktsim::exchange
{

//-------------------------------------------------------------------------

OrderPlacementValidator::OrderPlacementValidator(const Exchange* exchange) noexcept
    : m_exchange{exchange}
{}

//-------------------------------------------------------------------------

OrderPlacementValidator::ExpectedResult
    OrderPlacementValidator::validateMarketOrderPlacement(const MarketOrder& order) const
{
    const Book* book = m_exchange->findBook(order.symbol());
    if (book == nullptr)
        return std::unexpected{OrderErrorCode::UNKNOWN_SYMBOL};

    if (order.quantity() <= 0)
        return std::unexpected{OrderErrorCode::INVALID_VOLUME};

    const auto& opposingQueue =
        order.isBuyOrder() ? book->sellQueue() : book->buyQueue();
    if (opposingQueue.empty())
        return std::unexpected{OrderErrorCode::EMPTY_BOOK};

    return {};
}

//-------------------------------------------------------------------------

OrderPlacementValidator::ExpectedResult
    OrderPlacementValidator::validateLimitOrderPlacement(const LimitOrder& order) const
{
    const Book* book = m_exchange->findBook(order.symbol());
    if (book == nullptr)
        return std::unexpected{OrderErrorCode::UNKNOWN_SYMBOL};

    if (order.quantity() <= 0)
        return std::unexpected{OrderErrorCode::INVALID_VOLUME};

    if (order.limitPrice() <= 0)
        return std::unexpected{OrderErrorCode::INVALID_PRICE};

    if (order.hasId() && book->contains(order.id()))
        return std::unexpected{OrderErrorCode::DUPLICATE_ORDER_ID};

    return {};
}

//-------------------------------------------------------------------------

OrderPlacementValidator::ExpectedResult
    OrderPlacementValidator::validateBasketOrderPlacement(const BasketOrder& order) const
{
    if (order.quantity() <= 0)
        return std::unexpected{OrderErrorCode::INVALID_VOLUME};

    if (!order.fillPrice().has_value())
        return std::unexpected{OrderErrorCode::INVALID_PRICE};

    return {};
}

//-------------------------------------------------------------------------

OrderPlacementValidator::ExpectedResult
    OrderPlacementValidator::validateModification(AgentId agentId, const ModifyOrder& request) const
{
    if (auto owned = checkOwnership(agentId, request.symbol, request.orderId); !owned)
        return owned;

    if (request.quantity <= 0)
        return std::unexpected{OrderErrorCode::INVALID_VOLUME};

    if (request.limitPrice <= 0)
        return std::unexpected{OrderErrorCode::INVALID_PRICE};

    return {};
}

//-------------------------------------------------------------------------

OrderPlacementValidator::ExpectedResult
    OrderPlacementValidator::validateCancellation(AgentId agentId, const CancelOrder& request) const
{
    return checkOwnership(agentId, request.symbol, request.orderId);
}

//-------------------------------------------------------------------------

OrderPlacementValidator::ExpectedResult OrderPlacementValidator::checkOwnership(
    AgentId agentId, const std::string& symbol, OrderID orderId) const
{
    const Book* book = m_exchange->findBook(symbol);
    if (book == nullptr)
        return std::unexpected{OrderErrorCode::UNKNOWN_SYMBOL};

    // Orders resting under another agent are reported exactly like missing ones.
    const auto order = book->getOrder(orderId);
    if (!order.has_value() || order->agentId() != agentId)
        return std::unexpected{OrderErrorCode::NONEXISTENT_ORDER};

    return {};
}

//-------------------------------------------------------------------------

}  // namespace mktsim::exchange

//-------------------------------------------------------------------------
