/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "PriceTimeBook.hpp"

//-------------------------------------------------------------------------

PriceTimeBook::PriceTimeBook(std::string symbol)
    : Book{std::move(symbol)}
{}

//-------------------------------------------------------------------------

void PriceTimeBook::processAgainstTheBuyQueue(
    const BasicOrder& order, Price minPrice, MatchResult& result, Timestamp timestamp)
{
    if (m_buyQueue.empty()) return;

    auto bestBuyDeque = &m_buyQueue.back();

    while (result.remaining > 0 && bestBuyDeque->price() >= minPrice) {
        const LimitOrder& iop = bestBuyDeque->front();
        const Quantity usedVolume = std::min(iop.quantity(), result.remaining);

        logTrade(
            OrderDirection::SELL, order.id(), iop, usedVolume, bestBuyDeque->price(), timestamp, result);
        result.remaining -= usedVolume;

        if (iop.quantity() == usedVolume) {
            const OrderID iopId = iop.id();
            bestBuyDeque->pop_front();
            unregisterLimitOrder(iopId);
        }
        else {
            bestBuyDeque->replaceFront(iop.withQuantity(iop.quantity() - usedVolume));
        }

        if (bestBuyDeque->empty()) {
            m_buyQueue.pop_back();
            if (m_buyQueue.empty()) {
                break;
            }
            bestBuyDeque = &m_buyQueue.back();
        }
    }
}

//-------------------------------------------------------------------------

void PriceTimeBook::processAgainstTheSellQueue(
    const BasicOrder& order, Price maxPrice, MatchResult& result, Timestamp timestamp)
{
    if (m_sellQueue.empty()) return;

    auto bestSellDeque = &m_sellQueue.front();

    while (result.remaining > 0 && bestSellDeque->price() <= maxPrice) {
        const LimitOrder& iop = bestSellDeque->front();
        const Quantity usedVolume = std::min(iop.quantity(), result.remaining);

        logTrade(
            OrderDirection::BUY, order.id(), iop, usedVolume, bestSellDeque->price(), timestamp, result);
        result.remaining -= usedVolume;

        if (iop.quantity() == usedVolume) {
            const OrderID iopId = iop.id();
            bestSellDeque->pop_front();
            unregisterLimitOrder(iopId);
        }
        else {
            bestSellDeque->replaceFront(iop.withQuantity(iop.quantity() - usedVolume));
        }

        if (bestSellDeque->empty()) {
            m_sellQueue.pop_front();
            if (m_sellQueue.empty()) {
                break;
            }
            bestSellDeque = &m_sellQueue.front();
        }
    }
}

//-------------------------------------------------------------------------
