/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "OrderErrorCode.hpp"

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

class SimulationException : public std::runtime_error
{
public:
    explicit SimulationException(const std::string& message) : std::runtime_error(message) {}
    SimulationException(const SimulationException& exception) = default;
    SimulationException(SimulationException&& exception) = default;
};

//-------------------------------------------------------------------------

// Attempt to schedule an event before the current simulated time.
class InvalidScheduleError : public SimulationException
{
public:
    using SimulationException::SimulationException;
};

//-------------------------------------------------------------------------

/**
 * Recoverable failure of an order request. The exchange turns these into
 * REJECTED notifications carrying code().
 */
class OrderError : public SimulationException
{
public:
    OrderError(OrderErrorCode code, const std::string& message)
        : SimulationException(message), m_code{code}
    {}

    [[nodiscard]] OrderErrorCode code() const noexcept { return m_code; }

private:
    OrderErrorCode m_code;
};

// Non-positive quantity, bad price, wrong direction or unknown symbol.
class InvalidOrderError : public OrderError
{
public:
    using OrderError::OrderError;
};

class NoLiquidityError : public OrderError
{
public:
    explicit NoLiquidityError(const std::string& message)
        : OrderError(OrderErrorCode::EMPTY_BOOK, message)
    {}
};

class OrderNotFoundError : public OrderError
{
public:
    explicit OrderNotFoundError(const std::string& message)
        : OrderError(OrderErrorCode::NONEXISTENT_ORDER, message)
    {}
};

//-------------------------------------------------------------------------
