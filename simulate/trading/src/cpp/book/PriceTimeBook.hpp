/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Book.hpp"

//-------------------------------------------------------------------------

class PriceTimeBook : public Book
{
public:
    explicit PriceTimeBook(std::string symbol);

protected:
    virtual void processAgainstTheBuyQueue(
        const BasicOrder& order, Price minPrice, MatchResult& result, Timestamp timestamp) override;
    virtual void processAgainstTheSellQueue(
        const BasicOrder& order, Price maxPrice, MatchResult& result, Timestamp timestamp) override;
};

//-------------------------------------------------------------------------
