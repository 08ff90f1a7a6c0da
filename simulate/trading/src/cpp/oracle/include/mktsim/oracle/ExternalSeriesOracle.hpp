/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "mktsim/oracle/Oracle.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace mktsim::oracle
{

//-------------------------------------------------------------------------

struct SeriesPoint
{
    Timestamp time;
    double price;
};

/**
 * Fundamental taken from a given price series per symbol. Between two points
 * the price is interpolated linearly; outside the series it is clamped to the
 * first or last point.
 */
class ExternalSeriesOracle : public Oracle
{
public:
    ExternalSeriesOracle() noexcept = default;

    void addSeries(const std::string& symbol, std::vector<SeriesPoint> series);

    [[nodiscard]] bool contains(const std::string& symbol) const noexcept
    {
        return m_fundamentals.contains(symbol);
    }

    [[nodiscard]] virtual Price priceAt(const std::string& symbol, Timestamp time) const override;
    [[nodiscard]] virtual Price observe(
        const std::string& symbol, Timestamp time, double sigmaN, std::mt19937& rng) const override;

    [[nodiscard]] static std::unique_ptr<ExternalSeriesOracle> fromXML(pugi::xml_node node);

private:
    [[nodiscard]] double interpolatedPrice(const std::string& symbol, Timestamp time) const;

    std::map<std::string, std::vector<SeriesPoint>> m_fundamentals;
};

//-------------------------------------------------------------------------

}  // namespace mktsim::oracle

//-------------------------------------------------------------------------
