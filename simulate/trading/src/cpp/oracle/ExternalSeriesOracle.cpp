/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "mktsim/oracle/ExternalSeriesOracle.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

//-------------------------------------------------------------------------

namespace mktsim::oracle
{

//-------------------------------------------------------------------------

void ExternalSeriesOracle::addSeries(const std::string& symbol, std::vector<SeriesPoint> series)
{
    if (series.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: empty price series for symbol '{}'",
            std::source_location::current().function_name(),
            symbol)};
    }
    std::ranges::stable_sort(series, {}, &SeriesPoint::time);
    m_fundamentals[symbol] = std::move(series);
}

//-------------------------------------------------------------------------

Price ExternalSeriesOracle::priceAt(const std::string& symbol, Timestamp time) const
{
    return static_cast<Price>(std::llround(interpolatedPrice(symbol, time)));
}

//-------------------------------------------------------------------------

Price ExternalSeriesOracle::observe(
    const std::string& symbol, Timestamp time, double sigmaN, std::mt19937& rng) const
{
    const double truePrice = interpolatedPrice(symbol, time);
    if (sigmaN == 0.0) {
        return static_cast<Price>(std::llround(truePrice));
    }
    std::normal_distribution<double> noise{truePrice, std::sqrt(sigmaN)};
    return static_cast<Price>(std::llround(noise(rng)));
}

//-------------------------------------------------------------------------

double ExternalSeriesOracle::interpolatedPrice(const std::string& symbol, Timestamp time) const
{
    auto it = m_fundamentals.find(symbol);
    if (it == m_fundamentals.end()) {
        throw std::out_of_range{fmt::format(
            "{}: no price series for symbol '{}'",
            std::source_location::current().function_name(),
            symbol)};
    }
    const auto& series = it->second;

    if (time <= series.front().time) return series.front().price;
    if (time >= series.back().time) return series.back().price;

    auto upper = std::ranges::lower_bound(series, time, {}, &SeriesPoint::time);
    if (upper->time == time) return upper->price;
    auto lower = std::prev(upper);

    const double slope = lower->price != upper->price
        ? (upper->price - lower->price) / static_cast<double>(upper->time - lower->time)
        : 0.0;
    const double price = lower->price + static_cast<double>(time - lower->time) * slope;

    spdlog::debug(
        "Oracle: {} between {}@{} and {}@{} interpolated to {} at {}",
        symbol, lower->price, lower->time, upper->price, upper->time, price, time);

    return price;
}

//-------------------------------------------------------------------------

std::unique_ptr<ExternalSeriesOracle> ExternalSeriesOracle::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto oracle = std::make_unique<ExternalSeriesOracle>();

    for (pugi::xml_node seriesNode : node.children("Series")) {
        pugi::xml_attribute symbolAttr = seriesNode.attribute("symbol");
        if (symbolAttr.empty()) {
            throw std::invalid_argument{fmt::format(
                "{}: Series is missing required attribute 'symbol'", ctx)};
        }
        std::vector<SeriesPoint> series;
        for (pugi::xml_node pointNode : seriesNode.children("Point")) {
            if (pointNode.attribute("time").empty() || pointNode.attribute("price").empty()) {
                throw std::invalid_argument{fmt::format(
                    "{}: Point of series '{}' needs attributes 'time' and 'price'",
                    ctx,
                    symbolAttr.as_string())};
            }
            series.push_back(SeriesPoint{
                .time = pointNode.attribute("time").as_ullong(),
                .price = pointNode.attribute("price").as_double()
            });
        }
        oracle->addSeries(symbolAttr.as_string(), std::move(series));
    }

    return oracle;
}

//-------------------------------------------------------------------------

}  // namespace mktsim::oracle

//-------------------------------------------------------------------------
