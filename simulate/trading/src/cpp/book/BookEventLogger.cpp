/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "BookEventLogger.hpp"

#include "Simulation.hpp"

//-------------------------------------------------------------------------

BookEventLogger::BookEventLogger(const fs::path& filepath, const Simulation* simulation)
    : m_filepath{filepath}, m_simulation{simulation}
{
    m_logger = std::make_unique<spdlog::logger>(
        "BookEventLogger",
        std::make_unique<spdlog::sinks::basic_file_sink_st>(filepath, true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");
    m_logger->trace(s_header);
    m_logger->flush();
}

//-------------------------------------------------------------------------

void BookEventLogger::attach(Book& book)
{
    const std::string symbol = book.symbol();
    auto& signals = book.signals();
    m_feeds.emplace_back(signals.orderRested.connect([this, symbol](const LimitOrder& order) {
        log(symbol, "REST", order);
    }));
    m_feeds.emplace_back(signals.fill.connect([this, symbol](const Fill& fill) {
        log(symbol, fill);
    }));
    m_feeds.emplace_back(signals.cancel.connect([this, symbol](const LimitOrder& order) {
        log(symbol, "CANCEL", order);
    }));
    m_feeds.emplace_back(signals.modify.connect(
        [this, symbol](const LimitOrder& old, [[maybe_unused]] const LimitOrder& replacement) {
            log(symbol, "MODIFY", old);
        }));
}

//-------------------------------------------------------------------------

void BookEventLogger::log(std::string_view symbol, std::string_view event, const LimitOrder& order)
{
    m_logger->trace(
        "{},{},{},{},{},{},{}",
        m_simulation->currentTimestamp(),
        symbol,
        event,
        order.id(),
        order.direction(),
        order.limitPrice(),
        order.quantity());
    m_logger->flush();
}

//-------------------------------------------------------------------------

void BookEventLogger::log(std::string_view symbol, const Fill& fill)
{
    m_logger->trace(
        "{},{},FILL,{},{},{},{}",
        fill.time,
        symbol,
        fill.restingOrderId(),
        fill.aggressorDirection,
        fill.price,
        fill.quantity);
    m_logger->flush();
}

//-------------------------------------------------------------------------
