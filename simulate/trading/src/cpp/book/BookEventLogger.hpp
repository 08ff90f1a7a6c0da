/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Book.hpp"
#include "common.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <memory>

//-------------------------------------------------------------------------

class Simulation;

//-------------------------------------------------------------------------

/**
 * Writes every rest, fill, cancel and modify of the attached books to a CSV
 * file, one line per event.
 */
class BookEventLogger
{
public:
    BookEventLogger(const fs::path& filepath, const Simulation* simulation);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void attach(Book& book);

    static constexpr std::string_view s_header = "time,symbol,event,orderId,side,price,quantity";

private:
    void log(std::string_view symbol, std::string_view event, const LimitOrder& order);
    void log(std::string_view symbol, const Fill& fill);

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    const Simulation* m_simulation;
    std::vector<bs2::scoped_connection> m_feeds;
};

//-------------------------------------------------------------------------
