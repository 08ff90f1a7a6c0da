/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Simulation.hpp"
#include "common.hpp"
#include "util.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"MarketSimulator v1.0"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Simulation config file")
        ->required()
        ->check(CLI::ExistingFile);

    bool debug = false;
    app.add_flag("-d,--debug", debug, "Print every delivered message");

    CLI11_PARSE(app, argc, argv);

    fmt::print("{}\n", app.get_description());

    try {
        const auto nodes = mktsim::util::parseSimulationFile(config);
        auto simulation = Simulation::fromXML(nodes.simulation);
        if (debug) {
            simulation->setDebug(true);
            spdlog::set_level(spdlog::level::debug);
        }

        fmt::print(
            " - running {} agent(s) on {} book(s) from {} to {}\n",
            simulation->agents().size(),
            simulation->exchange().books().size(),
            simulation->startTimestamp(),
            simulation->endTimestamp());

        simulation->simulate();

        for (const auto& [symbol, book] : simulation->exchange().books()) {
            fmt::print(
                " - {}: {} resting order(s), best bid {}, best ask {}\n",
                symbol,
                book->orderCount(),
                book->bestBid().transform(mktsim::util::dollarize).value_or("-"),
                book->bestAsk().transform(mktsim::util::dollarize).value_or("-"));
        }
        fmt::print(" - simulation finished at {}, exiting\n", simulation->currentTimestamp());
    }
    catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}

//-------------------------------------------------------------------------
