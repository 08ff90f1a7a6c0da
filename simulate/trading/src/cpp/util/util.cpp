/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "util.hpp"


//-------------------------------------------------------------------------

namespace mktsim::util
{

//-------------------------------------------------------------------------

std::string dollarize(Price cents)
{
    const uint64_t magnitude = cents < 0
        ? uint64_t{0} - static_cast<uint64_t>(cents)
        : static_cast<uint64_t>(cents);
    return fmt::format("{}${}.{:02}", cents < 0 ? "-" : "", magnitude / 100, magnitude % 100);
}

//-------------------------------------------------------------------------

Nodes parseSimulationFile(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    Nodes nodes;
    if (pugi::xml_parse_result parseResult = nodes.doc.load_file(path.c_str()); !parseResult) {
        throw std::invalid_argument{fmt::format(
            "{}: could not parse '{}': {}", ctx, path.string(), parseResult.description())};
    }

    nodes.simulation = nodes.doc.child("Simulation");
    if (!nodes.simulation) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' has no root node 'Simulation'", ctx, path.string())};
    }

    return nodes;
}

//-------------------------------------------------------------------------

}  // namespace mktsim::util

//-------------------------------------------------------------------------
