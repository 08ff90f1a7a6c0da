/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <pugixml.hpp>

#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace mktsim::util
{

//-------------------------------------------------------------------------

/**
 * Renders an integer amount of cents as dollars, e.g. 12345 -> "$123.45",
 * -5 -> "-$0.05".
 */
[[nodiscard]] std::string dollarize(Price cents);

struct Nodes
{
    pugi::xml_document doc;
    pugi::xml_node simulation;
};

[[nodiscard]] Nodes parseSimulationFile(const fs::path& path);

//-------------------------------------------------------------------------

}  // namespace mktsim::util

//-------------------------------------------------------------------------
