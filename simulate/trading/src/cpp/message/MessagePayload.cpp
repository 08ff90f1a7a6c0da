/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "mktsim/message/MessagePayload.hpp"

//-------------------------------------------------------------------------

std::string WakeupPayload::toString() const
{
    return tag ? fmt::format("{{tag: {}}}", *tag) : "{}";
}

//-------------------------------------------------------------------------
