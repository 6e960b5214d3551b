/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gpibio/status.hpp"
#include <array>

namespace gpibio {

namespace {
struct FlagInfo {
    uint32_t flag;
    const char* name;
    const char* description;
};

constexpr std::array<FlagInfo, 16> kFlags = {{
    {StatusWord::DCAS, "DCAS", "device clear"},
    {StatusWord::DTAS, "DTAS", "device trigger"},
    {StatusWord::LACS, "LACS", "board is currently addressed as a listener"},
    {StatusWord::TACS, "TACS", "board is currently addressed as a talker"},
    {StatusWord::ATN, "ATN", "ATN line is asserted"},
    {StatusWord::CIC, "CIC", "board is controller-in-charge, able to set the ATN line"},
    {StatusWord::REM, "REM", "board is in 'remote' state"},
    {StatusWord::LOK, "LOK", "board is in 'lockout' state"},
    {StatusWord::CMPL, "CMPL", "I/O operation complete"},
    {StatusWord::EVENT, "EVENT", "one or more clear, trigger, or interface clear event received"},
    {StatusWord::SPOLL, "SPOLL", "board is serial polled"},
    {StatusWord::RQS, "RQS", "device has requested service"},
    {StatusWord::SRQI, "SRQI", "a device connected to the board is asserting the SRQ line"},
    {StatusWord::END, "END", "last I/O operation ended with the EOI line asserted"},
    {StatusWord::TIMO, "TIMO", "last I/O operation, or ibwait, timed out"},
    {StatusWord::ERR, "ERR", "last function call failed"},
}};
}

std::string StatusWord::toString() const {
    std::string flags;
    for (const auto& info : kFlags) {
        if (has(info.flag)) {
            if (!flags.empty()) flags += ' ';
            flags += info.name;
        }
    }
    return "IbStatus(" + (flags.empty() ? std::string("No flag set") : flags) + ")";
}

std::string StatusWord::describe() const {
    std::string text;
    for (const auto& info : kFlags) {
        if (has(info.flag)) {
            if (!text.empty()) text += "; ";
            text += std::string(info.name) + " (" + info.description + ")";
        }
    }
    return text.empty() ? "No flag set" : text;
}

}
