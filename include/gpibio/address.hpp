/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>

#include "gpibio/error.hpp"

namespace gpibio {

// Board index plus primary/secondary address of one instrument
struct Address {
    static constexpr int kMaxAddress = 30;
    static constexpr int kSadOffset = 0x60;

    int board = 0;
    int primary = 0;
    std::optional<int> secondary;

    // Accepts "GPIB[n]::pad[::sad][::INSTR]", case-insensitive prefix/suffix
    [[nodiscard]] static Result<Address> parse(const std::string& resource);
    [[nodiscard]] static Result<Address> make(int board, int primary, std::optional<int> secondary = std::nullopt);

    // ibdev() arguments
    [[nodiscard]] int pad() const noexcept { return primary; }
    [[nodiscard]] int sad() const noexcept { return secondary ? kSadOffset + *secondary : 0; }

    [[nodiscard]] std::string visaString() const;
};

}
