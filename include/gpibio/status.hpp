/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace gpibio {

// Snapshot of the ibsta register returned by every bus-control call.
// Bit positions match Linux-GPIB's ibsta_bit_numbers.
class StatusWord {
public:
    static constexpr uint32_t DCAS  = 1u << 0;
    static constexpr uint32_t DTAS  = 1u << 1;
    static constexpr uint32_t LACS  = 1u << 2;
    static constexpr uint32_t TACS  = 1u << 3;
    static constexpr uint32_t ATN   = 1u << 4;
    static constexpr uint32_t CIC   = 1u << 5;
    static constexpr uint32_t REM   = 1u << 6;
    static constexpr uint32_t LOK   = 1u << 7;
    static constexpr uint32_t CMPL  = 1u << 8;
    static constexpr uint32_t EVENT = 1u << 9;
    static constexpr uint32_t SPOLL = 1u << 10;
    static constexpr uint32_t RQS   = 1u << 11;
    static constexpr uint32_t SRQI  = 1u << 12;
    static constexpr uint32_t END   = 1u << 13;
    static constexpr uint32_t TIMO  = 1u << 14;
    static constexpr uint32_t ERR   = 1u << 15;

    constexpr StatusWord() noexcept = default;
    constexpr explicit StatusWord(uint32_t bits) noexcept : bits_(bits & 0xffffu) {}

    [[nodiscard]] static constexpr StatusWord fromIbsta(int ibsta) noexcept {
        return StatusWord(static_cast<uint32_t>(ibsta));
    }

    [[nodiscard]] constexpr uint32_t bits() const noexcept { return bits_; }
    [[nodiscard]] constexpr int asIbsta() const noexcept { return static_cast<int>(bits_); }
    [[nodiscard]] constexpr bool has(uint32_t flag) const noexcept { return (bits_ & flag) != 0; }

    [[nodiscard]] constexpr bool err() const noexcept { return has(ERR); }
    [[nodiscard]] constexpr bool timo() const noexcept { return has(TIMO); }
    [[nodiscard]] constexpr bool end() const noexcept { return has(END); }
    [[nodiscard]] constexpr bool cmpl() const noexcept { return has(CMPL); }
    [[nodiscard]] constexpr bool cic() const noexcept { return has(CIC); }
    [[nodiscard]] constexpr bool rqs() const noexcept { return has(RQS); }

    [[nodiscard]] constexpr StatusWord with(uint32_t flag) const noexcept { return StatusWord(bits_ | flag); }

    // "IbStatus(CMPL END)" or "IbStatus(No flag set)"
    [[nodiscard]] std::string toString() const;
    // One sentence per set flag, for error reports
    [[nodiscard]] std::string describe() const;

    constexpr bool operator==(const StatusWord& other) const noexcept { return bits_ == other.bits_; }
    constexpr bool operator!=(const StatusWord& other) const noexcept { return bits_ != other.bits_; }

private:
    uint32_t bits_ = 0;
};

}
