/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gpibio {

// Native TMO codes accepted by ibdev()/ibtmo()
enum class TimeoutCode : uint8_t {
    TNONE = 0,
    T10us, T30us, T100us, T300us,
    T1ms, T3ms, T10ms, T30ms, T100ms, T300ms,
    T1s, T3s, T10s, T30s, T100s, T300s, T1000s
};

// Smallest TMO code whose duration covers the requested one; zero means
// no timeout and anything beyond 1000 s saturates.
[[nodiscard]] TimeoutCode timeoutCodeFor(std::chrono::microseconds duration) noexcept;
[[nodiscard]] std::chrono::microseconds timeoutDuration(TimeoutCode code) noexcept;
[[nodiscard]] const char* timeoutCodeName(TimeoutCode code) noexcept;

// End-of-string configuration passed as the ibdev() eos argument
struct EosMode {
    static constexpr int REOS = 0x400;  // terminate reads on the eos byte
    static constexpr int XEOS = 0x800;  // assert EOI when the eos byte is written
    static constexpr int BIN  = 0x1000; // compare all 8 bits

    uint8_t eosChar = 0;
    bool terminateRead = false;
    bool assertEoiOnEos = false;
    bool eightBitCompare = false;

    [[nodiscard]] int asMode() const noexcept;
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] static EosMode none() noexcept { return {}; }
    [[nodiscard]] static EosMode readUntil(uint8_t c) noexcept {
        EosMode mode;
        mode.eosChar = c;
        mode.terminateRead = true;
        return mode;
    }
};

struct OpenParams {
    std::optional<int> boardOverride;
    std::chrono::microseconds timeout = std::chrono::seconds(1);
    EosMode eosMode;
    bool sendEoi = true;
    bool clearOnOpen = true;
};

enum class OperationKind : uint8_t { Read, Write };

// Resolution state of a pending non-blocking operation
enum class OperationState : uint8_t { InFlight, Completed, Failed, Cancelled };

[[nodiscard]] const char* operationKindName(OperationKind kind) noexcept;
[[nodiscard]] const char* operationStateName(OperationState state) noexcept;

}
