/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gpibio/types.hpp"
#include <array>
#include <cstdio>

namespace gpibio {

namespace {
using std::chrono::microseconds;

// Indexed by TimeoutCode
const std::array<microseconds, 18> kTimeouts = {
    microseconds(0),
    microseconds(10), microseconds(30), microseconds(100), microseconds(300),
    microseconds(1'000), microseconds(3'000), microseconds(10'000), microseconds(30'000),
    microseconds(100'000), microseconds(300'000),
    microseconds(1'000'000), microseconds(3'000'000), microseconds(10'000'000),
    microseconds(30'000'000), microseconds(100'000'000), microseconds(300'000'000),
    microseconds(1'000'000'000)
};

const std::array<const char*, 18> kTimeoutNames = {
    "TNONE", "T10us", "T30us", "T100us", "T300us", "T1ms", "T3ms", "T10ms", "T30ms",
    "T100ms", "T300ms", "T1s", "T3s", "T10s", "T30s", "T100s", "T300s", "T1000s"
};
}

TimeoutCode timeoutCodeFor(std::chrono::microseconds duration) noexcept {
    if (duration.count() <= 0) {
        return TimeoutCode::TNONE;
    }
    for (std::size_t i = 1; i < kTimeouts.size(); ++i) {
        if (kTimeouts[i] >= duration) {
            return static_cast<TimeoutCode>(i);
        }
    }
    return TimeoutCode::T1000s;
}

std::chrono::microseconds timeoutDuration(TimeoutCode code) noexcept {
    auto index = static_cast<std::size_t>(code);
    return index < kTimeouts.size() ? kTimeouts[index] : kTimeouts.back();
}

const char* timeoutCodeName(TimeoutCode code) noexcept {
    auto index = static_cast<std::size_t>(code);
    return index < kTimeoutNames.size() ? kTimeoutNames[index] : "T?";
}

int EosMode::asMode() const noexcept {
    int mode = eosChar;
    if (terminateRead) mode |= REOS;
    if (assertEoiOnEos) mode |= XEOS;
    if (eightBitCompare) mode |= BIN;
    return mode;
}

std::string EosMode::toString() const {
    if (!terminateRead && !assertEoiOnEos && !eightBitCompare) {
        return "EosMode(none)";
    }
    char byte[8];
    std::snprintf(byte, sizeof(byte), "0x%02x", static_cast<unsigned>(eosChar));
    std::string text = "EosMode(" + std::string(byte);
    if (terminateRead) text += " REOS";
    if (assertEoiOnEos) text += " XEOS";
    if (eightBitCompare) text += " BIN";
    return text + ")";
}

const char* operationKindName(OperationKind kind) noexcept {
    return kind == OperationKind::Read ? "read" : "write";
}

const char* operationStateName(OperationState state) noexcept {
    switch (state) {
        case OperationState::InFlight: return "InFlight";
        case OperationState::Completed: return "Completed";
        case OperationState::Failed: return "Failed";
        case OperationState::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

}
