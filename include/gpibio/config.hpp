/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>

namespace gpibio {

struct BridgeConfig {
    static constexpr std::chrono::milliseconds kDefaultPollInterval{20};
    static constexpr std::chrono::milliseconds kMinPollInterval{1};
    static constexpr std::size_t kDefaultReadChunk = 1024;
    static constexpr std::size_t kMaxReadChunk = 1u << 20;

    std::chrono::milliseconds pollInterval = kDefaultPollInterval;
    std::size_t readChunk = kDefaultReadChunk;

    // GPIBIO_POLL_INTERVAL_MS, GPIBIO_READ_CHUNK
    [[nodiscard]] static BridgeConfig fromEnv() noexcept;

    // Interval actually used by the poll loop
    [[nodiscard]] std::chrono::milliseconds effectivePollInterval() const noexcept {
        return pollInterval < kMinPollInterval ? kMinPollInterval : pollInterval;
    }
    [[nodiscard]] std::size_t effectiveReadChunk() const noexcept {
        return readChunk == 0 ? kDefaultReadChunk : std::min(readChunk, kMaxReadChunk);
    }

    [[nodiscard]] std::string toString() const;
};

// Positive integer from the environment, or defv when unset/invalid/zero/negative
[[nodiscard]] std::size_t envSize(const char* name, std::size_t defv) noexcept;

}
