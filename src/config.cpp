/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gpibio/config.hpp"
#include "gpibio/logger.hpp"
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace gpibio {

std::size_t envSize(const char* name, std::size_t defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        // stoull would wrap "-1" around to SIZE_MAX
        if (std::strchr(val, '-') != nullptr) {
            Logger::warn(std::string("Ignoring negative ") + name + "=" + val);
            return defv;
        }
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        Logger::warn(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

BridgeConfig BridgeConfig::fromEnv() noexcept {
    BridgeConfig config;
    config.pollInterval = std::chrono::milliseconds(
        envSize("GPIBIO_POLL_INTERVAL_MS", static_cast<std::size_t>(kDefaultPollInterval.count())));
    config.readChunk = envSize("GPIBIO_READ_CHUNK", kDefaultReadChunk);
    return config;
}

std::string BridgeConfig::toString() const {
    return "BridgeConfig(poll=" + std::to_string(effectivePollInterval().count()) + "ms, chunk=" +
           std::to_string(effectiveReadChunk()) + ")";
}

}
