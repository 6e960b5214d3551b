/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "gpibio/bus.hpp"

namespace gpibio {

// Bus backed by libgpib. Status, error and count are read from the
// thread-local copies (ThreadIbsta/ThreadIberr/ThreadIbcntl) so concurrent
// callers on different threads never see each other's registers.
class LinuxGpibBus final : public Bus {
public:
    LinuxGpibBus() = default;

    LinuxGpibBus(const LinuxGpibBus&) = delete;
    LinuxGpibBus& operator=(const LinuxGpibBus&) = delete;

    BusReply open(int board, int pad, int sad, int tmo, int eot, int eos) override;
    BusReply offline(int ud) override;
    BusReply clear(int ud) override;
    BusReply write(int ud, const void* data, std::size_t length) override;
    BusReply read(int ud, void* buffer, std::size_t length) override;
    BusReply writeAsync(int ud, const void* data, std::size_t length) override;
    BusReply readAsync(int ud, void* buffer, std::size_t length) override;
    BusReply wait(int ud, int mask) override;
    BusReply stop(int ud) override;

    [[nodiscard]] std::string name() const override { return "linux-gpib"; }
};

}
