/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>

#include "gpibio/status.hpp"

namespace gpibio {

// ibsta / iberr / ibcntl captured immediately after one native call.
// ud is only meaningful for Bus::open().
struct BusReply {
    int ud = -1;
    StatusWord status;
    int error = 0;
    long count = 0;
};

// Boundary to the native bus-control library (Linux-GPIB traditional API).
// Implementations must be callable from any thread; the asynchronous
// variants return as soon as the request is queued and leave completion to
// be discovered through wait(ud, 0).
class Bus {
public:
    virtual ~Bus() = default;

    // ibdev(board, pad, sad, tmo, eot, eos)
    virtual BusReply open(int board, int pad, int sad, int tmo, int eot, int eos) = 0;
    // ibonl(ud, 0)
    virtual BusReply offline(int ud) = 0;
    // ibclr(ud)
    virtual BusReply clear(int ud) = 0;

    virtual BusReply write(int ud, const void* data, std::size_t length) = 0;
    virtual BusReply read(int ud, void* buffer, std::size_t length) = 0;

    // buffers must stay valid until completion or stop()
    virtual BusReply writeAsync(int ud, const void* data, std::size_t length) = 0;
    virtual BusReply readAsync(int ud, void* buffer, std::size_t length) = 0;

    // ibwait(ud, mask); mask 0 samples the status without blocking
    virtual BusReply wait(int ud, int mask) = 0;
    // ibstop(ud)
    virtual BusReply stop(int ud) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

}
