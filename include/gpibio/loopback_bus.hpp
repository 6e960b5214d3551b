/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "gpibio/bus.hpp"

namespace gpibio {

// Simulated bus whose attached instruments echo back every byte written to
// them. Asynchronous requests complete after a configurable latency and
// their completion is latched: it is applied (data copied, CMPL set) by the
// first status sample taken after the deadline, and stays visible until the
// next request on that descriptor.
class LoopbackBus final : public Bus {
public:
    using Clock = std::chrono::steady_clock;

    explicit LoopbackBus(std::chrono::microseconds latency = std::chrono::microseconds(0), int boards = 1);

    LoopbackBus(const LoopbackBus&) = delete;
    LoopbackBus& operator=(const LoopbackBus&) = delete;

    // Instrument listening at board/pad (any secondary address)
    void attach(int board, int pad);
    void detach(int board, int pad);

    void setLatency(std::chrono::microseconds latency);
    // The next call that touches the bus fails immediately with iberr
    void failNextCall(int iberr);
    // The next asynchronous request completes with ERR and iberr
    void failNextCompletion(int iberr);
    // Bytes the instrument at board/pad will answer with, ahead of any echo
    void queueResponse(int board, int pad, const std::string& bytes);

    [[nodiscard]] std::size_t statusSamples(int ud) const;
    [[nodiscard]] std::size_t stops(int ud) const;
    [[nodiscard]] std::size_t openDescriptors() const;
    [[nodiscard]] bool asyncPending(int ud) const;
    [[nodiscard]] std::string pendingOutput(int board, int pad) const;

    BusReply open(int board, int pad, int sad, int tmo, int eot, int eos) override;
    BusReply offline(int ud) override;
    BusReply clear(int ud) override;
    BusReply write(int ud, const void* data, std::size_t length) override;
    BusReply read(int ud, void* buffer, std::size_t length) override;
    BusReply writeAsync(int ud, const void* data, std::size_t length) override;
    BusReply readAsync(int ud, void* buffer, std::size_t length) override;
    BusReply wait(int ud, int mask) override;
    BusReply stop(int ud) override;

    [[nodiscard]] std::string name() const override { return "loopback"; }

private:
    using Key = std::pair<int, int>;

    struct AsyncRequest {
        bool write = false;
        const char* source = nullptr;
        char* destination = nullptr;
        std::size_t length = 0;
        Clock::time_point issued;
        Clock::time_point readyAt;
        std::optional<int> fault;
    };

    struct Descriptor {
        Key instrument;
        bool online = true;
        int tmo = 0;
        StatusWord status;
        int error = 0;
        long count = 0;
        std::optional<AsyncRequest> pending;
        std::size_t samples = 0;
        std::size_t stops = 0;
    };

    BusReply failure(int ud, int iberr, uint32_t extra = 0) const;
    BusReply latched(int ud, const Descriptor& desc) const;
    bool takeFault(int& iberr);
    void advance(Descriptor& desc, Clock::time_point now);
    std::size_t transferOut(const Key& key, char* destination, std::size_t length, bool& end);
    void sleepLatency() const;

    mutable std::mutex mutex_;
    std::chrono::microseconds latency_;
    int boards_;
    int nextUd_ = 0;
    std::map<Key, std::string> instruments_;
    std::map<int, Descriptor> descriptors_;
    std::optional<int> callFault_;
    std::optional<int> completionFault_;
};

}
