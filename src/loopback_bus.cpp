/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gpibio/loopback_bus.hpp"
#include "gpibio/error.hpp"
#include "gpibio/logger.hpp"
#include "gpibio/types.hpp"
#include <algorithm>
#include <cstring>
#include <thread>

namespace gpibio {

namespace {
constexpr int iberrOf(ErrorCode code) { return static_cast<int>(code); }

// The simulated board is always controller-in-charge
constexpr uint32_t kIdle = StatusWord::CIC | StatusWord::CMPL;
}

LoopbackBus::LoopbackBus(std::chrono::microseconds latency, int boards)
    : latency_(latency), boards_(boards) {
}

void LoopbackBus::attach(int board, int pad) {
    std::lock_guard<std::mutex> lock(mutex_);
    instruments_.emplace(Key{board, pad}, std::string());
}

void LoopbackBus::detach(int board, int pad) {
    std::lock_guard<std::mutex> lock(mutex_);
    instruments_.erase(Key{board, pad});
}

void LoopbackBus::setLatency(std::chrono::microseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_ = latency;
}

void LoopbackBus::failNextCall(int iberr) {
    std::lock_guard<std::mutex> lock(mutex_);
    callFault_ = iberr;
}

void LoopbackBus::failNextCompletion(int iberr) {
    std::lock_guard<std::mutex> lock(mutex_);
    completionFault_ = iberr;
}

void LoopbackBus::queueResponse(int board, int pad, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    instruments_[Key{board, pad}] += bytes;
}

std::size_t LoopbackBus::statusSamples(int ud) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = descriptors_.find(ud);
    return it == descriptors_.end() ? 0 : it->second.samples;
}

std::size_t LoopbackBus::stops(int ud) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = descriptors_.find(ud);
    return it == descriptors_.end() ? 0 : it->second.stops;
}

std::size_t LoopbackBus::openDescriptors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(descriptors_.begin(), descriptors_.end(),
        [](const auto& entry) { return entry.second.online; }));
}

bool LoopbackBus::asyncPending(int ud) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = descriptors_.find(ud);
    return it != descriptors_.end() && it->second.pending.has_value();
}

std::string LoopbackBus::pendingOutput(int board, int pad) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instruments_.find(Key{board, pad});
    return it == instruments_.end() ? std::string() : it->second;
}

BusReply LoopbackBus::failure(int ud, int iberr, uint32_t extra) const {
    BusReply reply;
    reply.ud = ud;
    reply.status = StatusWord(StatusWord::ERR | StatusWord::CIC | extra);
    reply.error = iberr;
    return reply;
}

BusReply LoopbackBus::latched(int ud, const Descriptor& desc) const {
    BusReply reply;
    reply.ud = ud;
    reply.status = desc.status;
    reply.error = desc.error;
    reply.count = desc.count;
    return reply;
}

bool LoopbackBus::takeFault(int& iberr) {
    if (!callFault_) {
        return false;
    }
    iberr = *callFault_;
    callFault_.reset();
    return true;
}

std::size_t LoopbackBus::transferOut(const Key& key, char* destination, std::size_t length, bool& end) {
    auto& queued = instruments_[key];
    std::size_t n = std::min(length, queued.size());
    if (n > 0) {
        std::memcpy(destination, queued.data(), n);
        queued.erase(0, n);
    }
    end = queued.empty();
    return n;
}

void LoopbackBus::advance(Descriptor& desc, Clock::time_point now) {
    if (!desc.pending || now < desc.pending->readyAt) {
        return;
    }
    AsyncRequest& request = *desc.pending;

    if (request.fault) {
        desc.status = StatusWord(kIdle | StatusWord::ERR);
        desc.error = *request.fault;
        desc.count = 0;
        desc.pending.reset();
        return;
    }

    if (request.write) {
        if (instruments_.count(desc.instrument) == 0) {
            desc.status = StatusWord(kIdle | StatusWord::ERR);
            desc.error = iberrOf(ErrorCode::ENOL);
            desc.count = 0;
        } else {
            instruments_[desc.instrument].append(request.source, request.length);
            desc.status = StatusWord(kIdle);
            desc.error = 0;
            desc.count = static_cast<long>(request.length);
        }
        desc.pending.reset();
        return;
    }

    auto it = instruments_.find(desc.instrument);
    if (it != instruments_.end() && !it->second.empty()) {
        bool end = false;
        std::size_t n = transferOut(desc.instrument, request.destination, request.length, end);
        desc.status = StatusWord(kIdle | (end ? StatusWord::END : 0u));
        desc.error = 0;
        desc.count = static_cast<long>(n);
        desc.pending.reset();
        return;
    }

    auto timeout = timeoutDuration(static_cast<TimeoutCode>(desc.tmo));
    if (timeout.count() > 0 && now >= request.issued + timeout) {
        desc.status = StatusWord(kIdle | StatusWord::ERR | StatusWord::TIMO);
        desc.error = iberrOf(ErrorCode::EABO);
        desc.count = 0;
        desc.pending.reset();
    }
}

void LoopbackBus::sleepLatency() const {
    std::chrono::microseconds latency;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latency = latency_;
    }
    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }
}

BusReply LoopbackBus::open(int board, int pad, int sad, int tmo, int /*eot*/, int /*eos*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    int iberr = 0;
    if (takeFault(iberr)) {
        return failure(-1, iberr);
    }
    if (board < 0 || board >= boards_) {
        return failure(-1, iberrOf(ErrorCode::ENEB));
    }
    if (pad < 0 || pad > 30 || (sad != 0 && (sad < 0x60 || sad > 0x7e)) || tmo < 0 || tmo > 17) {
        return failure(-1, iberrOf(ErrorCode::EARG));
    }

    int ud = nextUd_++;
    Descriptor desc;
    desc.instrument = Key{board, pad};
    desc.tmo = tmo;
    desc.status = StatusWord(kIdle);
    descriptors_[ud] = desc;

    BusReply reply = latched(ud, descriptors_[ud]);
    return reply;
}

BusReply LoopbackBus::offline(int ud) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = descriptors_.find(ud);
    if (it == descriptors_.end() || !it->second.online) {
        return failure(ud, iberrOf(ErrorCode::EARG));
    }
    if (it->second.pending) {
        return failure(ud, iberrOf(ErrorCode::EOIP));
    }
    it->second.online = false;
    return latched(ud, it->second);
}

BusReply LoopbackBus::clear(int ud) {
    std::lock_guard<std::mutex> lock(mutex_);
    int iberr = 0;
    if (takeFault(iberr)) {
        return failure(ud, iberr);
    }
    auto it = descriptors_.find(ud);
    if (it == descriptors_.end() || !it->second.online) {
        return failure(ud, iberrOf(ErrorCode::EARG));
    }
    auto instrument = instruments_.find(it->second.instrument);
    if (instrument == instruments_.end()) {
        return failure(ud, iberrOf(ErrorCode::ENOL));
    }
    instrument->second.clear();
    return latched(ud, it->second);
}

BusReply LoopbackBus::write(int ud, const void* data, std::size_t length) {
    sleepLatency();
    std::lock_guard<std::mutex> lock(mutex_);
    int iberr = 0;
    if (takeFault(iberr)) {
        return failure(ud, iberr);
    }
    auto it = descriptors_.find(ud);
    if (it == descriptors_.end() || !it->second.online) {
        return failure(ud, iberrOf(ErrorCode::EARG));
    }
    Descriptor& desc = it->second;
    if (desc.pending) {
        return failure(ud, iberrOf(ErrorCode::EOIP));
    }
    auto instrument = instruments_.find(desc.instrument);
    if (instrument == instruments_.end()) {
        return failure(ud, iberrOf(ErrorCode::ENOL));
    }
    instrument->second.append(static_cast<const char*>(data), length);
    desc.status = StatusWord(kIdle);
    desc.error = 0;
    desc.count = static_cast<long>(length);
    return latched(ud, desc);
}

BusReply LoopbackBus::read(int ud, void* buffer, std::size_t length) {
    sleepLatency();
    std::lock_guard<std::mutex> lock(mutex_);
    int iberr = 0;
    if (takeFault(iberr)) {
        return failure(ud, iberr);
    }
    auto it = descriptors_.find(ud);
    if (it == descriptors_.end() || !it->second.online) {
        return failure(ud, iberrOf(ErrorCode::EARG));
    }
    Descriptor& desc = it->second;
    if (desc.pending) {
        return failure(ud, iberrOf(ErrorCode::EOIP));
    }
    auto instrument = instruments_.find(desc.instrument);
    if (instrument == instruments_.end() || instrument->second.empty()) {
        // a real board would block for the full TMO before reporting this
        desc.status = StatusWord(kIdle | StatusWord::ERR | StatusWord::TIMO);
        desc.error = iberrOf(ErrorCode::EABO);
        desc.count = 0;
        return latched(ud, desc);
    }
    bool end = false;
    std::size_t n = transferOut(desc.instrument, static_cast<char*>(buffer), length, end);
    desc.status = StatusWord(kIdle | (end ? StatusWord::END : 0u));
    desc.error = 0;
    desc.count = static_cast<long>(n);
    return latched(ud, desc);
}

BusReply LoopbackBus::writeAsync(int ud, const void* data, std::size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    int iberr = 0;
    if (takeFault(iberr)) {
        return failure(ud, iberr);
    }
    auto it = descriptors_.find(ud);
    if (it == descriptors_.end() || !it->second.online) {
        return failure(ud, iberrOf(ErrorCode::EARG));
    }
    Descriptor& desc = it->second;
    if (desc.pending) {
        return failure(ud, iberrOf(ErrorCode::EOIP));
    }

    AsyncRequest request;
    request.write = true;
    request.source = static_cast<const char*>(data);
    request.length = length;
    request.issued = Clock::now();
    request.readyAt = request.issued + latency_;
    request.fault = completionFault_;
    completionFault_.reset();

    desc.pending = request;
    desc.status = StatusWord(StatusWord::CIC);
    desc.error = 0;
    desc.count = 0;
    return latched(ud, desc);
}

BusReply LoopbackBus::readAsync(int ud, void* buffer, std::size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    int iberr = 0;
    if (takeFault(iberr)) {
        return failure(ud, iberr);
    }
    auto it = descriptors_.find(ud);
    if (it == descriptors_.end() || !it->second.online) {
        return failure(ud, iberrOf(ErrorCode::EARG));
    }
    Descriptor& desc = it->second;
    if (desc.pending) {
        return failure(ud, iberrOf(ErrorCode::EOIP));
    }

    AsyncRequest request;
    request.destination = static_cast<char*>(buffer);
    request.length = length;
    request.issued = Clock::now();
    request.readyAt = request.issued + latency_;
    request.fault = completionFault_;
    completionFault_.reset();

    desc.pending = request;
    desc.status = StatusWord(StatusWord::CIC);
    desc.error = 0;
    desc.count = 0;
    return latched(ud, desc);
}

BusReply LoopbackBus::wait(int ud, int mask) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = descriptors_.find(ud);
    if (it == descriptors_.end() || !it->second.online) {
        return failure(ud, iberrOf(ErrorCode::EARG));
    }
    if (mask != 0) {
        // only the non-blocking sample is simulated
        return failure(ud, iberrOf(ErrorCode::ECAP));
    }
    Descriptor& desc = it->second;
    ++desc.samples;
    advance(desc, Clock::now());
    return latched(ud, desc);
}

BusReply LoopbackBus::stop(int ud) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = descriptors_.find(ud);
    if (it == descriptors_.end() || !it->second.online) {
        return failure(ud, iberrOf(ErrorCode::EARG));
    }
    Descriptor& desc = it->second;
    ++desc.stops;

    // a request whose deadline already passed has completed on the bus
    advance(desc, Clock::now());
    if (!desc.pending) {
        return latched(ud, desc);
    }

    desc.pending.reset();
    desc.status = StatusWord(kIdle | StatusWord::ERR);
    desc.error = iberrOf(ErrorCode::EABO);
    desc.count = 0;
    LOG_DEBUG("loopback: aborted asynchronous request on ud " + std::to_string(ud));
    return latched(ud, desc);
}

}
