/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gpibio/linux_bus.hpp"
#include "gpibio/logger.hpp"
#include <gpib/ib.h>

namespace gpibio {

namespace {
BusReply capture(int ud) {
    BusReply reply;
    reply.ud = ud;
    reply.status = StatusWord::fromIbsta(ThreadIbsta());
    reply.error = ThreadIberr();
    reply.count = ThreadIbcntl();
    return reply;
}

void trace(const char* call, int ud, const BusReply& reply) {
    LOG_TRACE(std::string(call) + "(" + std::to_string(ud) + ") -> " + reply.status.toString() +
              " iberr=" + std::to_string(reply.error) + " ibcntl=" + std::to_string(reply.count));
}
}

BusReply LinuxGpibBus::open(int board, int pad, int sad, int tmo, int eot, int eos) {
    int ud = ::ibdev(board, pad, sad, tmo, eot, eos);
    BusReply reply = capture(ud);
    LOG_DEBUG("ibdev(" + std::to_string(board) + ", " + std::to_string(pad) + ", " + std::to_string(sad) + ", " +
              std::to_string(tmo) + ", " + std::to_string(eot) + ", " + std::to_string(eos) + ") -> " +
              std::to_string(ud));
    return reply;
}

BusReply LinuxGpibBus::offline(int ud) {
    ::ibonl(ud, 0);
    BusReply reply = capture(ud);
    trace("ibonl", ud, reply);
    return reply;
}

BusReply LinuxGpibBus::clear(int ud) {
    ::ibclr(ud);
    BusReply reply = capture(ud);
    trace("ibclr", ud, reply);
    return reply;
}

BusReply LinuxGpibBus::write(int ud, const void* data, std::size_t length) {
    ::ibwrt(ud, data, static_cast<long>(length));
    BusReply reply = capture(ud);
    trace("ibwrt", ud, reply);
    return reply;
}

BusReply LinuxGpibBus::read(int ud, void* buffer, std::size_t length) {
    ::ibrd(ud, buffer, static_cast<long>(length));
    BusReply reply = capture(ud);
    trace("ibrd", ud, reply);
    return reply;
}

BusReply LinuxGpibBus::writeAsync(int ud, const void* data, std::size_t length) {
    ::ibwrta(ud, data, static_cast<long>(length));
    BusReply reply = capture(ud);
    trace("ibwrta", ud, reply);
    return reply;
}

BusReply LinuxGpibBus::readAsync(int ud, void* buffer, std::size_t length) {
    ::ibrda(ud, buffer, static_cast<long>(length));
    BusReply reply = capture(ud);
    trace("ibrda", ud, reply);
    return reply;
}

BusReply LinuxGpibBus::wait(int ud, int mask) {
    ::ibwait(ud, mask);
    BusReply reply = capture(ud);
    trace("ibwait", ud, reply);
    return reply;
}

BusReply LinuxGpibBus::stop(int ud) {
    ::ibstop(ud);
    BusReply reply = capture(ud);
    trace("ibstop", ud, reply);
    return reply;
}

}
