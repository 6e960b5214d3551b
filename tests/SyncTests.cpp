/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <array>
#include <gtest/gtest.h>

#include "gpibio/device.hpp"
#include "gpibio/loopback_bus.hpp"
#include "gpibio/sync.hpp"

using namespace gpibio;

namespace {
class SyncTests : public ::testing::Test {
protected:
    void SetUp() override {
        bus.attach(0, 1);
        auto opened = open(bus, "GPIB0::1::INSTR");
        ASSERT_TRUE(opened) << opened.error.toString();
        handle = opened.value;
    }

    void TearDown() override {
        if (handle.isOpen()) {
            EXPECT_TRUE(close(handle));
        }
    }

    LoopbackBus bus;
    DeviceHandle handle;
};
}

TEST_F(SyncTests, IdentifyQueryRoundTrips) {
    const std::string command = "*IDN?\r\n";
    auto written = ibwrt(handle, command);
    ASSERT_TRUE(written) << written.error.toString();
    EXPECT_EQ(written.value, command.size());

    std::array<char, 64> buffer{};
    auto read = ibrd(handle, buffer.data(), buffer.size());
    ASSERT_TRUE(read) << read.error.toString();
    EXPECT_EQ(std::string(buffer.data(), read.value), command);
}

TEST_F(SyncTests, ShortReadIsNotAnError) {
    ASSERT_TRUE(ibwrt(handle, std::string("0123456789")));

    std::array<char, 4> buffer{};
    auto first = ibrd(handle, buffer.data(), buffer.size());
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value, 4u);
    EXPECT_EQ(std::string(buffer.data(), 4), "0123");

    std::array<char, 64> rest{};
    auto second = ibrd(handle, rest.data(), rest.size());
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value, 6u);
}

TEST_F(SyncTests, ReadWithNothingQueuedTimesOut) {
    std::array<char, 8> buffer{};
    auto read = ibrd(handle, buffer.data(), buffer.size());
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error.kind, ErrorKind::Timeout);
}

TEST_F(SyncTests, BusFaultIsDeviceError) {
    bus.failNextCall(static_cast<int>(ErrorCode::EBUS));
    auto written = ibwrt(handle, std::string("x"));
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error.kind, ErrorKind::DeviceError);
    EXPECT_EQ(written.error.code, ErrorCode::EBUS);
}

TEST_F(SyncTests, ClosedHandleIsRejected) {
    ASSERT_TRUE(close(handle));

    auto written = ibwrt(handle, std::string("*RST\n"));
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error.kind, ErrorKind::HandleClosed);

    std::array<char, 8> buffer{};
    auto read = ibrd(handle, buffer.data(), buffer.size());
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error.kind, ErrorKind::HandleClosed);

    auto reply = query(handle, "*IDN?\n");
    ASSERT_FALSE(reply);
    EXPECT_EQ(reply.error.kind, ErrorKind::HandleClosed);
}

TEST_F(SyncTests, ReadAllCollectsChunksUntilEnd) {
    const std::string response(100, 'z');
    bus.queueResponse(0, 1, response);
    auto all = readAll(handle, 16);
    ASSERT_TRUE(all) << all.error.toString();
    EXPECT_EQ(all.value, response);
    EXPECT_TRUE(bus.pendingOutput(0, 1).empty());
}

TEST_F(SyncTests, ReadAllRejectsZeroChunk) {
    auto all = readAll(handle, 0);
    ASSERT_FALSE(all);
    EXPECT_EQ(all.error.kind, ErrorKind::InvalidArgument);
}

TEST_F(SyncTests, QueryWritesThenReads) {
    bus.queueResponse(0, 1, "KEITHLEY INSTRUMENTS,MODEL 2000\n");
    auto reply = query(handle, "*IDN?\n");
    ASSERT_TRUE(reply) << reply.error.toString();
    // the simulated instrument answers queued data first, then echoes
    EXPECT_EQ(reply.value, "KEITHLEY INSTRUMENTS,MODEL 2000\n*IDN?\n");
}
