/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <chrono>
#include <functional>
#include <future>
#include <gtest/gtest.h>
#include <limits>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_future.hpp>

#include "gpibio/async.hpp"
#include "gpibio/device.hpp"
#include "gpibio/loopback_bus.hpp"
#include "gpibio/sync.hpp"

using namespace gpibio;
using namespace std::chrono_literals;

namespace {
constexpr auto kRunLimit = std::chrono::seconds(5);

BridgeConfig fastPolling(std::chrono::milliseconds interval = 2ms, std::size_t chunk = 1024) {
    BridgeConfig config;
    config.pollInterval = interval;
    config.readChunk = chunk;
    return config;
}

class PollingBridgeTests : public ::testing::Test {
protected:
    void SetUp() override {
        bus.attach(0, 1);
        handle = openDevice();
    }

    void TearDown() override {
        if (handle.isOpen()) {
            EXPECT_TRUE(close(handle));
        }
    }

    DeviceHandle openDevice(const OpenParams& params = {}) {
        auto opened = open(bus, "GPIB0::1::INSTR", params);
        EXPECT_TRUE(opened) << opened.error.toString();
        return opened.value;
    }

    void run() {
        io.restart();
        io.run_for(kRunLimit);
    }

    boost::asio::io_context io;
    LoopbackBus bus;
    DeviceHandle handle;
};
}

TEST_F(PollingBridgeTests, IdentifyQueryRoundTrips) {
    bus.setLatency(5ms);
    PollingBridge bridge(io.get_executor(), fastPolling());
    const std::string command = "*IDN?\r\n";

    std::optional<Outcome> written;
    std::optional<Result<std::string>> read;
    bridge.asyncWrite(handle, command, [&](Outcome result) {
        written = result;
        bridge.asyncRead(handle, [&](Result<std::string> reply) { read = std::move(reply); });
    });
    run();

    ASSERT_TRUE(written.has_value());
    EXPECT_TRUE(*written) << written->error.toString();
    ASSERT_TRUE(read.has_value());
    ASSERT_TRUE(*read) << read->error.toString();
    EXPECT_EQ(read->value, command);
    EXPECT_FALSE(handle.busy());
}

TEST_F(PollingBridgeTests, AsyncQueryChainsWriteAndRead) {
    bus.setLatency(3ms);
    PollingBridge bridge(io.get_executor(), fastPolling());

    std::optional<Result<std::string>> reply;
    bridge.asyncQuery(handle, "MEAS:VOLT?\n", [&](Result<std::string> result) { reply = std::move(result); });
    run();

    ASSERT_TRUE(reply.has_value());
    ASSERT_TRUE(*reply) << reply->error.toString();
    EXPECT_EQ(reply->value, "MEAS:VOLT?\n");
    EXPECT_EQ(bridge.stats().started.load(), 2u);
    EXPECT_EQ(bridge.stats().completed.load(), 2u);
}

TEST_F(PollingBridgeTests, SecondOperationIsRejectedWithoutDisturbingFirst) {
    bus.setLatency(30ms);
    bus.queueResponse(0, 1, "first");
    PollingBridge bridge(io.get_executor(), fastPolling());

    std::optional<Result<std::string>> first;
    std::optional<Outcome> second;
    bridge.asyncRead(handle, [&](Result<std::string> result) { first = std::move(result); });
    EXPECT_TRUE(handle.busy());
    bridge.asyncWrite(handle, "*RST\n", [&](Outcome result) {
        second = result;
        // the rejection arrives while the first request is still pending
        EXPECT_FALSE(first.has_value());
    });
    run();

    ASSERT_TRUE(second.has_value());
    ASSERT_FALSE(*second);
    EXPECT_EQ(second->error.kind, ErrorKind::OperationInProgress);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(*first) << first->error.toString();
    EXPECT_EQ(first->value, "first");
    EXPECT_TRUE(bus.pendingOutput(0, 1).empty());
}

TEST_F(PollingBridgeTests, BlockingCallsRefusedWhileRequestInFlight) {
    bus.setLatency(20ms);
    PollingBridge bridge(io.get_executor(), fastPolling());

    std::optional<Outcome> written;
    bridge.asyncWrite(handle, "*CLS\n", [&](Outcome result) { written = result; });

    auto blocked = ibwrt(handle, std::string("*RST\n"));
    ASSERT_FALSE(blocked);
    EXPECT_EQ(blocked.error.kind, ErrorKind::OperationInProgress);

    run();
    ASSERT_TRUE(written.has_value());
    EXPECT_TRUE(*written);
    EXPECT_EQ(bus.pendingOutput(0, 1), "*CLS\n");
}

TEST_F(PollingBridgeTests, CancelledReadLeavesBufferAndHandleUsable) {
    bus.setLatency(10s);
    bus.queueResponse(0, 1, "late data");
    PollingBridge bridge(io.get_executor(), fastPolling());

    std::optional<Result<std::string>> read;
    bridge.asyncRead(handle, [&](Result<std::string> result) { read = std::move(result); });

    boost::asio::steady_timer canceller(io, 20ms);
    bool requested = false;
    canceller.async_wait([&](const boost::system::error_code&) { requested = handle.cancel(); });
    run();

    EXPECT_TRUE(requested);
    ASSERT_TRUE(read.has_value());
    ASSERT_FALSE(*read);
    EXPECT_TRUE(read->cancelled());
    EXPECT_TRUE(read->value.empty());
    EXPECT_EQ(bus.stops(handle.ud()), 1u);
    EXPECT_FALSE(bus.asyncPending(handle.ud()));
    EXPECT_FALSE(handle.busy());
    EXPECT_TRUE(handle.isOpen());
    // the aborted transfer consumed nothing
    EXPECT_EQ(bus.pendingOutput(0, 1), "late data");
    EXPECT_EQ(bridge.stats().cancelled.load(), 1u);

    bus.setLatency(1ms);
    std::optional<Result<std::string>> again;
    bridge.asyncRead(handle, [&](Result<std::string> result) { again = std::move(result); });
    run();

    ASSERT_TRUE(again.has_value());
    ASSERT_TRUE(*again) << again->error.toString();
    EXPECT_EQ(again->value, "late data");
}

TEST_F(PollingBridgeTests, CancelAfterBusCompletionReportsRealResult) {
    // zero latency: the request has finished on the bus before the first poll
    bus.queueResponse(0, 1, "done");
    PollingBridge bridge(io.get_executor(), fastPolling());

    std::optional<Result<std::string>> read;
    bridge.asyncRead(handle, [&](Result<std::string> result) { read = std::move(result); });
    EXPECT_TRUE(handle.cancel());
    run();

    ASSERT_TRUE(read.has_value());
    ASSERT_TRUE(*read) << read->error.toString();
    EXPECT_EQ(read->value, "done");
    EXPECT_EQ(bus.stops(handle.ud()), 1u);
}

TEST_F(PollingBridgeTests, CancelledWriteReportsCancelled) {
    bus.setLatency(10s);
    PollingBridge bridge(io.get_executor(), fastPolling());

    std::optional<Outcome> written;
    bridge.asyncWrite(handle, "VOLT 5\n", [&](Outcome result) { written = result; });
    EXPECT_TRUE(handle.cancel());
    run();

    ASSERT_TRUE(written.has_value());
    EXPECT_TRUE(written->cancelled());
    EXPECT_TRUE(bus.pendingOutput(0, 1).empty());
}

TEST_F(PollingBridgeTests, CloseDuringFlightReportsHandleClosed) {
    bus.setLatency(10s);
    PollingBridge bridge(io.get_executor(), fastPolling());

    std::optional<Result<std::string>> read;
    bridge.asyncRead(handle, [&](Result<std::string> result) { read = std::move(result); });
    ASSERT_TRUE(close(handle));
    EXPECT_EQ(bus.openDescriptors(), 0u);
    run();

    ASSERT_TRUE(read.has_value());
    ASSERT_FALSE(*read);
    EXPECT_EQ(read->error.kind, ErrorKind::HandleClosed);
    EXPECT_FALSE(handle.busy());
}

TEST_F(PollingBridgeTests, ClosedHandleRejectsEveryOperation) {
    ASSERT_TRUE(close(handle));
    PollingBridge bridge(io.get_executor(), fastPolling());

    std::optional<Outcome> written;
    std::optional<Result<std::string>> read;
    std::optional<Result<std::string>> queried;
    bridge.asyncWrite(handle, "*RST\n", [&](Outcome result) { written = result; });
    bridge.asyncRead(handle, [&](Result<std::string> result) { read = std::move(result); });
    bridge.asyncQuery(handle, "*IDN?\n", [&](Result<std::string> result) { queried = std::move(result); });
    run();

    ASSERT_TRUE(written && read && queried);
    EXPECT_EQ(written->error.kind, ErrorKind::HandleClosed);
    EXPECT_EQ(read->error.kind, ErrorKind::HandleClosed);
    EXPECT_EQ(queried->error.kind, ErrorKind::HandleClosed);
    EXPECT_FALSE(handle.cancel());
    EXPECT_EQ(bridge.stats().samples.load(), 0u);
}

TEST_F(PollingBridgeTests, DefaultHandleIsRejected) {
    PollingBridge bridge(io.get_executor(), fastPolling());
    std::optional<Result<std::string>> read;
    bridge.asyncRead(DeviceHandle(), [&](Result<std::string> result) { read = std::move(result); });
    run();

    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->error.kind, ErrorKind::HandleClosed);
}

TEST_F(PollingBridgeTests, SampleCountBoundedByDurationOverInterval) {
    constexpr auto latency = 100ms;
    constexpr auto interval = 10ms;
    bus.setLatency(latency);
    PollingBridge bridge(io.get_executor(), fastPolling(interval));

    std::optional<Outcome> written;
    auto started = std::chrono::steady_clock::now();
    bridge.asyncWrite(handle, "INIT\n", [&](Outcome result) { written = result; });
    run();
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(written.has_value());
    EXPECT_TRUE(*written);

    auto samples = bridge.stats().samples.load();
    EXPECT_EQ(samples, bus.statusSamples(handle.ud()));
    EXPECT_GE(samples, 1u);
    EXPECT_LE(samples, static_cast<std::size_t>(elapsed / interval) + 2);
    EXPECT_LE(samples, static_cast<std::size_t>(latency / interval) + 3);
}

TEST_F(PollingBridgeTests, OtherWorkRunsWhileRequestPending) {
    bus.setLatency(60ms);
    PollingBridge bridge(io.get_executor(), fastPolling(5ms));

    std::optional<Outcome> written;
    bridge.asyncWrite(handle, "INIT\n", [&](Outcome result) { written = result; });

    int ticks = 0;
    boost::asio::steady_timer ticker(io);
    std::function<void()> tick = [&]() {
        ticker.expires_after(10ms);
        ticker.async_wait([&](const boost::system::error_code& ec) {
            if (ec || written) return;
            ++ticks;
            tick();
        });
    };
    tick();
    run();

    ASSERT_TRUE(written.has_value());
    EXPECT_TRUE(*written);
    EXPECT_GE(ticks, 2);
}

TEST_F(PollingBridgeTests, ReadWithoutResponseTimesOut) {
    ASSERT_TRUE(close(handle));
    OpenParams params;
    params.timeout = 10ms;
    handle = openDevice(params);
    PollingBridge bridge(io.get_executor(), fastPolling(1ms));

    std::optional<Result<std::string>> read;
    bridge.asyncRead(handle, [&](Result<std::string> result) { read = std::move(result); });
    run();

    ASSERT_TRUE(read.has_value());
    ASSERT_FALSE(*read);
    EXPECT_EQ(read->error.kind, ErrorKind::Timeout);
    EXPECT_TRUE(read->error.status.timo());
    EXPECT_FALSE(handle.busy());
    EXPECT_EQ(bridge.stats().failed.load(), 1u);
}

TEST_F(PollingBridgeTests, LongResponseIsReadInChunks) {
    std::string response;
    for (int i = 0; i < 10; ++i) {
        response += "+1.2345" + std::to_string(i) + "E-03,";
    }
    response += "\n";
    bus.queueResponse(0, 1, response);
    PollingBridge bridge(io.get_executor(), fastPolling(1ms, 16));

    std::optional<Result<std::string>> read;
    bridge.asyncRead(handle, [&](Result<std::string> result) { read = std::move(result); });
    run();

    ASSERT_TRUE(read.has_value());
    ASSERT_TRUE(*read) << read->error.toString();
    EXPECT_EQ(read->value, response);
    EXPECT_GE(bus.statusSamples(handle.ud()), response.size() / 16);
}

TEST_F(PollingBridgeTests, CompletionErrorIsDecoded) {
    bus.setLatency(2ms);
    bus.failNextCompletion(static_cast<int>(ErrorCode::EBUS));
    PollingBridge bridge(io.get_executor(), fastPolling());

    std::optional<Outcome> written;
    bridge.asyncWrite(handle, "*TRG\n", [&](Outcome result) { written = result; });
    run();

    ASSERT_TRUE(written.has_value());
    ASSERT_FALSE(*written);
    EXPECT_EQ(written->error.kind, ErrorKind::DeviceError);
    EXPECT_EQ(written->error.code, ErrorCode::EBUS);
    EXPECT_FALSE(handle.busy());
}

TEST_F(PollingBridgeTests, IssueErrorResolvesWithoutPolling) {
    bus.failNextCall(static_cast<int>(ErrorCode::ECIC));
    PollingBridge bridge(io.get_executor(), fastPolling());

    std::optional<Result<std::string>> read;
    bridge.asyncRead(handle, [&](Result<std::string> result) { read = std::move(result); });
    run();

    ASSERT_TRUE(read.has_value());
    ASSERT_FALSE(*read);
    EXPECT_EQ(read->error.code, ErrorCode::ECIC);
    EXPECT_EQ(bridge.stats().samples.load(), 0u);
    EXPECT_FALSE(handle.busy());
}

TEST_F(PollingBridgeTests, WorksWithUseFuture) {
    bus.setLatency(2ms);
    bus.queueResponse(0, 1, "42\n");
    PollingBridge bridge(io.get_executor(), fastPolling());

    auto future = bridge.asyncRead(handle, boost::asio::use_future);
    run();

    ASSERT_EQ(future.wait_for(kRunLimit), std::future_status::ready);
    auto read = future.get();
    ASSERT_TRUE(read) << read.error.toString();
    EXPECT_EQ(read.value, "42\n");
}

TEST_F(PollingBridgeTests, DestroyedContextAbortsInFlightRead) {
    bus.setLatency(50ms);
    bus.queueResponse(0, 1, "HELLO WORLD");

    bool delivered = false;
    {
        boost::asio::io_context abandoned;
        PollingBridge bridge(abandoned.get_executor(), fastPolling());
        bridge.asyncRead(handle, [&](Result<std::string>) { delivered = true; });
        abandoned.run_for(10ms);
        EXPECT_TRUE(handle.busy());
    }

    EXPECT_FALSE(delivered);
    EXPECT_FALSE(handle.busy());
    EXPECT_EQ(bus.stops(handle.ud()), 1u);
    EXPECT_FALSE(bus.asyncPending(handle.ud()));
    // aborted before any byte was transferred into the released buffer
    EXPECT_EQ(bus.pendingOutput(0, 1), "HELLO WORLD");

    bus.setLatency(1ms);
    PollingBridge bridge(io.get_executor(), fastPolling());
    std::optional<Result<std::string>> read;
    bridge.asyncRead(handle, [&](Result<std::string> result) { read = std::move(result); });
    run();

    ASSERT_TRUE(read.has_value());
    ASSERT_TRUE(*read) << read->error.toString();
    EXPECT_EQ(read->value, "HELLO WORLD");
}

TEST_F(PollingBridgeTests, OversizedReadChunkIsBounded) {
    bus.queueResponse(0, 1, "HELLO\n");
    PollingBridge bridge(io.get_executor(), fastPolling(2ms, std::numeric_limits<std::size_t>::max()));
    EXPECT_EQ(bridge.config().effectiveReadChunk(), BridgeConfig::kMaxReadChunk);

    std::optional<Result<std::string>> read;
    bridge.asyncRead(handle, [&](Result<std::string> result) { read = std::move(result); });
    run();

    ASSERT_TRUE(read.has_value());
    ASSERT_TRUE(*read) << read->error.toString();
    EXPECT_EQ(read->value, "HELLO\n");
    EXPECT_FALSE(handle.busy());
}

TEST_F(PollingBridgeTests, NonUtf8ReplyIsRejected) {
    bus.queueResponse(0, 1, std::string("#\xff\xfe\x80\n"));
    PollingBridge bridge(io.get_executor(), fastPolling());

    std::optional<Result<std::string>> read;
    bridge.asyncRead(handle, [&](Result<std::string> result) { read = std::move(result); });
    run();

    ASSERT_TRUE(read.has_value());
    ASSERT_FALSE(*read);
    EXPECT_EQ(read->error.kind, ErrorKind::InvalidArgument);
    EXPECT_FALSE(handle.busy());
    EXPECT_EQ(bridge.stats().failed.load(), 1u);
}

TEST_F(PollingBridgeTests, MultibyteCharacterSplitAcrossChunks) {
    // U+00B5 MICRO SIGN straddles the 4-byte chunk boundary
    const std::string reading = "1.0\xc2\xb5V\n";
    bus.queueResponse(0, 1, reading);
    PollingBridge bridge(io.get_executor(), fastPolling(1ms, 4));

    std::optional<Result<std::string>> read;
    bridge.asyncRead(handle, [&](Result<std::string> result) { read = std::move(result); });
    run();

    ASSERT_TRUE(read.has_value());
    ASSERT_TRUE(*read) << read->error.toString();
    EXPECT_EQ(read->value, reading);
}

TEST_F(PollingBridgeTests, HandlerContextKeepsRunningUntilDelivery) {
    bus.setLatency(20ms);
    bus.queueResponse(0, 1, "bound\n");
    PollingBridge bridge(io.get_executor(), fastPolling());

    boost::asio::io_context callbacks;
    std::optional<Result<std::string>> read;
    std::thread::id ranOn;
    bridge.asyncRead(handle, boost::asio::bind_executor(callbacks, [&](Result<std::string> result) {
        ranOn = std::this_thread::get_id();
        read = std::move(result);
    }));

    // without outstanding work this run would return before the read resolves
    std::thread worker([&]() { callbacks.run_for(kRunLimit); });
    const auto workerId = worker.get_id();
    run();
    worker.join();

    ASSERT_TRUE(read.has_value());
    ASSERT_TRUE(*read) << read->error.toString();
    EXPECT_EQ(read->value, "bound\n");
    EXPECT_EQ(ranOn, workerId);
}
