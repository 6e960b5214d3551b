/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

#include "gpibio/config.hpp"
#include "gpibio/device.hpp"
#include "gpibio/error.hpp"

namespace gpibio {

struct BridgeStats {
    std::atomic<std::size_t> started{0};
    std::atomic<std::size_t> samples{0};
    std::atomic<std::size_t> completed{0};
    std::atomic<std::size_t> failed{0};
    std::atomic<std::size_t> cancelled{0};
};

namespace detail {
using Completion = std::function<void(Result<std::string>)>;

// Issues one non-blocking request and drives the poll loop on executor.
// The completion runs exactly once.
void startOperation(const boost::asio::any_io_executor& executor, const DeviceHandle& handle,
                    OperationKind kind, std::string payload, const BridgeConfig& config,
                    std::shared_ptr<BridgeStats> stats, Completion done);
}

// Turns ibwrta/ibrda plus status polling into Asio asynchronous operations.
// Between two status samples the operation is suspended on a steady_timer,
// so other work on the same executor keeps running. Completion tokens are
// the usual Asio ones: a callback, boost::asio::use_future, a coroutine.
//
// At most one operation may be in flight per handle; a second one completes
// with OperationInProgress. DeviceHandle::cancel() aborts the native request
// with ibstop and completes with Cancelled, unless the request had already
// completed on the bus, in which case its real result is delivered.
class PollingBridge {
public:
    explicit PollingBridge(boost::asio::any_io_executor executor, BridgeConfig config = BridgeConfig::fromEnv());

    PollingBridge(const PollingBridge&) = delete;
    PollingBridge& operator=(const PollingBridge&) = delete;

    // Signature: void(Outcome)
    template <typename CompletionToken>
    auto asyncWrite(const DeviceHandle& handle, std::string text, CompletionToken&& token) {
        auto initiation = [this](auto&& handler, DeviceHandle h, std::string data) {
            detail::startOperation(executor_, h, OperationKind::Write, std::move(data), config_, stats_,
                deliver(std::forward<decltype(handler)>(handler), toOutcome));
        };
        return boost::asio::async_initiate<CompletionToken, void(Outcome)>(
            initiation, token, handle, std::move(text));
    }

    // Signature: void(Result<std::string>)
    template <typename CompletionToken>
    auto asyncRead(const DeviceHandle& handle, CompletionToken&& token) {
        auto initiation = [this](auto&& handler, DeviceHandle h) {
            detail::startOperation(executor_, h, OperationKind::Read, std::string(), config_, stats_,
                deliver(std::forward<decltype(handler)>(handler), passThrough));
        };
        return boost::asio::async_initiate<CompletionToken, void(Result<std::string>)>(
            initiation, token, handle);
    }

    // Write then read; signature: void(Result<std::string>)
    template <typename CompletionToken>
    auto asyncQuery(const DeviceHandle& handle, std::string text, CompletionToken&& token) {
        auto initiation = [this](auto&& handler, DeviceHandle h, std::string data) {
            detail::Completion reply = deliver(std::forward<decltype(handler)>(handler), passThrough);
            auto executor = executor_;
            auto config = config_;
            auto stats = stats_;
            detail::startOperation(executor_, h, OperationKind::Write, std::move(data), config_, stats_,
                [executor, h, config, stats, reply](Result<std::string> written) {
                    if (!written) {
                        reply(std::move(written));
                        return;
                    }
                    detail::startOperation(executor, h, OperationKind::Read, std::string(), config, stats, reply);
                });
        };
        return boost::asio::async_initiate<CompletionToken, void(Result<std::string>)>(
            initiation, token, handle, std::move(text));
    }

    [[nodiscard]] const BridgeConfig& config() const noexcept { return config_; }
    [[nodiscard]] const BridgeStats& stats() const noexcept { return *stats_; }
    [[nodiscard]] const boost::asio::any_io_executor& executor() const noexcept { return executor_; }

private:
    static Outcome toOutcome(Result<std::string> result) {
        if (!result) {
            return Outcome::failure(std::move(result.error));
        }
        return succeeded();
    }

    static Result<std::string> passThrough(Result<std::string> result) { return result; }

    // Wraps a (possibly move-only) Asio handler into a copyable Completion
    // that posts the converted result to the handler's associated executor.
    // That executor counts as having work until the result is posted.
    template <typename Handler, typename Convert>
    detail::Completion deliver(Handler&& handler, Convert convert) {
        using HandlerType = std::decay_t<Handler>;
        auto held = std::make_shared<HandlerType>(std::forward<Handler>(handler));
        auto target = boost::asio::get_associated_executor(*held, executor_);
        auto work = std::make_shared<decltype(boost::asio::make_work_guard(target))>(
            boost::asio::make_work_guard(target));
        return [held, target, work, convert](Result<std::string> result) {
            boost::asio::post(target, [held, value = convert(std::move(result))]() mutable {
                std::move(*held)(std::move(value));
            });
            work->reset();
        };
    }

    boost::asio::any_io_executor executor_;
    BridgeConfig config_;
    std::shared_ptr<BridgeStats> stats_;
};

}
