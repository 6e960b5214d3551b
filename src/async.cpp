/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gpibio/async.hpp"
#include "gpibio/logger.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <mutex>
#include <vector>

namespace gpibio {

namespace detail {

namespace {

// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF
bool validUtf8(const std::string& text) {
    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    const auto* end = p + text.size();
    while (p < end) {
        unsigned char c = *p;
        if (c < 0x80) {
            ++p;
            continue;
        }
        std::size_t extra = 0;
        unsigned char lo = 0x80, hi = 0xbf;
        if (c >= 0xc2 && c <= 0xdf) {
            extra = 1;
        } else if (c >= 0xe0 && c <= 0xef) {
            extra = 2;
            if (c == 0xe0) lo = 0xa0;
            if (c == 0xed) hi = 0x9f;
        } else if (c >= 0xf0 && c <= 0xf4) {
            extra = 3;
            if (c == 0xf0) lo = 0x90;
            if (c == 0xf4) hi = 0x8f;
        } else {
            return false;
        }
        if (static_cast<std::size_t>(end - p) <= extra) {
            return false;
        }
        if (p[1] < lo || p[1] > hi) {
            return false;
        }
        for (std::size_t i = 2; i <= extra; ++i) {
            if (p[i] < 0x80 || p[i] > 0xbf) {
                return false;
            }
        }
        p += extra + 1;
    }
    return true;
}

// One outstanding ibwrta/ibrda. Owns the payload or receive buffer until it
// has resolved, and resolves only after the native side is done with it.
class PendingOperation : public std::enable_shared_from_this<PendingOperation> {
public:
    PendingOperation(const boost::asio::any_io_executor& executor, DeviceHandle handle, OperationKind kind,
                     std::string payload, const BridgeConfig& config, std::shared_ptr<BridgeStats> stats,
                     Completion done)
        : timer_(executor),
          handle_(std::move(handle)),
          kind_(kind),
          payload_(std::move(payload)),
          interval_(config.effectivePollInterval()),
          chunk_(config.effectiveReadChunk()),
          stats_(std::move(stats)),
          done_(std::move(done)) {
    }

    ~PendingOperation();

    void start();

private:
    using Clock = std::chrono::steady_clock;

    // caller holds the handle mutex
    BusReply issue();
    bool tryIssue(std::unique_lock<std::mutex>& lock, BusReply& reply);
    BusReply sample();
    void releaseSlot(detail::HandleState& st);

    void schedule();
    void poll(const boost::system::error_code& ec);
    void abandon(const std::string& why);

    void complete(std::unique_lock<std::mutex>& lock);
    void fail(std::unique_lock<std::mutex>& lock, Error error);
    void cancelled(std::unique_lock<std::mutex>& lock, const BusReply& reply);
    void resolve(OperationState state, Result<std::string> result);

    std::string tag() const {
        return std::string(operationKindName(kind_)) + "(" + std::to_string(handle_.ud()) + ")";
    }

    boost::asio::steady_timer timer_;
    DeviceHandle handle_;
    OperationKind kind_;
    std::string payload_;
    std::vector<char> buffer_;
    std::string received_;
    std::chrono::milliseconds interval_;
    std::size_t chunk_;
    std::shared_ptr<BridgeStats> stats_;
    Completion done_;

    OperationState state_ = OperationState::InFlight;
    // set while this operation holds the handle's in-flight slot
    bool owning_ = false;
    std::size_t samples_ = 0;
    Clock::time_point started_;
};

// Runs when the executor drops the operation without resolving it, e.g. an
// io_context destroyed mid-poll. The native request must be aborted before
// buffer_ and payload_ are released.
PendingOperation::~PendingOperation() {
    if (!owning_) {
        return;
    }
    auto& st = *handle_.state();
    std::lock_guard<std::mutex> lock(st.mutex);
    if (st.open) {
        BusReply stopped = st.bus.stop(st.ud);
        LOG_WARN(tag() + " abandoned while in flight, ibstop -> " + stopped.status.toString());
    }
    st.inFlight = false;
    st.cancelRequested = false;
}

void PendingOperation::start() {
    started_ = Clock::now();
    const auto& st = handle_.state();
    if (!st) {
        resolve(OperationState::Failed, Result<std::string>::failure(closedError(handle_)));
        return;
    }

    std::unique_lock<std::mutex> lock(st->mutex);
    if (!st->open) {
        lock.unlock();
        resolve(OperationState::Failed, Result<std::string>::failure(closedError(handle_)));
        return;
    }
    if (st->inFlight) {
        Error busy = busyError(*st);
        lock.unlock();
        LOG_DEBUG(tag() + " rejected: " + busy.message);
        resolve(OperationState::Failed, Result<std::string>::failure(std::move(busy)));
        return;
    }

    st->inFlight = true;
    st->cancelRequested = false;
    st->pendingKind = kind_;
    owning_ = true;
    ++stats_->started;

    BusReply reply;
    if (!tryIssue(lock, reply)) {
        return;
    }
    if (reply.status.err()) {
        fail(lock, deviceError(reply.status, reply.error, reply.count));
        return;
    }
    lock.unlock();

    LOG_DEBUG(tag() + " issued -> " + reply.status.toString());
    schedule();
}

BusReply PendingOperation::issue() {
    auto& st = *handle_.state();
    if (kind_ == OperationKind::Write) {
        return st.bus.writeAsync(st.ud, payload_.data(), payload_.size());
    }
    buffer_.assign(chunk_, 0);
    return st.bus.readAsync(st.ud, buffer_.data(), buffer_.size());
}

bool PendingOperation::tryIssue(std::unique_lock<std::mutex>& lock, BusReply& reply) {
    try {
        reply = issue();
        return true;
    } catch (const std::exception& e) {
        // nothing reached the bus, so there is nothing to abort
        LOG_ERROR(tag() + " unable to issue request: " + std::string(e.what()));
        fail(lock, Error::make(ErrorKind::UnspecifiedError, e.what()));
        return false;
    }
}

BusReply PendingOperation::sample() {
    auto& st = *handle_.state();
    ++samples_;
    ++stats_->samples;
    return st.bus.wait(st.ud, 0);
}

void PendingOperation::schedule() {
    try {
        timer_.expires_after(interval_);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            self->poll(ec);
        });
    } catch (const std::exception& e) {
        LOG_ERROR(tag() + " unable to schedule status poll: " + std::string(e.what()));
        abandon(e.what());
    }
}

void PendingOperation::poll(const boost::system::error_code& ec) {
    auto& st = *handle_.state();
    std::unique_lock<std::mutex> lock(st.mutex);

    if (!st.open) {
        // close() already stopped the native request
        releaseSlot(st);
        lock.unlock();
        LOG_DEBUG(tag() + " handle closed while in flight");
        resolve(OperationState::Failed, Result<std::string>::failure(
            Error::make(ErrorKind::HandleClosed, "handle " + std::to_string(st.ud) + " closed during " +
                        operationKindName(kind_))));
        return;
    }

    if (ec || st.cancelRequested) {
        if (ec) {
            LOG_WARN(tag() + " poll timer failed: " + ec.message());
        }
        BusReply stopped = st.bus.stop(st.ud);
        if (stopped.status.err() && errorCodeFromIberr(stopped.error) != ErrorCode::EABO) {
            LOG_DEBUG(tag() + " ibstop reported " + deviceError(stopped.status, stopped.error, stopped.count).toString());
        }
        // the status after ibstop decides between completion and cancellation
        BusReply reply = sample();
        if (reply.status.cmpl() && !reply.status.err()) {
            LOG_DEBUG(tag() + " completed before the abort took effect");
            if (kind_ == OperationKind::Read) {
                auto n = static_cast<std::size_t>(reply.count < 0 ? 0 : reply.count);
                if (n > buffer_.size()) {
                    fail(lock, Error::make(ErrorKind::InvalidArgument, "transfer count exceeds buffer"));
                    return;
                }
                received_.append(buffer_.data(), n);
            }
            complete(lock);
            return;
        }
        cancelled(lock, reply);
        return;
    }

    BusReply reply = sample();
    LOG_TRACE(tag() + " sample " + std::to_string(samples_) + " -> " + reply.status.toString());

    if (reply.status.err()) {
        fail(lock, deviceError(reply.status, reply.error, reply.count));
        return;
    }

    if (!reply.status.cmpl()) {
        lock.unlock();
        schedule();
        return;
    }

    if (kind_ == OperationKind::Read) {
        if (reply.count < 0 || static_cast<std::size_t>(reply.count) > buffer_.size()) {
            fail(lock, Error::make(ErrorKind::InvalidArgument,
                "transfer count (" + std::to_string(reply.count) + ") > buffer length (" +
                std::to_string(buffer_.size()) + ")"));
            return;
        }
        auto n = static_cast<std::size_t>(reply.count);
        received_.append(buffer_.data(), n);

        // a full chunk without END means the instrument has more to send
        if (!reply.status.end() && n == buffer_.size()) {
            BusReply next;
            if (!tryIssue(lock, next)) {
                return;
            }
            if (next.status.err()) {
                fail(lock, deviceError(next.status, next.error, next.count));
                return;
            }
            lock.unlock();
            LOG_TRACE(tag() + " chunk of " + std::to_string(n) + " bytes, continuing");
            schedule();
            return;
        }
    }

    complete(lock);
}

void PendingOperation::abandon(const std::string& why) {
    auto& st = *handle_.state();
    std::unique_lock<std::mutex> lock(st.mutex);
    if (st.open) {
        BusReply stopped = st.bus.stop(st.ud);
        LOG_DEBUG(tag() + " ibstop -> " + stopped.status.toString());
    }
    fail(lock, Error::make(ErrorKind::UnspecifiedError, why));
}

void PendingOperation::releaseSlot(detail::HandleState& st) {
    st.inFlight = false;
    st.cancelRequested = false;
    owning_ = false;
}

void PendingOperation::complete(std::unique_lock<std::mutex>& lock) {
    if (kind_ == OperationKind::Read && !validUtf8(received_)) {
        fail(lock, Error::make(ErrorKind::InvalidArgument,
            "reply of " + std::to_string(received_.size()) + " bytes is not valid UTF-8 text"));
        return;
    }
    auto& st = *handle_.state();
    releaseSlot(st);
    lock.unlock();
    resolve(OperationState::Completed, Result<std::string>::success(std::move(received_)));
}

void PendingOperation::fail(std::unique_lock<std::mutex>& lock, Error error) {
    auto& st = *handle_.state();
    releaseSlot(st);
    lock.unlock();
    resolve(OperationState::Failed, Result<std::string>::failure(std::move(error)));
}

void PendingOperation::cancelled(std::unique_lock<std::mutex>& lock, const BusReply& reply) {
    auto& st = *handle_.state();
    releaseSlot(st);
    lock.unlock();

    Error e = Error::make(ErrorKind::Cancelled, std::string(operationKindName(kind_)) + " cancelled");
    e.status = reply.status;
    resolve(OperationState::Cancelled, Result<std::string>::failure(std::move(e)));
}

void PendingOperation::resolve(OperationState state, Result<std::string> result) {
    state_ = state;
    switch (state) {
        case OperationState::Completed: ++stats_->completed; break;
        case OperationState::Cancelled: ++stats_->cancelled; break;
        default: ++stats_->failed; break;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
    if (result) {
        LOG_DEBUG(tag() + " " + operationStateName(state_) + " after " + std::to_string(samples_) +
                  " samples, " + std::to_string(elapsed.count()) + "ms, " + std::to_string(result.value.size()) +
                  " bytes");
    } else {
        LOG_DEBUG(tag() + " " + operationStateName(state_) + " after " + std::to_string(samples_) +
                  " samples: " + result.error.toString());
    }

    buffer_.clear();
    buffer_.shrink_to_fit();

    Completion done = std::move(done_);
    done_ = nullptr;
    if (done) {
        done(std::move(result));
    }
}

}

void startOperation(const boost::asio::any_io_executor& executor, const DeviceHandle& handle,
                    OperationKind kind, std::string payload, const BridgeConfig& config,
                    std::shared_ptr<BridgeStats> stats, Completion done) {
    std::shared_ptr<PendingOperation> op;
    try {
        op = std::make_shared<PendingOperation>(executor, handle, kind, std::move(payload), config,
                                                std::move(stats), done);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to create asynchronous ") + operationKindName(kind) + ": " + e.what());
        done(Result<std::string>::failure(Error::make(ErrorKind::UnspecifiedError, e.what())));
        return;
    }
    op->start();
}

}

PollingBridge::PollingBridge(boost::asio::any_io_executor executor, BridgeConfig config)
    : executor_(std::move(executor)), config_(config), stats_(std::make_shared<BridgeStats>()) {
    LOG_DEBUG("PollingBridge created with " + config_.toString());
}

}
