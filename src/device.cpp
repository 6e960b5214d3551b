/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gpibio/device.hpp"
#include "gpibio/logger.hpp"

namespace gpibio {

namespace detail {
Error closedError(const DeviceHandle& handle) {
    return Error::make(ErrorKind::HandleClosed,
        handle.valid() ? "handle " + std::to_string(handle.ud()) + " is closed" : "handle was never opened");
}

Error busyError(const HandleState& state) {
    return Error::make(ErrorKind::OperationInProgress,
        std::string("asynchronous ") + operationKindName(state.pendingKind) +
        " already in flight on handle " + std::to_string(state.ud));
}
}

namespace {
bool isUnavailable(int iberr) {
    auto code = errorCodeFromIberr(iberr);
    return code == ErrorCode::ENEB || code == ErrorCode::ENOL || code == ErrorCode::EDVR;
}

Error openFailure(const Address& address, const BusReply& reply) {
    Error e = deviceError(reply.status.with(StatusWord::ERR), reply.error, reply.count);
    if (isUnavailable(reply.error)) {
        e.kind = ErrorKind::DeviceUnavailable;
    }
    e.message = address.visaString() + ": " + e.message;
    return e;
}
}

bool DeviceHandle::isOpen() const noexcept {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->open;
}

bool DeviceHandle::busy() const noexcept {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->inFlight;
}

Address DeviceHandle::address() const {
    return state_ ? state_->address : Address{};
}

bool DeviceHandle::cancel() const noexcept {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->inFlight) {
        return false;
    }
    state_->cancelRequested = true;
    LOG_DEBUG("Cancellation requested on handle " + std::to_string(state_->ud));
    return true;
}

std::string DeviceHandle::toString() const {
    if (!state_) return "DeviceHandle(invalid)";
    return "DeviceHandle(" + std::to_string(state_->ud) + ", " + state_->address.visaString() + ")";
}

Result<DeviceHandle> open(Bus& bus, const Address& requested, const OpenParams& params) {
    Address address = requested;
    if (params.boardOverride) {
        auto checked = Address::make(*params.boardOverride, address.primary, address.secondary);
        if (!checked) {
            return Result<DeviceHandle>::failure(checked.error);
        }
        address = checked.value;
    }

    TimeoutCode tmo = timeoutCodeFor(params.timeout);
    BusReply reply = bus.open(address.board, address.pad(), address.sad(),
                              static_cast<int>(tmo), params.sendEoi ? 1 : 0, params.eosMode.asMode());
    LOG_DEBUG("open " + address.visaString() + " " + timeoutCodeName(tmo) + " " +
              params.eosMode.toString() + " eoi=" + (params.sendEoi ? "1" : "0") +
              " -> ud " + std::to_string(reply.ud));

    if (reply.ud < 0) {
        Error e = openFailure(address, reply);
        LOG_WARN("Failed to open " + address.visaString() + ": " + e.toString());
        return Result<DeviceHandle>::failure(e);
    }

    if (params.clearOnOpen) {
        BusReply cleared = bus.clear(reply.ud);
        if (cleared.status.err()) {
            Error e = openFailure(address, cleared);
            BusReply offline = bus.offline(reply.ud);
            if (offline.status.err()) {
                LOG_DEBUG("ibonl after failed clear: " + offline.status.toString());
            }
            LOG_WARN("Device clear failed for " + address.visaString() + ": " + e.toString());
            return Result<DeviceHandle>::failure(e);
        }
    }

    try {
        auto state = std::make_shared<detail::HandleState>(bus, reply.ud, address, params);
        LOG_INFO("Opened " + address.visaString() + " as handle " + std::to_string(reply.ud) +
                 " on " + bus.name());
        return Result<DeviceHandle>::success(DeviceHandle(std::move(state)));
    } catch (const std::exception& e) {
        BusReply offline = bus.offline(reply.ud);
        if (offline.status.err()) {
            LOG_DEBUG("ibonl after allocation failure: " + offline.status.toString());
        }
        LOG_ERROR("Failed to allocate handle state: " + std::string(e.what()));
        return Result<DeviceHandle>::failure(Error::make(ErrorKind::UnspecifiedError, e.what()));
    }
}

Result<DeviceHandle> open(Bus& bus, const std::string& resource, const OpenParams& params) {
    auto address = Address::parse(resource);
    if (!address) {
        return Result<DeviceHandle>::failure(address.error);
    }
    return open(bus, address.value, params);
}

Outcome close(const DeviceHandle& handle) {
    const auto& state = handle.state();
    if (!state) {
        return Outcome::failure(detail::closedError(handle));
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    if (!state->open) {
        LOG_DEBUG("close on already closed handle " + std::to_string(state->ud));
        return Outcome::failure(detail::closedError(handle));
    }
    state->open = false;

    if (state->inFlight) {
        // the native side must let go of the request buffer before ibonl
        BusReply stopped = state->bus.stop(state->ud);
        LOG_DEBUG("ibstop before close on handle " + std::to_string(state->ud) + " -> " +
                  stopped.status.toString());
    }

    BusReply reply = state->bus.offline(state->ud);
    if (reply.status.err()) {
        Error e = deviceError(reply.status, reply.error, reply.count);
        LOG_WARN("Error while closing handle " + std::to_string(state->ud) + ": " + e.toString());
        return Outcome::failure(e);
    }

    LOG_INFO("Closed handle " + std::to_string(state->ud) + " (" + state->address.visaString() + ")");
    return succeeded();
}

ScopedDevice::~ScopedDevice() {
    if (handle_.isOpen()) {
        auto result = gpibio::close(handle_);
        if (!result) {
            LOG_WARN("ScopedDevice: " + result.error.toString());
        }
    }
}

ScopedDevice::ScopedDevice(ScopedDevice&& other) noexcept
    : handle_(other.release()) {
}

ScopedDevice& ScopedDevice::operator=(ScopedDevice&& other) noexcept {
    if (this != &other) {
        if (handle_.isOpen()) {
            auto result = gpibio::close(handle_);
            if (!result) {
                LOG_WARN("ScopedDevice: " + result.error.toString());
            }
        }
        handle_ = other.release();
    }
    return *this;
}

DeviceHandle ScopedDevice::release() noexcept {
    DeviceHandle released = std::move(handle_);
    handle_ = DeviceHandle();
    return released;
}

Outcome ScopedDevice::close() {
    return gpibio::close(handle_);
}

Result<ScopedDevice> openScoped(Bus& bus, const std::string& resource, const OpenParams& params) {
    auto opened = open(bus, resource, params);
    if (!opened) {
        return Result<ScopedDevice>::failure(opened.error);
    }
    return Result<ScopedDevice>::success(ScopedDevice(std::move(opened.value)));
}

}
