/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <mutex>
#include <string>

#include "gpibio/address.hpp"
#include "gpibio/bus.hpp"
#include "gpibio/error.hpp"
#include "gpibio/types.hpp"

namespace gpibio {

namespace detail {
// Mutable state shared by every copy of one DeviceHandle. The mutex orders
// close() against the start, sampling and cancellation of async requests.
struct HandleState {
    HandleState(Bus& b, int descriptor, Address addr, OpenParams p)
        : bus(b), ud(descriptor), address(addr), params(p) {}

    Bus& bus;
    const int ud;
    const Address address;
    const OpenParams params;

    std::mutex mutex;
    bool open = true;
    bool inFlight = false;
    bool cancelRequested = false;
    OperationKind pendingKind = OperationKind::Read;
};
}

// Value handle to one open descriptor. Copies refer to the same descriptor;
// each call to open() produces an independent one.
class DeviceHandle {
public:
    DeviceHandle() = default;
    explicit DeviceHandle(std::shared_ptr<detail::HandleState> state) noexcept : state_(std::move(state)) {}

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }
    [[nodiscard]] int ud() const noexcept { return state_ ? state_->ud : -1; }
    [[nodiscard]] bool isOpen() const noexcept;
    [[nodiscard]] bool busy() const noexcept;
    [[nodiscard]] Address address() const;

    // Ask the in-flight asynchronous request to stop at its next poll.
    // Returns false when nothing is in flight.
    bool cancel() const noexcept;

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] const std::shared_ptr<detail::HandleState>& state() const noexcept { return state_; }

private:
    std::shared_ptr<detail::HandleState> state_;
};

[[nodiscard]] Result<DeviceHandle> open(Bus& bus, const Address& address, const OpenParams& params = {});
[[nodiscard]] Result<DeviceHandle> open(Bus& bus, const std::string& resource, const OpenParams& params = {});

// Aborts an in-flight asynchronous request, then takes the descriptor
// offline. Fails with HandleClosed when already closed.
[[nodiscard]] Outcome close(const DeviceHandle& handle);

// Closes its handle on destruction
class ScopedDevice {
public:
    ScopedDevice() = default;
    explicit ScopedDevice(DeviceHandle handle) noexcept : handle_(std::move(handle)) {}
    ~ScopedDevice();

    ScopedDevice(const ScopedDevice&) = delete;
    ScopedDevice& operator=(const ScopedDevice&) = delete;
    ScopedDevice(ScopedDevice&& other) noexcept;
    ScopedDevice& operator=(ScopedDevice&& other) noexcept;

    [[nodiscard]] const DeviceHandle& get() const noexcept { return handle_; }
    [[nodiscard]] const DeviceHandle* operator->() const noexcept { return &handle_; }

    // Give up ownership without closing
    DeviceHandle release() noexcept;
    Outcome close();

private:
    DeviceHandle handle_;
};

[[nodiscard]] Result<ScopedDevice> openScoped(Bus& bus, const std::string& resource, const OpenParams& params = {});

namespace detail {
// Shared checks for every operation entry point; caller holds state.mutex
[[nodiscard]] Error closedError(const DeviceHandle& handle);
[[nodiscard]] Error busyError(const HandleState& state);
}

}
