/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gpibio/sync.hpp"
#include "gpibio/logger.hpp"
#include <vector>

namespace gpibio {

namespace {
// Liveness and exclusivity gate shared by both directions
bool admit(const DeviceHandle& handle, Error& error) {
    const auto& state = handle.state();
    if (!state) {
        error = detail::closedError(handle);
        return false;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    if (!state->open) {
        error = detail::closedError(handle);
        return false;
    }
    if (state->inFlight) {
        error = detail::busyError(*state);
        return false;
    }
    return true;
}

Result<std::size_t> finish(const char* call, const DeviceHandle& handle, const BusReply& reply, std::size_t length) {
    auto result = decode(reply.status, reply.error, reply.count);
    if (!result) {
        LOG_DEBUG(std::string(call) + "(" + std::to_string(handle.ud()) + ", " + std::to_string(length) +
                  ") failed: " + result.error.toString());
        return result;
    }
    if (result.value > length) {
        return Result<std::size_t>::failure(Error::make(ErrorKind::InvalidArgument,
            "transfer count (" + std::to_string(result.value) + ") > buffer length (" + std::to_string(length) + ")"));
    }
    LOG_DEBUG(std::string(call) + "(" + std::to_string(handle.ud()) + ", " + std::to_string(length) + ") -> " +
              reply.status.toString() + ", " + std::to_string(result.value) + " bytes");
    return result;
}
}

Result<std::size_t> ibwrt(const DeviceHandle& handle, const void* data, std::size_t length) {
    Error error;
    if (!admit(handle, error)) {
        return Result<std::size_t>::failure(error);
    }
    BusReply reply = handle.state()->bus.write(handle.ud(), data, length);
    return finish("ibwrt", handle, reply, length);
}

Result<std::size_t> ibwrt(const DeviceHandle& handle, const std::string& data) {
    return ibwrt(handle, data.data(), data.size());
}

Result<std::size_t> ibrd(const DeviceHandle& handle, void* buffer, std::size_t length) {
    Error error;
    if (!admit(handle, error)) {
        return Result<std::size_t>::failure(error);
    }
    BusReply reply = handle.state()->bus.read(handle.ud(), buffer, length);
    auto result = finish("ibrd", handle, reply, length);
    if (result && reply.status.end()) {
        LOG_TRACE("ibrd(" + std::to_string(handle.ud()) + ") saw END");
    }
    return result;
}

Outcome writeText(const DeviceHandle& handle, const std::string& text) {
    auto written = ibwrt(handle, text);
    if (!written) {
        return Outcome::failure(written.error);
    }
    if (written.value != text.size()) {
        LOG_WARN("Short write on handle " + std::to_string(handle.ud()) + ": " +
                 std::to_string(written.value) + " of " + std::to_string(text.size()) + " bytes");
    }
    return succeeded();
}

Result<std::string> readAll(const DeviceHandle& handle, std::size_t chunk) {
    if (chunk == 0) {
        return Result<std::string>::failure(Error::make(ErrorKind::InvalidArgument, "read chunk size must be non-zero"));
    }

    std::string message;
    std::vector<char> buffer(chunk);
    while (true) {
        Error error;
        if (!admit(handle, error)) {
            return Result<std::string>::failure(error);
        }
        BusReply reply = handle.state()->bus.read(handle.ud(), buffer.data(), buffer.size());
        auto result = finish("ibrd", handle, reply, buffer.size());
        if (!result) {
            return Result<std::string>::failure(result.error);
        }
        message.append(buffer.data(), result.value);
        if (reply.status.end() || result.value < chunk || result.value == 0) {
            break;
        }
    }
    return Result<std::string>::success(std::move(message));
}

Result<std::string> query(const DeviceHandle& handle, const std::string& text) {
    auto written = writeText(handle, text);
    if (!written) {
        return Result<std::string>::failure(written.error);
    }
    return readAll(handle);
}

}
