/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>

#include "gpibio/device.hpp"
#include "gpibio/error.hpp"

namespace gpibio {

// Blocking primitives. Each call holds the calling thread for the whole bus
// transaction, bounded by the handle's timeout. They refuse to run while the
// asynchronous bridge has a request in flight on the same handle, but cannot
// stop a bridge request from starting while they block.

// Returns the number of bytes written; may be short.
[[nodiscard]] Result<std::size_t> ibwrt(const DeviceHandle& handle, const void* data, std::size_t length);
[[nodiscard]] Result<std::size_t> ibwrt(const DeviceHandle& handle, const std::string& data);

// Fills at most length bytes of buffer and returns how many arrived.
[[nodiscard]] Result<std::size_t> ibrd(const DeviceHandle& handle, void* buffer, std::size_t length);

// Whole-message helpers built on the primitives
[[nodiscard]] Outcome writeText(const DeviceHandle& handle, const std::string& text);
// Reads chunk-sized pieces until END or a short read
[[nodiscard]] Result<std::string> readAll(const DeviceHandle& handle, std::size_t chunk = 1024);
[[nodiscard]] Result<std::string> query(const DeviceHandle& handle, const std::string& text);

}
