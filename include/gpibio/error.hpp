/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "gpibio/status.hpp"

namespace gpibio {

// Native iberr values. Unknown covers anything the driver reports outside
// the documented set.
enum class ErrorCode : int {
    EDVR = 0,
    ECIC = 1,
    ENOL = 2,
    EADR = 3,
    EARG = 4,
    ESAC = 5,
    EABO = 6,
    ENEB = 7,
    EDMA = 8,
    EOIP = 10,
    ECAP = 11,
    EFSO = 12,
    EBUS = 14,
    ESTB = 15,
    ESRQ = 16,
    ETAB = 20,
    Unknown = -1
};

enum class ErrorKind : uint8_t {
    None = 0,
    InvalidAddress,
    InvalidArgument,
    DeviceUnavailable,
    HandleClosed,
    OperationInProgress,
    Timeout,
    Cancelled,
    DeviceError,
    UnspecifiedError
};

[[nodiscard]] ErrorCode errorCodeFromIberr(int iberr) noexcept;
[[nodiscard]] const char* errorCodeName(ErrorCode code) noexcept;
[[nodiscard]] const char* errorCodeDescription(ErrorCode code) noexcept;
[[nodiscard]] const char* errorKindName(ErrorKind kind) noexcept;

// Explanation of an EDVR ibcntl value (system error reported by the driver)
[[nodiscard]] std::string edvrDescription(long ibcntl);

struct Error {
    ErrorKind kind = ErrorKind::None;
    ErrorCode code = ErrorCode::Unknown;
    StatusWord status;
    long detail = 0;            // ibcntl for EDVR / EFSO
    std::string message;

    [[nodiscard]] static Error make(ErrorKind kind, std::string message);
    [[nodiscard]] std::string toString() const;
};

template <typename T>
struct Result {
    bool ok = false;
    T value{};
    Error error;

    explicit operator bool() const noexcept { return ok; }
    [[nodiscard]] bool cancelled() const noexcept { return error.kind == ErrorKind::Cancelled; }

    [[nodiscard]] static Result success(T v) {
        Result r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }
    [[nodiscard]] static Result failure(Error e) {
        Result r;
        r.error = std::move(e);
        return r;
    }
};

// Result of operations with no value (write, close)
using Outcome = Result<std::monostate>;

inline Outcome succeeded() { return Outcome::success(std::monostate{}); }

// Decode the status / iberr / ibcntl triple captured right after a native
// call. ERR takes precedence over every other bit; TIMO with ERR is Timeout.
[[nodiscard]] Result<std::size_t> decode(StatusWord status, int iberr, long count);

// Error for a status word already known to carry ERR
[[nodiscard]] Error deviceError(StatusWord status, int iberr, long count);

}
