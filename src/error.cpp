/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gpibio/error.hpp"
#include <cstdint>
#include <sstream>

namespace gpibio {

ErrorCode errorCodeFromIberr(int iberr) noexcept {
    switch (iberr) {
        case 0: return ErrorCode::EDVR;
        case 1: return ErrorCode::ECIC;
        case 2: return ErrorCode::ENOL;
        case 3: return ErrorCode::EADR;
        case 4: return ErrorCode::EARG;
        case 5: return ErrorCode::ESAC;
        case 6: return ErrorCode::EABO;
        case 7: return ErrorCode::ENEB;
        case 8: return ErrorCode::EDMA;
        case 10: return ErrorCode::EOIP;
        case 11: return ErrorCode::ECAP;
        case 12: return ErrorCode::EFSO;
        case 14: return ErrorCode::EBUS;
        case 15: return ErrorCode::ESTB;
        case 16: return ErrorCode::ESRQ;
        case 20: return ErrorCode::ETAB;
        default: return ErrorCode::Unknown;
    }
}

const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::EDVR: return "EDVR";
        case ErrorCode::ECIC: return "ECIC";
        case ErrorCode::ENOL: return "ENOL";
        case ErrorCode::EADR: return "EADR";
        case ErrorCode::EARG: return "EARG";
        case ErrorCode::ESAC: return "ESAC";
        case ErrorCode::EABO: return "EABO";
        case ErrorCode::ENEB: return "ENEB";
        case ErrorCode::EDMA: return "EDMA";
        case ErrorCode::EOIP: return "EOIP";
        case ErrorCode::ECAP: return "ECAP";
        case ErrorCode::EFSO: return "EFSO";
        case ErrorCode::EBUS: return "EBUS";
        case ErrorCode::ESTB: return "ESTB";
        case ErrorCode::ESRQ: return "ESRQ";
        case ErrorCode::ETAB: return "ETAB";
        default: return "UNKNOWN";
    }
}

const char* errorCodeDescription(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::EDVR:
            return "A system call has failed";
        case ErrorCode::ECIC:
            return "Your interface board needs to be controller-in-charge, but is not";
        case ErrorCode::ENOL:
            return "You have attempted to write data or command bytes, but there are no listeners currently addressed";
        case ErrorCode::EADR:
            return "The interface board has failed to address itself properly before starting an io operation";
        case ErrorCode::EARG:
            return "One or more arguments to the function call were invalid";
        case ErrorCode::ESAC:
            return "The interface board needs to be system controller, but is not";
        case ErrorCode::EABO:
            return "A read or write of data bytes has been aborted, possibly due to a timeout or reception of a device clear command";
        case ErrorCode::ENEB:
            return "The GPIB interface board does not exist, its driver is not loaded, or it is not configured properly";
        case ErrorCode::EDMA:
            return "Not used DMA error, included for compatibility purposes";
        case ErrorCode::EOIP:
            return "Function call can not proceed due to an asynchronous IO operation in progress";
        case ErrorCode::ECAP:
            return "Incapable of executing function call, due the GPIB board lacking the capability, or the capability being disabled in software";
        case ErrorCode::EFSO:
            return "File system error";
        case ErrorCode::EBUS:
            return "An attempt to write command bytes to the bus has timed out";
        case ErrorCode::ESTB:
            return "One or more serial poll status bytes have been lost";
        case ErrorCode::ESRQ:
            return "The serial poll request service line is stuck on";
        case ErrorCode::ETAB:
            return "Table problem reported by ibevent(), FindLstn(), or FindRQS()";
        default:
            return "Unspecified device error";
    }
}

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidAddress: return "InvalidAddress";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorKind::HandleClosed: return "HandleClosed";
        case ErrorKind::OperationInProgress: return "OperationInProgress";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::DeviceError: return "DeviceError";
        case ErrorKind::UnspecifiedError: return "UnspecifiedError";
        default: return "Unknown";
    }
}

std::string edvrDescription(long ibcntl) {
    // NI-488.2 troubleshooting table; values arrive sign-extended on Linux
    const auto value = static_cast<uint32_t>(ibcntl);
    std::ostringstream hex;
    hex << "0x" << std::uppercase << std::hex << value;

    switch (value) {
        case 0xE014002Cu:
            return "ibcntl = " + hex.str() + ": a call is made with a board number that is within the range of allowed board numbers, but which has not been assigned to a GPIB interface";
        case 0xE0140025u:
            return "ibcntl = " + hex.str() + ": a call is made with a board number that is not within the range of allowed board numbers";
        case 0xE0140035u:
            return "ibcntl = " + hex.str() + ": a call is made with a device name that is not listed in the logical device templates";
        case 0xE1080080u:
        case 0xE1080081u:
            return "ibcntl = " + hex.str() + ": a removable interface was removed or ejected while the software was communicating with it";
        case 0xE00A0047u:
            return "ibcntl = " + hex.str() + ": the driver encountered an access violation on a user-supplied object, such as a NULL buffer pointer";
        case 0xE1060075u:
            return "ibcntl = " + hex.str() + ": the driver is unable to communicate with a GPIB-ENET/100 during an ibfind or ibdev";
        case 0xE1060078u:
            return "ibcntl = " + hex.str() + ": the network link is broken between the host and the GPIB-ENET/100 interface";
        default:
            return "unknown ibcntl value " + hex.str();
    }
}

Error Error::make(ErrorKind kind, std::string message) {
    Error e;
    e.kind = kind;
    e.message = std::move(message);
    return e;
}

std::string Error::toString() const {
    std::string text = errorKindName(kind);
    if (kind == ErrorKind::DeviceError || kind == ErrorKind::UnspecifiedError ||
        kind == ErrorKind::DeviceUnavailable || kind == ErrorKind::Timeout) {
        if (status.bits() != 0) {
            text += " " + status.toString();
        }
    }
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

Error deviceError(StatusWord status, int iberr, long count) {
    Error e;
    e.status = status;
    e.code = errorCodeFromIberr(iberr);

    if (status.timo()) {
        e.kind = ErrorKind::Timeout;
        e.message = "I/O operation timed out";
        return e;
    }

    if (e.code == ErrorCode::Unknown) {
        e.kind = ErrorKind::UnspecifiedError;
        e.message = "unexpected iberr value = " + std::to_string(iberr);
        return e;
    }

    e.kind = ErrorKind::DeviceError;
    e.message = std::string(errorCodeName(e.code)) + " (" + errorCodeDescription(e.code) + ")";

    if (e.code == ErrorCode::EDVR) {
        e.detail = count;
        e.message += " " + edvrDescription(count);
    } else if (e.code == ErrorCode::EFSO) {
        e.detail = count;
        e.message += " ibcntl = " + std::to_string(count);
    } else if (e.code == ErrorCode::ECIC && !status.cic()) {
        e.message += " [controller-in-charge role lost]";
    }
    return e;
}

Result<std::size_t> decode(StatusWord status, int iberr, long count) {
    if (status.err()) {
        return Result<std::size_t>::failure(deviceError(status, iberr, count));
    }
    if (count < 0) {
        return Result<std::size_t>::failure(
            Error::make(ErrorKind::InvalidArgument, "negative transfer count " + std::to_string(count)));
    }
    return Result<std::size_t>::success(static_cast<std::size_t>(count));
}

}
