/*
 * gpibio - Asynchronous GPIB I/O
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gpibio/address.hpp"
#include "gpibio/logger.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace gpibio {

namespace {
std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::vector<std::string> splitFields(const std::string& text) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find("::", start);
        if (pos == std::string::npos) {
            fields.push_back(text.substr(start));
            break;
        }
        fields.push_back(text.substr(start, pos - start));
        start = pos + 2;
    }
    return fields;
}

bool parseNumber(const std::string& text, int& out) {
    if (text.empty() || text.size() > 4) {
        return false;
    }
    if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    out = std::stoi(text);
    return true;
}

Result<Address> invalid(const std::string& resource, const std::string& why) {
    LOG_DEBUG("Invalid address '" + resource + "': " + why);
    return Result<Address>::failure(
        Error::make(ErrorKind::InvalidAddress, "invalid address '" + resource + "': " + why));
}
}

Result<Address> Address::make(int board, int primary, std::optional<int> secondary) {
    if (board < 0) {
        return Result<Address>::failure(
            Error::make(ErrorKind::InvalidArgument, "board index must be non-negative, got " + std::to_string(board)));
    }
    if (primary < 0 || primary > kMaxAddress) {
        return Result<Address>::failure(
            Error::make(ErrorKind::InvalidArgument, "primary address must be 0-30, got " + std::to_string(primary)));
    }
    if (secondary && (*secondary < 0 || *secondary > kMaxAddress)) {
        return Result<Address>::failure(
            Error::make(ErrorKind::InvalidArgument, "secondary address must be 0-30, got " + std::to_string(*secondary)));
    }
    Address address;
    address.board = board;
    address.primary = primary;
    address.secondary = secondary;
    return Result<Address>::success(address);
}

Result<Address> Address::parse(const std::string& resource) {
    auto fields = splitFields(resource);
    if (fields.size() < 2) {
        return invalid(resource, "expected GPIBN::primary_address::INSTR");
    }

    std::string interface = toUpperCopy(fields[0]);
    if (interface.compare(0, 4, "GPIB") != 0) {
        return invalid(resource, "interface must start with GPIB");
    }

    int board = 0;
    std::string boardText = interface.substr(4);
    if (!boardText.empty() && !parseNumber(boardText, board)) {
        return invalid(resource, "unable to parse board index '" + boardText + "'");
    }

    if (toUpperCopy(fields.back()) == "INSTR") {
        fields.pop_back();
    }
    if (fields.size() < 2 || fields.size() > 3) {
        return invalid(resource, "expected primary and optional secondary address");
    }

    int primary = 0;
    if (!parseNumber(fields[1], primary)) {
        return invalid(resource, "unable to parse primary address '" + fields[1] + "'");
    }

    std::optional<int> secondary;
    if (fields.size() == 3) {
        int sad = 0;
        if (!parseNumber(fields[2], sad)) {
            return invalid(resource, "unable to parse secondary address '" + fields[2] + "'");
        }
        secondary = sad;
    }

    auto result = make(board, primary, secondary);
    if (!result) {
        return invalid(resource, result.error.message);
    }
    return result;
}

std::string Address::visaString() const {
    std::string text = "GPIB" + std::to_string(board) + "::" + std::to_string(primary);
    if (secondary) {
        text += "::" + std::to_string(*secondary);
    }
    return text + "::INSTR";
}

}
