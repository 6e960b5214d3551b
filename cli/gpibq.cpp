/*
 * gpibio - Instrument query tool (gpibq)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gpibio/async.hpp"
#include "gpibio/device.hpp"
#include "gpibio/linux_bus.hpp"
#include "gpibio/logger.hpp"
#include "gpibio/loopback_bus.hpp"
#include "gpibio/sync.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>

using namespace gpibio;

constexpr const char* VERSION = "0.2.3";

void printUsage(const char* progName) {
    std::cout << "gpibio Instrument Query Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <address> <command...> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  address       VISA resource, e.g. GPIB0::1::INSTR\n";
    std::cout << "  command       Text sent to the instrument (\\n is appended)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --async           Use the polling bridge instead of blocking calls\n";
    std::cout << "  --write-only      Send the command without reading a reply\n";
    std::cout << "  --timeout <ms>    I/O timeout (default 1000, 0 disables)\n";
    std::cout << "  --board <n>       Override the board index of the address\n";
    std::cout << "  --eos <byte>      Terminate reads on this byte (decimal)\n";
    std::cout << "  --no-eoi          Do not assert EOI with the last byte written\n";
    std::cout << "  --poll <ms>       Status poll interval for --async\n";
    std::cout << "  --loopback        Talk to a simulated echoing instrument\n";
    std::cout << "  -h, --help        Show this help message\n";
    std::cout << "  -v, --version     Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  GPIBIO_LOG_LEVEL         Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  GPIBIO_POLL_INTERVAL_MS  Default status poll interval\n";
    std::cout << "  GPIBIO_READ_CHUNK        Bytes requested per read\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " GPIB0::1::INSTR \"*IDN?\"\n";
    std::cout << "  " << progName << " GPIB0::22::INSTR \"MEAS:VOLT?\" --async --timeout 3000\n";
}

namespace {
bool parseInt(const std::string& text, long& out) {
    try {
        std::size_t used = 0;
        out = std::stol(text, &used);
        return used == text.size();
    } catch (...) {
        return false;
    }
}

int runAsync(const DeviceHandle& handle, const std::string& command, bool writeOnly,
             const BridgeConfig& config) {
    boost::asio::io_context io;
    PollingBridge bridge(io.get_executor(), config);

    // Ctrl-C aborts the in-flight request instead of killing the process
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([handle](const boost::system::error_code& ec, int) {
        if (!ec && handle.cancel()) {
            LOG_WARN("Interrupted, cancelling request");
        }
    });

    int status = 1;
    auto report = [&](const Error& error) {
        std::cerr << "Error: " << error.toString() << std::endl;
        status = error.kind == ErrorKind::Cancelled ? 130 : 1;
    };

    if (writeOnly) {
        bridge.asyncWrite(handle, command, [&](Outcome written) {
            signals.cancel();
            if (written) {
                status = 0;
            } else {
                report(written.error);
            }
        });
    } else {
        bridge.asyncQuery(handle, command, [&](Result<std::string> reply) {
            signals.cancel();
            if (reply) {
                std::cout << reply.value;
                if (reply.value.empty() || reply.value.back() != '\n') std::cout << "\n";
                status = 0;
            } else {
                report(reply.error);
            }
        });
    }

    setThreadName("io");
    io.run();
    LOG_DEBUG("status samples taken: " + std::to_string(bridge.stats().samples.load()));
    return status;
}

int runBlocking(const DeviceHandle& handle, const std::string& command, bool writeOnly) {
    if (writeOnly) {
        auto written = writeText(handle, command);
        if (!written) {
            std::cerr << "Error: " << written.error.toString() << std::endl;
            return 1;
        }
        return 0;
    }

    auto reply = query(handle, command);
    if (!reply) {
        std::cerr << "Error: " << reply.error.toString() << std::endl;
        return 1;
    }
    std::cout << reply.value;
    if (reply.value.empty() || reply.value.back() != '\n') std::cout << "\n";
    return 0;
}
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    std::string address = argv[1];
    OpenParams params;
    BridgeConfig config = BridgeConfig::fromEnv();
    bool useAsync = false;
    bool writeOnly = false;
    bool loopback = false;

    std::ostringstream commandStream;
    bool first = true;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        long value = 0;
        if (arg == "--async") {
            useAsync = true;
        } else if (arg == "--write-only") {
            writeOnly = true;
        } else if (arg == "--no-eoi") {
            params.sendEoi = false;
        } else if (arg == "--loopback") {
            loopback = true;
        } else if (arg == "--timeout" || arg == "--board" || arg == "--eos" || arg == "--poll") {
            if (i + 1 >= argc || !parseInt(argv[i + 1], value) || value < 0) {
                std::cerr << "Error: " << arg << " requires a non-negative number\n";
                return 1;
            }
            ++i;
            if (arg == "--timeout") {
                params.timeout = std::chrono::milliseconds(value);
            } else if (arg == "--board") {
                params.boardOverride = static_cast<int>(value);
            } else if (arg == "--eos") {
                if (value > 255) {
                    std::cerr << "Error: --eos must be a byte value\n";
                    return 1;
                }
                params.eosMode = EosMode::readUntil(static_cast<uint8_t>(value));
            } else {
                config.pollInterval = std::chrono::milliseconds(value);
            }
        } else {
            if (!first) commandStream << " ";
            commandStream << arg;
            first = false;
        }
    }

    std::string command = commandStream.str();
    if (command.empty()) {
        std::cerr << "Error: Empty command provided\n";
        return 1;
    }
    command += "\n";

    try {
        std::unique_ptr<Bus> bus;
        if (loopback) {
            auto simulated = std::make_unique<LoopbackBus>(std::chrono::milliseconds(5));
            auto parsed = Address::parse(address);
            if (parsed) {
                simulated->attach(params.boardOverride.value_or(parsed.value.board), parsed.value.primary);
            }
            bus = std::move(simulated);
        } else {
            bus = std::make_unique<LinuxGpibBus>();
        }

        auto opened = openScoped(*bus, address, params);
        if (!opened) {
            std::cerr << "Error: " << opened.error.toString() << std::endl;
            return 1;
        }

        return useAsync ? runAsync(opened.value.get(), command, writeOnly, config)
                        : runBlocking(opened.value.get(), command, writeOnly);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
