/**
 * @file
 * @brief Implementation of the Command Line Interface
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "cli.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <argparse/argparse.hpp>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Level.hpp"
#include "uxbeacon/core/networking/Port.hpp"
#include "uxbeacon/core/utils/enum.hpp"
#include "uxbeacon/core/utils/string.hpp"
#include "uxbeacon/exec/exceptions.hpp"

using namespace uxbeacon::beacon;
using namespace uxbeacon::exec;
using namespace uxbeacon::log;
using namespace uxbeacon::networking;
using namespace uxbeacon::utils;

namespace {
    std::optional<Port> to_port(std::string_view option, const std::optional<int>& value) {
        if(!value.has_value()) {
            return std::nullopt;
        }
        if(value.value() < 1 || value.value() > std::numeric_limits<Port>::max()) {
            throw CommandLineInterfaceError(to_string(value.value()) + " is not a valid port for " + quote(option));
        }
        return static_cast<Port>(value.value());
    }

    std::optional<std::chrono::milliseconds> to_duration(std::string_view option, const std::optional<int>& value) {
        if(!value.has_value()) {
            return std::nullopt;
        }
        if(value.value() <= 0) {
            throw CommandLineInterfaceError("duration for " + quote(option) + " has to be positive");
        }
        return std::chrono::milliseconds(value.value());
    }
} // namespace

BaseParser::BaseParser(std::string program)
    : argparse::ArgumentParser(std::move(program), UXBCN_VERSION_FULL, argparse::default_arguments::help) {
    // Provide own version printout
    add_argument("-v", "--version")
        .action([](const auto& /*unused*/) {
            std::cout << "UxBeacon " << UXBCN_VERSION_FULL << "\n"    //
                      << "\tBuild type:\t" << UXBCN_BUILD_TYPE << "\n" //
                      << std::flush;
            std::exit(0); // NOLINT(concurrency-mt-unsafe)
        })
        .default_value(false)
        .help("shows version information and exits")
        .implicit_value(true)
        .nargs(0);
}

void BaseParser::setup() {
    // Console log level (-l)
    add_argument("-l", "--level").help("log level (default: INFO)");
}

BaseParser::BaseOptions BaseParser::parse(std::span<const char*> args) {
    // Parse args
    try {
        parse_args(static_cast<int>(args.size()), args.data());
    } catch(const std::runtime_error& error) {
        throw CommandLineInterfaceError(error.what());
    } catch(const std::invalid_argument& error) {
        // Thrown for values which cannot be converted to the requested type
        throw CommandLineInterfaceError(error.what());
    }

    // Get log level
    const auto level_str = present("level");
    if(!level_str.has_value()) {
        return {};
    }
    const auto level = enum_cast<Level>(level_str.value());
    if(!level.has_value()) {
        throw CommandLineInterfaceError(quote(level_str.value()) + " is not a valid log level, possible value are " +
                                        list_enum_names<Level>());
    }

    return {level};
}

std::string BaseParser::help() const {
    return argparse::ArgumentParser::help().str();
}

BeaconParser::BeaconParser(std::string program) : BaseParser(std::move(program)) {}

void BeaconParser::setup() {
    // Configuration file (-c)
    add_argument("-c", "--config").help("configuration file");

    // Port file (-f)
    add_argument("-f", "--port-file").help("file containing the receiver port (default: ~/.uxplay.ble)");

    // Advertised name (-n)
    add_argument("-n", "--name").help("advertised name (default: UxPlay)");

    // Address selection
    add_argument("--route-host").help("IPv4 address used to select the outbound route (default: 8.8.8.8)");
    add_argument("--route-port").help("port used to select the outbound route (default: 80)").scan<'i', int>();
    add_argument("--route-timeout").help("route selection timeout in ms (default: 1000)").scan<'i', int>();

    // Radio
    add_argument("--radio").help("radio backend, one of " + list_enum_names<RadioBackend>() + " (default: BLUEZ)");
    add_argument("--adapter").help("Bluetooth adapter used by the BLUEZ radio (default: hci0)");

    // Relay radio
    add_argument("--relay-address").help("destination address of relayed advertisements (default: 255.255.255.255)");
    add_argument("--relay-port").help("destination port of relayed advertisements (default: 7124)").scan<'i', int>();
    add_argument("--relay-interval").help("interval between relayed advertisements in ms (default: 1000)").scan<'i', int>();

    // Add base options
    BaseParser::setup();
}

BeaconParser::BeaconOptions BeaconParser::parse(std::span<const char*> args) {
    // Parse base args
    auto base_options = BaseParser::parse(args);

    BeaconOptions options {};
    options.log_level = base_options.log_level;

    const auto config_file = present("config");
    if(config_file.has_value()) {
        options.config_file = config_file.value();
    }

    auto& config = options.config;
    config.level = base_options.log_level;
    config.name = present("name");
    const auto port_file = present("port-file");
    if(port_file.has_value()) {
        config.port_file = port_file.value();
    }

    config.route_host = present("route-host");
    config.route_port = to_port("--route-port", present<int>("route-port"));
    config.route_timeout = to_duration("--route-timeout", present<int>("route-timeout"));

    const auto radio_str = present("radio");
    if(radio_str.has_value()) {
        const auto radio = enum_cast<RadioBackend>(radio_str.value());
        if(!radio.has_value()) {
            throw CommandLineInterfaceError(quote(radio_str.value()) +
                                            " is not a valid radio backend, possible value are " +
                                            list_enum_names<RadioBackend>());
        }
        config.radio = radio;
    }
    config.adapter = present("adapter");

    config.relay_address = present("relay-address");
    config.relay_port = to_port("--relay-port", present<int>("relay-port"));
    config.relay_interval = to_duration("--relay-interval", present<int>("relay-interval"));

    return options;
}
