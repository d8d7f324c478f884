/**
 * @file
 * @brief Implementation of the beacon executable
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "beacon.hpp"

#include <chrono> // IWYU pragma: keep
#include <concepts>
#include <csignal>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <thread>

#include "uxbeacon/beacon/AddressSelector.hpp"
#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/beacon/BluezRadio.hpp"
#include "uxbeacon/beacon/exceptions.hpp"
#include "uxbeacon/beacon/PortResolver.hpp"
#include "uxbeacon/beacon/Publisher.hpp"
#include "uxbeacon/beacon/Radio.hpp"
#include "uxbeacon/beacon/RelayRadio.hpp"
#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Level.hpp"
#include "uxbeacon/core/log/log.hpp"
#include "uxbeacon/core/log/SinkManager.hpp"
#include "uxbeacon/core/networking/exceptions.hpp"
#include "uxbeacon/core/utils/string.hpp"
#include "uxbeacon/exec/BeaconConfig.hpp"
#include "uxbeacon/exec/cli.hpp"
#include "uxbeacon/exec/ConfigParser.hpp"
#include "uxbeacon/exec/exceptions.hpp"

using namespace uxbeacon;
using namespace uxbeacon::beacon;
using namespace uxbeacon::exec;
using namespace uxbeacon::log;
using namespace uxbeacon::networking;
using namespace uxbeacon::utils;
using namespace std::chrono_literals;

// Global variable for signal handler
namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    volatile std::sig_atomic_t signal_v {0};
} // namespace

// The only safe thing a signal handler can do is setting an atomic int
extern "C" void signal_handler(int signal) {
    signal_v = signal;
}

void uxbeacon::exec::beacon_setup_logging(Level default_level) {
    // Set default log level
    SinkManager::getInstance().setConsoleLevel(default_level);

    // Log version
    LOG(STATUS) << "UxBeacon " << UXBCN_VERSION_FULL;
}

BeaconSettings uxbeacon::exec::load_settings(const BeaconParser::BeaconOptions& options) {
    auto config = options.config;
    if(options.config_file.has_value()) {
        // Command line takes precedence over the configuration file
        config.merge(ConfigParser::getConfigFromFile(options.config_file.value()));
    }
    return config.resolve();
}

namespace {
    template <typename R>
        requires std::derived_from<R, Radio>
    int advertise_until_interrupted(R& radio, const BeaconSettings& settings) {
        PortResolver port_resolver {};
        AddressSelector address_selector {settings.route_address, settings.route_port, settings.route_timeout};

        const AdvertisementPublisher publisher {
            radio,
            [&]() { return port_resolver.resolve(settings.port_file); },
            [&]() { return address_selector.select(); },
            settings.name,
        };

        // Register signal handler
        std::signal(SIGTERM, &signal_handler); // NOLINT(cert-err33-c)
        std::signal(SIGINT, &signal_handler);  // NOLINT(cert-err33-c)

        // Power on radio, the publisher advertises on the ready notification
        radio.start();

        // Wait for signal
        while(signal_v == 0 && !publisher.hasFailed()) {
            std::this_thread::sleep_for(50ms);
        }

        if(publisher.hasFailed()) {
            LOG(CRITICAL) << "Beacon could not be published";
            return 1;
        }

        LOG(STATUS) << "Stopping beacon";
        radio.stopAdvertising();
        return 0;
    }
} // namespace

int uxbeacon::exec::run_beacon(const BeaconSettings& settings) {
    LOG(DEBUG) << "Using " << to_string(settings.radio) << " radio";

    if(settings.radio == RadioBackend::RELAY) {
        RelayRadio radio {settings.relay_address, settings.relay_port, settings.relay_interval};
        return advertise_until_interrupted(radio, settings);
    }

    BluezRadio radio {settings.adapter};
    return advertise_until_interrupted(radio, settings);
}

int uxbeacon::exec::beacon_main(std::span<const char*> args, std::string_view program) noexcept {
    try {
        // Get parser and setup
        auto parser = BeaconParser(std::string(program));
        parser.setup();

        // Parse options
        BeaconParser::BeaconOptions options {};
        try {
            options = parser.parse(args);
        } catch(const std::exception& error) {
            LOG(CRITICAL) << "Argument parsing failed: " << error.what() << "\n\n" << parser.help();
            return 1;
        }

        // Load configuration
        BeaconSettings settings {};
        try {
            settings = load_settings(options);
        } catch(const RuntimeError& error) {
            LOG(CRITICAL) << "Loading configuration failed: " << error.what();
            return 1;
        }

        // Set log level
        beacon_setup_logging(settings.level);
        LOG(DEBUG) << "Port file: " << quote(settings.port_file.string());

        // Run beacon
        try {
            return run_beacon(settings);
        } catch(const NetworkError& error) {
            LOG(CRITICAL) << "Failed to open radio: " << error.what();
            return 1;
        } catch(const RadioError& error) {
            LOG(CRITICAL) << "Failed to open radio: " << error.what();
            return 1;
        }

    } catch(const std::exception& error) {
        std::cerr << "Critical failure: " << error.what() << "\n" << std::flush;
    }
    return 1;
}
