/**
 * @file
 * @brief Beacon configuration assembled from defaults, configuration file and command line
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <asio/ip/address_v4.hpp>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Level.hpp"
#include "uxbeacon/core/networking/Port.hpp"

namespace uxbeacon::exec {

    /** Fully resolved settings of the beacon */
    struct BeaconSettings {
        std::string name;
        std::filesystem::path port_file;
        log::Level level;
        asio::ip::address_v4 route_address;
        networking::Port route_port;
        std::chrono::milliseconds route_timeout;
        beacon::RadioBackend radio;
        std::string adapter;
        asio::ip::address_v4 relay_address;
        networking::Port relay_port;
        std::chrono::milliseconds relay_interval;
    };

    /**
     * @brief Partial beacon configuration from a single source
     *
     * Unset values are taken from a source with lower precedence or from the built-in defaults.
     */
    struct BeaconConfig {
        std::optional<std::string> name;
        std::optional<std::filesystem::path> port_file;
        std::optional<log::Level> level;
        std::optional<std::string> route_host;
        std::optional<networking::Port> route_port;
        std::optional<std::chrono::milliseconds> route_timeout;
        std::optional<beacon::RadioBackend> radio;
        std::optional<std::string> adapter;
        std::optional<std::string> relay_address;
        std::optional<networking::Port> relay_port;
        std::optional<std::chrono::milliseconds> relay_interval;

        /**
         * @brief Fill all unset values from a configuration with lower precedence
         *
         * @param fallback Configuration with lower precedence
         */
        UXBCN_API void merge(const BeaconConfig& fallback);

        /**
         * @brief Resolve the configuration into settings, using built-in defaults for unset values
         *
         * @return Beacon settings
         * @throw ConfigValueError if an address is not a dotted-quad IPv4 address
         * @throw utils::RuntimeError if the default port file location cannot be determined
         */
        UXBCN_API BeaconSettings resolve() const;
    };

} // namespace uxbeacon::exec
