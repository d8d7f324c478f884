/**
 * @file
 * @brief Beacon executable
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <span>
#include <string_view>

#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Level.hpp"
#include "uxbeacon/exec/BeaconConfig.hpp"
#include "uxbeacon/exec/cli.hpp"

namespace uxbeacon::exec {

    /**
     * @brief Set the console log level and log the version
     *
     * @param default_level Console log level
     */
    UXBCN_API void beacon_setup_logging(log::Level default_level);

    /**
     * @brief Combine command line options, configuration file and defaults into the beacon settings
     *
     * @param options Options parsed from the command line
     * @return Beacon settings
     * @throw ConfigError if the configuration file cannot be used
     */
    UXBCN_API BeaconSettings load_settings(const BeaconParser::BeaconOptions& options);

    /**
     * @brief Publish the beacon and wait until interrupted
     *
     * @param settings Beacon settings
     * @return Exit code, zero after an interrupt and one if the beacon could not be published
     * @throw networking::NetworkError if the relay radio cannot be opened
     * @throw beacon::RadioError if the Bluetooth adapter is not available
     */
    UXBCN_API int run_beacon(const BeaconSettings& settings);

    /**
     * @brief Main function for the beacon executable
     *
     * @param args Command line arguments
     * @param program Name of the program
     * @return Exit code
     */
    UXBCN_API int beacon_main(std::span<const char*> args, std::string_view program) noexcept;

} // namespace uxbeacon::exec
