/**
 * @file
 * @brief Configuration file parser
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Logger.hpp"
#include "uxbeacon/exec/BeaconConfig.hpp"

namespace uxbeacon::exec {

    /**
     * @brief Configuration parser to read TOML files into a beacon configuration
     *
     * The configuration file contains the tables `beacon`, `address` and `relay`. Environment variables in string
     * values are resolved. Unknown keys are ignored with a warning.
     */
    class UXBCN_API ConfigParser {
    public:
        /// @cond doxygen_suppress
        ConfigParser() = default;
        ~ConfigParser() = default;
        ConfigParser(const ConfigParser& other) = delete;
        ConfigParser& operator=(const ConfigParser& other) = delete;
        ConfigParser(ConfigParser&& other) noexcept = delete;
        ConfigParser& operator=(ConfigParser&& other) = delete;
        /// @endcond

        /**
         * @brief Parse configuration from TOML content
         *
         * @param toml String view of the TOML configuration file contents
         * @return Beacon configuration with all keys present in the file
         * @throws ConfigFileParseError if the configuration could not be parsed into valid TOML
         * @throws ConfigFileTypeError if the configuration contained invalid value types
         * @throws ConfigValueError if the configuration contained invalid values
         */
        static BeaconConfig getConfig(std::string_view toml);

        /**
         * @brief Parse configuration from a TOML file
         *
         * @param file Input file path of the TOML configuration file
         * @return Beacon configuration with all keys present in the file
         * @throws ConfigFileNotFoundError if the configuration file could not be found or opened
         * @throws ConfigFileParseError if the configuration file could not be parsed into valid TOML
         * @throws ConfigFileTypeError if the configuration file contained invalid value types
         * @throws ConfigValueError if the configuration file contained invalid values
         */
        static BeaconConfig getConfigFromFile(const std::filesystem::path& file);

    private:
        static std::string read_file(const std::filesystem::path& file);

        /* Logger */
        static log::Logger config_parser_logger_;
    };

} // namespace uxbeacon::exec
