/**
 * @file
 * @brief Collection of all executable exceptions
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <filesystem>
#include <string_view>

#include "uxbeacon/build.hpp"
#include "uxbeacon/core/utils/exceptions.hpp"

namespace uxbeacon::exec {

    /**
     * @ingroup Exceptions
     * @brief Error in the command line interface
     */
    class UXBCN_API CommandLineInterfaceError : public utils::RuntimeError {
    public:
        explicit CommandLineInterfaceError(std::string_view reason) { error_message_ = reason; }
    };

    /**
     * @ingroup Exceptions
     * @brief Base class for all configuration errors
     */
    class UXBCN_API ConfigError : public utils::RuntimeError {
    protected:
        ConfigError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief Notifies of a missing configuration file
     */
    class UXBCN_API ConfigFileNotFoundError : public ConfigError {
    public:
        /**
         * @brief Construct an error for a configuration that is not found
         * @param file_name Name of the configuration file
         */
        explicit ConfigFileNotFoundError(const std::filesystem::path& file_name) {
            error_message_ = "Could not read configuration file " + file_name.string();
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Error with parsing the file content to TOML
     */
    class UXBCN_API ConfigFileParseError : public ConfigError {
    public:
        /**
         * @brief Construct an error for a configuration file that cannot correctly be parsed as TOML
         * @param error Error message returned by the TOML parser
         */
        explicit ConfigFileParseError(std::string_view error) {
            error_message_ = "Could not parse content of configuration file: ";
            error_message_ += error;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Error with the type of a key in the configuration file
     */
    class UXBCN_API ConfigFileTypeError : public ConfigError {
    public:
        /**
         * @brief Construct an error for a configuration key that has an invalid type
         * @param key The offending configuration key
         * @param error Error message
         */
        explicit ConfigFileTypeError(std::string_view key, std::string_view error) {
            error_message_ = "Invalid value type for key ";
            error_message_ += key;
            error_message_ += ": ";
            error_message_ += error;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief Configuration value of the correct type but outside of the allowed values
     */
    class UXBCN_API ConfigValueError : public ConfigError {
    public:
        explicit ConfigValueError(std::string_view key, std::string_view error) {
            error_message_ = "Invalid value for key ";
            error_message_ += key;
            error_message_ += ": ";
            error_message_ += error;
        }
    };

} // namespace uxbeacon::exec
