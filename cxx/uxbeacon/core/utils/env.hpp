/**
 * @file
 * @brief Environment variable wrappers
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <optional>
#include <ranges>
#include <regex>
#include <string>

#include <pwd.h>
#include <unistd.h>

#include "uxbeacon/core/utils/exceptions.hpp"
#include "uxbeacon/core/utils/string.hpp"

namespace uxbeacon::utils {

    /**
     * @brief Wrapper for std::getenv to read environment variables
     *
     * @param name Name of the environment variable
     * @return Optional with the value read from the environment variable
     */
    inline std::optional<std::string> getenv(const std::string& name) {
        static std::mutex getenv_mutex;
        std::lock_guard<std::mutex> lock(getenv_mutex);

        const auto* val = std::getenv(name.c_str()); // NOLINT(concurrency-mt-unsafe)
        if(val == nullptr) {
            return std::nullopt;
        }
        return std::string(val);
    }

    /**
     * @brief Helper to resolve all environment variables in a string
     * @details For each match of the pattern, the first match group is looked up as environment variable and the match
     *          is replaced with its value.
     *
     * @param pattern Input regular expression. Only the first match group is used.
     * @param input Input string to resolve matches for
     *
     * @return String with all regular expression matches replaced
     * @throws RuntimeError if an environment variable could not be found
     */
    inline std::string resolve_env(const std::regex& pattern, const std::string& input) {

        std::sregex_iterator begin(input.begin(), input.end(), pattern);
        std::sregex_iterator end {};
        std::size_t last_pos = 0;

        std::string result;
        for(const auto& match : std::ranges::subrange(begin, end)) {
            result += input.substr(last_pos, match.position() - last_pos);
            auto env_val = getenv(match[1]);
            if(!env_val.has_value()) {
                throw RuntimeError("Environment variable " + quote(match[1].str()) + " not defined");
            }
            result += env_val.value();
            last_pos = match.position() + match.length();
        }

        result += input.substr(last_pos);
        return result;
    }

    /**
     * @brief Helper to resolve all environment variables matching ${VAR} or $VAR in configuration values
     *
     * @param config_value Input string to resolve environment variables in
     * @return String with all environment variables replaced with their values
     * @throws RuntimeError if an environment variable could not be found
     */
    inline std::string resolve_config_env(const std::string& config_value) {
        const std::regex config_pattern(R"(\$(?:\{|\b)(\w+)(?:\}|\b))");
        return resolve_env(config_pattern, config_value);
    }

    /**
     * @brief Home directory of the current user
     * @details Uses `HOME` if set, otherwise the home directory from the password database
     *
     * @return Path to the home directory
     * @throws RuntimeError if the home directory cannot be determined
     */
    inline std::filesystem::path home_directory() {
        auto home = getenv("HOME");
        if(home.has_value() && !home->empty()) {
            return home.value();
        }

        const auto* pw = getpwuid(getuid()); // NOLINT(concurrency-mt-unsafe)
        if(pw == nullptr || pw->pw_dir == nullptr) {
            throw RuntimeError("Unable to determine home directory of the current user");
        }
        return pw->pw_dir;
    }

} // namespace uxbeacon::utils
