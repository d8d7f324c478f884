/**
 * @file
 * @brief Log levels
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <spdlog/common.h>

namespace uxbeacon::log {
    /** Log levels
     *
     * The chosen values allow for direct casting to spdlog::level::level_enum. The STATUS level takes the place of the
     * spdlog error level and is used for the few lifecycle milestones an operator should always see.
     */
    enum class Level : int { // NOLINT(performance-enum-size)
        /** verbose information which allows to follow the call stack of the host program. */
        TRACE = 0,

        /** information relevant to developers for debugging the host program. */
        DEBUG = 1,

        /** information on regular events intended for end users of the host program. */
        INFO = 2,

        /** notify the end user of the host program of unexpected events which require further investigation. */
        WARNING = 3,

        /** communicate important information about the host program to the end user with low frequency. */
        STATUS = 4,

        /** notify the end user about critical events which require immediate attention. */
        CRITICAL = 5,

        /** no logging */
        OFF = 6,
    };
    using enum Level;

    /**
     * Helper function to convert verbosity levels to spdlog::Level::level_enum values
     *
     * @param level Verbosity level
     * @return spdlog level value
     */
    constexpr spdlog::level::level_enum to_spdlog_level(Level level) {
        return static_cast<spdlog::level::level_enum>(level);
    }

    /**
     * Helper function to convert spdlog::Level::level_enum values to verbosity levels
     *
     * @param level spdlog level value
     * @return Verbosity level
     */
    constexpr Level from_spdlog_level(spdlog::level::level_enum level) {
        return static_cast<Level>(level);
    }
} // namespace uxbeacon::log
