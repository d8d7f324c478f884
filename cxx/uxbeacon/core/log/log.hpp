/**
 * @file
 * @brief Log macros
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <atomic> // IWYU pragma: keep

#include "uxbeacon/core/log/Level.hpp"  // IWYU pragma: export
#include "uxbeacon/core/log/Logger.hpp" // IWYU pragma: keep

using enum uxbeacon::log::Level; // Forward log level enum

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/// @cond doxygen_suppress

// Token pasting that expands its arguments first, needed to paste __LINE__
#define UXBCN_LOG_PASTE(x, y) x##y
#define UXBCN_LOG_EXPAND_PASTE(x, y) UXBCN_LOG_PASTE(x, y)

// Per-call-site counter variable
#define UXBCN_LOG_COUNTER UXBCN_LOG_EXPAND_PASTE(uxbcn_log_counter_l, __LINE__)

// Picks the fourth argument, used to dispatch on the number of macro arguments
#define UXBCN_LOG_PICK(_1, _2, _3, name, ...) name

// Stream only evaluated if the level is enabled
#define UXBCN_LOG_TO(logger, level)                                                                                         \
    if((logger).shouldLog(level))                                                                                           \
    (logger).log(level)
#define UXBCN_LOG_TO_DEFAULT(level) UXBCN_LOG_TO(uxbeacon::log::Logger::getDefault(), level)

// Condition only evaluated if the level is enabled
#define UXBCN_LOG_IF_TO(logger, level, condition)                                                                           \
    if((logger).shouldLog(level) && (condition))                                                                            \
    (logger).log(level)
#define UXBCN_LOG_IF_TO_DEFAULT(level, condition) UXBCN_LOG_IF_TO(uxbeacon::log::Logger::getDefault(), level, condition)

// Counter only advanced by messages which pass the level check, the last permitted message announces the suppression
#define UXBCN_LOG_N_TO(logger, level, count)                                                                                \
    static std::atomic_int UXBCN_LOG_COUNTER {0};                                                                           \
    if((logger).shouldLog(level))                                                                                           \
        if(const auto uxbcn_log_n = ++UXBCN_LOG_COUNTER; uxbcn_log_n <= (count))                                            \
    (logger).log(level) << (uxbcn_log_n == (count) ? "(suppressing further messages) " : "")
#define UXBCN_LOG_N_TO_DEFAULT(level, count) UXBCN_LOG_N_TO(uxbeacon::log::Logger::getDefault(), level, count)

/// @endcond

/**
 * Logs a message with the given level, either to the default logger or to a logger instance:
 *
 * * `LOG(level) << message`
 * * `LOG(logger, level) << message`
 *
 * The message is only assembled if the level is enabled for the logger.
 */
#define LOG(...) UXBCN_LOG_PICK(__VA_ARGS__, , UXBCN_LOG_TO, UXBCN_LOG_TO_DEFAULT, )(__VA_ARGS__)

/**
 * Logs a message if a condition holds:
 *
 * * `LOG_IF(level, condition) << message`
 * * `LOG_IF(logger, level, condition) << message`
 *
 * The condition is only evaluated if the level is enabled for the logger.
 */
#define LOG_IF(...) UXBCN_LOG_PICK(__VA_ARGS__, UXBCN_LOG_IF_TO, UXBCN_LOG_IF_TO_DEFAULT, , )(__VA_ARGS__)

/**
 * Logs a message from this call site at most `count` times:
 *
 * * `LOG_N(level, count) << message`
 * * `LOG_N(logger, level, count) << message`
 */
#define LOG_N(...) UXBCN_LOG_PICK(__VA_ARGS__, UXBCN_LOG_N_TO, UXBCN_LOG_N_TO_DEFAULT, , )(__VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)
