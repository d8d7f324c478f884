/**
 * @file
 * @brief Log sink manager
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/async_logger.h>
#include <spdlog/common.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Level.hpp"

namespace uxbeacon::log {

    /**
     * @brief Owner of the console sink and of one asynchronous spdlog logger per topic
     *
     * All loggers write through the same thread pool to a colored console sink with the format
     * `|2026-01-10 00:16:40.922|   STATUS [TOPIC] message`.
     */
    class SinkManager {
    private:
        // Level name right-aligned to eight characters
        class LevelFormatter : public spdlog::custom_flag_formatter {
        public:
            void format(const spdlog::details::log_msg& msg, const std::tm& tm, spdlog::memory_buf_t& dest) override;
            std::unique_ptr<spdlog::custom_flag_formatter> clone() const override;
        };

        // Topic in brackets, nothing for the default logger
        class TopicFormatter : public spdlog::custom_flag_formatter {
        public:
            void format(const spdlog::details::log_msg& msg, const std::tm& tm, spdlog::memory_buf_t& dest) override;
            std::unique_ptr<spdlog::custom_flag_formatter> clone() const override;
        };

    public:
        UXBCN_API static SinkManager& getInstance();

        /// @cond doxygen_suppress
        SinkManager(const SinkManager& other) = delete;
        SinkManager& operator=(const SinkManager& other) = delete;
        SinkManager(SinkManager&& other) = delete;
        SinkManager& operator=(SinkManager&& other) = delete;
        /// @endcond

        UXBCN_API ~SinkManager();

        /**
         * @brief Get the logger of a topic, creating it on first use
         *
         * @param topic Topic of the logger, case-insensitive
         * @return Shared pointer to the logger
         */
        UXBCN_API std::shared_ptr<spdlog::async_logger> getLogger(std::string_view topic);

        /**
         * @brief Set the console level of all existing and future loggers
         *
         * @param level Console log level
         */
        UXBCN_API void setConsoleLevel(Level level);

        /**
         * @brief Flush a logger once its queued messages are written
         *
         * @param logger Logger to flush
         */
        UXBCN_API void flush(spdlog::async_logger& logger);

    private:
        SinkManager();

    private:
        std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;

        std::mutex mutex_;
        std::map<std::string, std::shared_ptr<spdlog::async_logger>, std::less<>> loggers_;
        Level console_level_ {Level::INFO};
    };

} // namespace uxbeacon::log
