/**
 * @file
 * @brief Logger
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <memory>
#include <source_location>
#include <sstream>
#include <string_view>

#include <spdlog/async_logger.h>

#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Level.hpp"

namespace uxbeacon::log {

    /**
     * @brief Console logger for a single topic
     *
     * Messages are streamed into the object returned by `log()` and written to the spdlog logger of the topic once the
     * stream goes out of scope. Loggers with the same topic share the spdlog logger.
     */
    class Logger {
    public:
        /** Stream collecting a single log message */
        class LogStream final : public std::ostringstream {
        public:
            LogStream(const Logger& logger, Level level, std::source_location src_loc)
                : logger_(logger), level_(level), src_loc_(src_loc) {}
            ~LogStream() final { logger_.write(level_, view(), src_loc_); } // NOLINT(bugprone-exception-escape)

            /// @cond doxygen_suppress
            LogStream(const LogStream& other) = delete;
            LogStream& operator=(const LogStream& other) = delete;
            LogStream(LogStream&& other) = delete;
            LogStream& operator=(LogStream&& other) = delete;
            /// @endcond

        private:
            const Logger& logger_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
            Level level_;
            std::source_location src_loc_;
        };

    public:
        /**
         * @brief Construct a logger
         *
         * @param topic Topic of the logger, converted to upper-case. The empty topic is the default logger.
         */
        UXBCN_API explicit Logger(std::string_view topic);

        /** Logger without topic */
        UXBCN_API static Logger& getDefault();

        UXBCN_API ~Logger();

        /// @cond doxygen_suppress
        Logger(const Logger& other) = delete;
        Logger& operator=(const Logger& other) = delete;
        Logger(Logger&& other) = delete;
        Logger& operator=(Logger&& other) = delete;
        /// @endcond

        /** Whether a message with the given level would be written */
        bool shouldLog(Level level) const { return spdlog_logger_->should_log(to_spdlog_level(level)); }

        /**
         * @brief Start a log message
         *
         * @param level Level of the message
         * @param src_loc Location of the log statement
         * @return Stream which writes the message on destruction
         */
        LogStream log(Level level, std::source_location src_loc = std::source_location::current()) const {
            return {*this, level, src_loc};
        }

        /** Write all pending messages of this logger to the console */
        UXBCN_API void flush();

    private:
        void write(Level level, std::string_view message, const std::source_location& src_loc) const {
            spdlog_logger_->log({src_loc.file_name(), static_cast<int>(src_loc.line()), src_loc.function_name()},
                                to_spdlog_level(level),
                                message);
        }

    private:
        std::shared_ptr<spdlog::async_logger> spdlog_logger_;
    };

} // namespace uxbeacon::log
