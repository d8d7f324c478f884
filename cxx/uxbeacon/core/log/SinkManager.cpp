/**
 * @file
 * @brief Implementation of the log sink manager
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "SinkManager.hpp"

#include <cctype>
#include <cstddef>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/common.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "uxbeacon/core/log/Level.hpp"
#include "uxbeacon/core/utils/string.hpp"

using namespace uxbeacon::log;
using namespace uxbeacon::utils;

namespace {
    // Queue size of the logging thread pool
    constexpr std::size_t QUEUE_SIZE = 1024;
} // namespace

void SinkManager::LevelFormatter::format(const spdlog::details::log_msg& msg,
                                         const std::tm& /*tm*/,
                                         spdlog::memory_buf_t& dest) {
    const auto level_name = to_string(from_spdlog_level(msg.level));
    const std::string padding(level_name.size() < 8 ? 8 - level_name.size() : 0, ' ');
    dest.append(padding.data(), padding.data() + padding.size());
    dest.append(level_name.data(), level_name.data() + level_name.size());
}

std::unique_ptr<spdlog::custom_flag_formatter> SinkManager::LevelFormatter::clone() const {
    return std::make_unique<LevelFormatter>();
}

void SinkManager::TopicFormatter::format(const spdlog::details::log_msg& msg,
                                         const std::tm& /*tm*/,
                                         spdlog::memory_buf_t& dest) {
    const std::string_view topic {msg.logger_name.data(), msg.logger_name.size()};
    if(!topic.empty()) {
        dest.push_back('[');
        dest.append(topic.data(), topic.data() + topic.size());
        dest.push_back(']');
    }
}

std::unique_ptr<spdlog::custom_flag_formatter> SinkManager::TopicFormatter::clone() const {
    return std::make_unique<TopicFormatter>();
}

SinkManager& SinkManager::getInstance() {
    static SinkManager instance {};
    return instance;
}

SinkManager::SinkManager() {
    spdlog::init_thread_pool(QUEUE_SIZE, 1);

    // Loggers filter by level, the sink passes everything
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(to_spdlog_level(TRACE));

    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelFormatter>('l');
    formatter->add_flag<TopicFormatter>('n');
    formatter->set_pattern("|%Y-%m-%d %H:%M:%S.%e| %^%l%$ %n %v");
    console_sink_->set_formatter(std::move(formatter));

    console_sink_->set_color(to_spdlog_level(CRITICAL), "\x1B[31;1m"); // Bold red
    console_sink_->set_color(to_spdlog_level(STATUS), "\x1B[32;1m");   // Bold green
    console_sink_->set_color(to_spdlog_level(WARNING), "\x1B[33;1m");  // Bold yellow
    console_sink_->set_color(to_spdlog_level(INFO), "\x1B[36;1m");     // Bold cyan
    console_sink_->set_color(to_spdlog_level(DEBUG), "\x1B[36m");      // Cyan
    console_sink_->set_color(to_spdlog_level(TRACE), "\x1B[90m");      // Grey
}

SinkManager::~SinkManager() {
    loggers_.clear();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::async_logger> SinkManager::getLogger(std::string_view topic) {
    auto topic_uc = transform(topic, ::toupper);

    const std::lock_guard lock {mutex_};
    const auto logger_it = loggers_.find(topic_uc);
    if(logger_it != loggers_.end()) {
        return logger_it->second;
    }

    auto logger = std::make_shared<spdlog::async_logger>(
        topic_uc, console_sink_, spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    logger->set_level(to_spdlog_level(console_level_));
    loggers_.emplace(std::move(topic_uc), logger);
    return logger;
}

void SinkManager::setConsoleLevel(Level level) {
    const std::lock_guard lock {mutex_};
    console_level_ = level;
    for(auto& [topic, logger] : loggers_) {
        logger->set_level(to_spdlog_level(level));
    }
}

void SinkManager::flush(spdlog::async_logger& logger) {
    // Queued behind all pending messages of the logger
    logger.flush();
}
