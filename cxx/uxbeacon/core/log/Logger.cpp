/**
 * @file
 * @brief Implementation of the logger
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Logger.hpp"

#include <string_view>

#include "uxbeacon/core/log/SinkManager.hpp"

using namespace uxbeacon::log;

Logger::Logger(std::string_view topic) : spdlog_logger_(SinkManager::getInstance().getLogger(topic)) {}

Logger& Logger::getDefault() {
    static Logger instance {""};
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::flush() {
    SinkManager::getInstance().flush(*spdlog_logger_);
}
