/**
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <catch2/catch_test_macros.hpp>
#include <spdlog/common.h>

#include "uxbeacon/core/log/Level.hpp"
#include "uxbeacon/core/log/log.hpp"
#include "uxbeacon/core/log/Logger.hpp"
#include "uxbeacon/core/log/SinkManager.hpp"

using namespace uxbeacon::log;

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Log to topic logger", "[logging]") {
    SinkManager::getInstance().setConsoleLevel(TRACE);
    const Logger logger {"TopicLogging"};
    REQUIRE(logger.shouldLog(TRACE));

    LOG(logger, TRACE) << "trace";
    LOG(logger, DEBUG) << "debug";
    LOG(logger, INFO) << "info";
    LOG(logger, WARNING) << "warning";
    LOG(logger, STATUS) << "status";
    LOG(logger, CRITICAL) << "critical";
}

TEST_CASE("Log to default logger", "[logging]") {
    SinkManager::getInstance().setConsoleLevel(TRACE);

    LOG(INFO) << "info";
    LOG(STATUS) << "status";
    LOG_IF(WARNING, true) << "warning";
    LOG_N(CRITICAL, 1) << "critical";

    // The default logger lives until the end of the program
    Logger::getDefault().flush();
}

TEST_CASE("Topics are case-insensitive", "[logging]") {
    auto& sink_manager = SinkManager::getInstance();
    REQUIRE(sink_manager.getLogger("relay") == sink_manager.getLogger("RELAY"));
    REQUIRE(sink_manager.getLogger("relay")->name() == "RELAY");
    REQUIRE(sink_manager.getLogger("")->name().empty());
}

TEST_CASE("Conditional logging", "[logging]") {
    SinkManager::getInstance().setConsoleLevel(TRACE);
    const Logger logger {"ConditionalLogging"};

    int count_if {0};
    int count_n {0};
    for(int i = 0; i < 5; ++i) {
        LOG_IF(logger, STATUS, i % 2 == 1) << "log if, i=" << i << ", count " << ++count_if;
        LOG_N(logger, STATUS, 3) << "log n, i=" << i << ", count " << ++count_n;
    }

    REQUIRE(count_if == 2);
    REQUIRE(count_n == 3);
}

TEST_CASE("Suppressed messages do not use up the count", "[logging]") {
    const Logger logger {"SuppressedCount"};
    int count {0};

    const auto log_twice = [&]() {
        for(int i = 0; i < 2; ++i) {
            LOG_N(logger, DEBUG, 2) << "log n " << ++count;
        }
    };

    SinkManager::getInstance().setConsoleLevel(WARNING);
    log_twice();
    REQUIRE(count == 0);

    SinkManager::getInstance().setConsoleLevel(DEBUG);
    log_twice();
    log_twice();
    REQUIRE(count == 2);
}

TEST_CASE("Messages below the console level are not evaluated", "[logging]") {
    SinkManager::getInstance().setConsoleLevel(WARNING);
    const Logger logger {"Suppressed"};

    int count {0};
    LOG(logger, DEBUG) << "not evaluated " << ++count;
    LOG_IF(logger, DEBUG, ++count > 0) << "not evaluated";
    LOG(logger, WARNING) << "evaluated " << ++count;

    REQUIRE(count == 1);
}

TEST_CASE("Console level applies to existing and new loggers", "[logging]") {
    const Logger existing {"ExistingLogger"};

    SinkManager::getInstance().setConsoleLevel(STATUS);
    REQUIRE_FALSE(existing.shouldLog(WARNING));
    REQUIRE(existing.shouldLog(STATUS));

    const Logger created {"CreatedLogger"};
    REQUIRE_FALSE(created.shouldLog(INFO));
    REQUIRE(created.shouldLog(CRITICAL));

    SinkManager::getInstance().setConsoleLevel(OFF);
    REQUIRE_FALSE(existing.shouldLog(CRITICAL));

    SinkManager::getInstance().setConsoleLevel(TRACE);
    REQUIRE(existing.shouldLog(TRACE));
    REQUIRE(created.shouldLog(TRACE));
}

TEST_CASE("Conversion to spdlog levels", "[logging]") {
    REQUIRE(to_spdlog_level(TRACE) == spdlog::level::trace);
    REQUIRE(to_spdlog_level(CRITICAL) == spdlog::level::critical);
    REQUIRE(to_spdlog_level(OFF) == spdlog::level::off);
    REQUIRE(from_spdlog_level(to_spdlog_level(STATUS)) == STATUS);
    REQUIRE(from_spdlog_level(to_spdlog_level(WARNING)) == WARNING);
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
