/**
 * @file
 * @brief Implementation of the configuration file parser
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "ConfigParser.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>

#include <toml++/toml.hpp>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/core/log/Level.hpp"
#include "uxbeacon/core/log/log.hpp"
#include "uxbeacon/core/networking/Port.hpp"
#include "uxbeacon/core/utils/enum.hpp"
#include "uxbeacon/core/utils/env.hpp"
#include "uxbeacon/core/utils/exceptions.hpp"
#include "uxbeacon/core/utils/string.hpp"
#include "uxbeacon/exec/BeaconConfig.hpp"
#include "uxbeacon/exec/exceptions.hpp"

using namespace uxbeacon::beacon;
using namespace uxbeacon::exec;
using namespace uxbeacon::log;
using namespace uxbeacon::networking;
using namespace uxbeacon::utils;

Logger ConfigParser::config_parser_logger_("CONFIG");

namespace {
    // Keys understood in each table
    const std::map<std::string_view, std::set<std::string_view>> known_keys {
        {"beacon", {"name", "port_file", "level"}},
        {"address", {"route_host", "route_port", "route_timeout"}},
        {"radio", {"backend", "adapter"}},
        {"relay", {"address", "port", "interval"}},
    };

    std::optional<std::string> get_string(const toml::table& tbl, std::string_view key) {
        const auto node = tbl.at_path(key);
        if(!node) {
            return std::nullopt;
        }
        const auto value = node.value<std::string>();
        if(!node.is_string() || !value.has_value()) {
            throw ConfigFileTypeError(key, "expected string");
        }
        try {
            return resolve_config_env(value.value());
        } catch(const RuntimeError& error) {
            throw ConfigValueError(key, error.what());
        }
    }

    std::optional<std::int64_t> get_integer(const toml::table& tbl, std::string_view key) {
        const auto node = tbl.at_path(key);
        if(!node) {
            return std::nullopt;
        }
        if(!node.is_integer()) {
            throw ConfigFileTypeError(key, "expected integer");
        }
        return node.value<std::int64_t>();
    }

    std::optional<Port> get_port(const toml::table& tbl, std::string_view key) {
        const auto value = get_integer(tbl, key);
        if(!value.has_value()) {
            return std::nullopt;
        }
        if(value.value() < 1 || value.value() > std::numeric_limits<Port>::max()) {
            throw ConfigValueError(key, to_string(value.value()) + " is not a valid port");
        }
        return static_cast<Port>(value.value());
    }

    std::optional<std::chrono::milliseconds> get_duration(const toml::table& tbl, std::string_view key) {
        const auto value = get_integer(tbl, key);
        if(!value.has_value()) {
            return std::nullopt;
        }
        if(value.value() <= 0) {
            throw ConfigValueError(key, "duration has to be positive");
        }
        return std::chrono::milliseconds(value.value());
    }
} // namespace

std::string ConfigParser::read_file(const std::filesystem::path& filepath) {
    std::error_code ec {};
    if(!std::filesystem::is_regular_file(filepath, ec)) {
        throw ConfigFileNotFoundError(filepath);
    }

    // Convert main file to absolute path
    auto file_path_abs = std::filesystem::canonical(filepath, ec);
    if(ec) {
        throw ConfigFileNotFoundError(filepath);
    }
    LOG(config_parser_logger_, DEBUG) << "Parsing configuration file " << std::quoted(file_path_abs.string());

    std::ifstream file(file_path_abs);
    if(!file) {
        throw ConfigFileNotFoundError(file_path_abs);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

BeaconConfig ConfigParser::getConfigFromFile(const std::filesystem::path& filepath) {
    const auto buffer = read_file(filepath);
    return getConfig(buffer);
}

BeaconConfig ConfigParser::getConfig(std::string_view toml) {

    toml::table tbl {};
    try {
        tbl = toml::parse(toml);
    } catch(const toml::parse_error& err) {
        std::stringstream s;
        s << err;
        throw ConfigFileParseError(s.str());
    }

    // Warn about keys which are not understood
    tbl.for_each([&](const toml::key& key, auto&& val) {
        const auto table_it = known_keys.find(key.str());
        if(table_it == known_keys.end()) {
            LOG(config_parser_logger_, WARNING) << "Ignoring unknown key " << quote(key.str());
            return;
        }
        if constexpr(toml::is_table<decltype(val)>) {
            val.for_each([&](const toml::key& sub_key, auto&& /*sub_val*/) {
                LOG_IF(config_parser_logger_, WARNING, !table_it->second.contains(sub_key.str()))
                    << "Ignoring unknown key " << quote(std::string(key.str()) + "." + std::string(sub_key.str()));
            });
        } else {
            throw ConfigFileTypeError(key.str(), "expected table");
        }
    });

    BeaconConfig config {};

    config.name = get_string(tbl, "beacon.name");
    const auto port_file = get_string(tbl, "beacon.port_file");
    if(port_file.has_value()) {
        config.port_file = port_file.value();
    }
    const auto level_str = get_string(tbl, "beacon.level");
    if(level_str.has_value()) {
        const auto level = enum_cast<Level>(level_str.value());
        if(!level.has_value()) {
            throw ConfigValueError("beacon.level",
                                   quote(level_str.value()) + " is not a valid log level, possible value are " +
                                       list_enum_names<Level>());
        }
        config.level = level;
    }

    config.route_host = get_string(tbl, "address.route_host");
    config.route_port = get_port(tbl, "address.route_port");
    config.route_timeout = get_duration(tbl, "address.route_timeout");

    const auto backend_str = get_string(tbl, "radio.backend");
    if(backend_str.has_value()) {
        const auto backend = enum_cast<RadioBackend>(backend_str.value());
        if(!backend.has_value()) {
            throw ConfigValueError("radio.backend",
                                   quote(backend_str.value()) + " is not a valid radio backend, possible value are " +
                                       list_enum_names<RadioBackend>());
        }
        config.radio = backend;
    }
    config.adapter = get_string(tbl, "radio.adapter");

    config.relay_address = get_string(tbl, "relay.address");
    config.relay_port = get_port(tbl, "relay.port");
    config.relay_interval = get_duration(tbl, "relay.interval");

    LOG(config_parser_logger_, DEBUG) << "Configuration parsed";
    return config;
}
