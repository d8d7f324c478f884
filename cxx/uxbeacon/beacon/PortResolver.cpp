/**
 * @file
 * @brief Implementation of the port resolver
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "PortResolver.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/beacon/exceptions.hpp"
#include "uxbeacon/core/log/log.hpp"
#include "uxbeacon/core/networking/Port.hpp"
#include "uxbeacon/core/utils/casts.hpp"
#include "uxbeacon/core/utils/env.hpp"
#include "uxbeacon/core/utils/string.hpp"

using namespace uxbeacon::beacon;
using namespace uxbeacon::networking;
using namespace uxbeacon::utils;

std::optional<Port> uxbeacon::beacon::parse_text_port(std::span<const std::byte> content) {
    // Cut at the first newline, then at the first null byte within the line
    auto line = content.first(static_cast<std::size_t>(std::ranges::find(content, std::byte('\n')) - content.begin()));
    line = line.first(static_cast<std::size_t>(std::ranges::find(line, std::byte('\0')) - line.begin()));

    if(line.empty()) {
        return std::nullopt;
    }
    const auto is_digit = [](std::byte b) {
        const auto c = std::to_integer<std::uint8_t>(b);
        return c >= '0' && c <= '9';
    };
    if(!std::ranges::all_of(line, is_digit)) {
        return std::nullopt;
    }

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const std::string_view text {reinterpret_cast<const char*>(line.data()), line.size()};
    Port port {};
    const auto result = std::from_chars(text.data(), text.data() + text.size(), port);
    if(result.ec != std::errc()) {
        throw PortParseError("decimal value " + quote(text) + " does not fit into a 16-bit port");
    }
    return port;
}

std::optional<Port> uxbeacon::beacon::parse_binary_port(std::span<const std::byte> content) {
    if(content.size() < 2) {
        return std::nullopt;
    }
    // Port in network byte order (MSB first)
    const auto port = static_cast<Port>((std::to_integer<unsigned int>(content[0]) << 8U) |
                                        std::to_integer<unsigned int>(content[1]));
    if(port < MIN_BINARY_PORT) {
        return std::nullopt;
    }
    return port;
}

std::filesystem::path uxbeacon::beacon::default_port_file() {
    return home_directory() / PORT_FILE_NAME;
}

PortResolver::PortResolver() : PortResolver({{"text", &parse_text_port}, {"binary", &parse_binary_port}}) {}

PortResolver::PortResolver(std::vector<Strategy> strategies) : strategies_(std::move(strategies)), logger_("PORT") {}

Port PortResolver::resolve(const std::filesystem::path& path) {
    std::error_code ec {};
    const auto exists = std::filesystem::exists(path, ec);
    if(ec) {
        LOG(logger_, DEBUG) << "Could not stat port file: " << ec.message();
        throw PortFileReadError(path);
    }
    if(!exists) {
        throw FileMissingError(path);
    }
    if(!std::filesystem::is_regular_file(path, ec)) {
        throw PortFileReadError(path);
    }

    LOG(logger_, DEBUG) << "Reading port file " << quote(path.string());
    std::ifstream file {path, std::ios::binary};
    if(!file.is_open()) {
        throw PortFileReadError(path);
    }
    std::ostringstream buffer {};
    buffer << file.rdbuf();
    if(file.bad()) {
        throw PortFileReadError(path);
    }
    const auto content = buffer.str();
    LOG(logger_, TRACE) << "Port file content: " << bytes_to_hex_string(to_byte_span(content));

    return parse(to_byte_span(content));
}

Port PortResolver::parse(std::span<const std::byte> content) {
    for(const auto& strategy : strategies_) {
        const auto port = strategy.parse(content);
        if(port.has_value()) {
            LOG(logger_, DEBUG) << "Resolved port " << port.value() << " using " << strategy.name << " strategy";
            return port.value();
        }
        LOG(logger_, TRACE) << "Strategy " << strategy.name << " did not yield a port";
    }
    throw PortParseError("content is neither a decimal number nor a binary port number of at least " +
                         to_string(MIN_BINARY_PORT));
}

Port uxbeacon::beacon::resolve_port(const std::filesystem::path& path) {
    PortResolver resolver {};
    return resolver.resolve(path);
}
