/**
 * @file
 * @brief Implementation of the beacon configuration
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "BeaconConfig.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <asio/ip/address_v4.hpp>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/beacon/PortResolver.hpp"
#include "uxbeacon/core/log/Level.hpp"
#include "uxbeacon/exec/exceptions.hpp"

using namespace uxbeacon;
using namespace uxbeacon::exec;

namespace {
    template <typename T> void fill(std::optional<T>& value, const std::optional<T>& fallback) {
        if(!value.has_value()) {
            value = fallback;
        }
    }

    asio::ip::address_v4 parse_address(std::string_view key, const std::string& address) {
        std::error_code ec {};
        const auto parsed = asio::ip::make_address_v4(address, ec);
        if(ec) {
            throw ConfigValueError(key, "`" + address + "` is not a dotted-quad IPv4 address");
        }
        return parsed;
    }
} // namespace

void BeaconConfig::merge(const BeaconConfig& fallback) {
    fill(name, fallback.name);
    fill(port_file, fallback.port_file);
    fill(level, fallback.level);
    fill(route_host, fallback.route_host);
    fill(route_port, fallback.route_port);
    fill(route_timeout, fallback.route_timeout);
    fill(radio, fallback.radio);
    fill(adapter, fallback.adapter);
    fill(relay_address, fallback.relay_address);
    fill(relay_port, fallback.relay_port);
    fill(relay_interval, fallback.relay_interval);
}

BeaconSettings BeaconConfig::resolve() const {
    return {
        name.value_or(std::string(beacon::DEFAULT_NAME)),
        port_file.has_value() ? port_file.value() : beacon::default_port_file(),
        level.value_or(log::Level::INFO),
        parse_address("address.route_host", route_host.value_or(std::string(beacon::DEFAULT_ROUTE_HOST))),
        route_port.value_or(beacon::DEFAULT_ROUTE_PORT),
        route_timeout.value_or(beacon::DEFAULT_ROUTE_TIMEOUT),
        radio.value_or(beacon::RadioBackend::BLUEZ),
        adapter.value_or(std::string(beacon::DEFAULT_ADAPTER)),
        relay_address.has_value() ? parse_address("relay.address", relay_address.value())
                                  : asio::ip::address_v4::broadcast(),
        relay_port.value_or(beacon::RELAY_PORT),
        relay_interval.value_or(beacon::DEFAULT_RELAY_INTERVAL),
    };
}
