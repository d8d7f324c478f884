/**
 * @file
 * @brief Implementation of the address selector
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "AddressSelector.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <asio/ip/address_v4.hpp>

#include "uxbeacon/core/log/log.hpp"
#include "uxbeacon/core/networking/asio_helpers.hpp"
#include "uxbeacon/core/networking/Port.hpp"

using namespace uxbeacon::beacon;
using namespace uxbeacon::networking;

namespace {
    struct PrivateNetwork {
        std::uint32_t prefix;
        std::uint32_t mask;
    };

    // Private networks in order of preference
    constexpr std::array<PrivateNetwork, 3> PREFERRED_NETWORKS {{
        {0xC0A80000, 0xFFFF0000}, // 192.168.0.0/16
        {0x0A000000, 0xFF000000}, // 10.0.0.0/8
        {0xAC100000, 0xFFF00000}, // 172.16.0.0/12
    }};
} // namespace

AddressSelector::AddressSelector(asio::ip::address_v4 route_address,
                                 Port route_port,
                                 std::chrono::milliseconds route_timeout)
    : AddressSelector(
          [=]() -> std::optional<asio::ip::address_v4> {
              return get_outbound_address(route_address, route_port, route_timeout);
          },
          []() { return resolve_host_addresses(get_hostname()); }) {}

AddressSelector::AddressSelector(RouteLookup route_lookup, HostLookup host_lookup)
    : route_lookup_(std::move(route_lookup)), host_lookup_(std::move(host_lookup)), logger_("ADDRESS") {}

std::optional<asio::ip::address_v4> AddressSelector::pick_preferred(std::span<const asio::ip::address_v4> addresses) {
    for(const auto& network : PREFERRED_NETWORKS) {
        for(const auto& address : addresses) {
            if((address.to_uint() & network.mask) == network.prefix) {
                return address;
            }
        }
    }
    for(const auto& address : addresses) {
        if(!address.is_loopback()) {
            return address;
        }
    }
    return std::nullopt;
}

std::optional<asio::ip::address_v4> AddressSelector::run_route_lookup() {
    try {
        const auto address = route_lookup_();
        if(!address.has_value()) {
            LOG(logger_, DEBUG) << "Route lookup yielded no address";
            return std::nullopt;
        }
        if(address->is_loopback() || address->is_unspecified()) {
            LOG(logger_, DEBUG) << "Route lookup yielded unusable address " << address->to_string();
            return std::nullopt;
        }
        return address;
    } catch(const std::exception& error) {
        LOG(logger_, DEBUG) << "Route lookup failed: " << error.what();
    }
    return std::nullopt;
}

std::optional<asio::ip::address_v4> AddressSelector::run_host_lookup() {
    try {
        const auto addresses = host_lookup_();
        LOG(logger_, TRACE) << "Host lookup yielded " << addresses.size() << " addresses";
        return pick_preferred(addresses);
    } catch(const std::exception& error) {
        LOG(logger_, DEBUG) << "Host lookup failed: " << error.what();
    }
    return std::nullopt;
}

asio::ip::address_v4 AddressSelector::select() {
    auto address = run_route_lookup();
    if(address.has_value()) {
        LOG(logger_, INFO) << "Using outbound route address " << address->to_string();
        return address.value();
    }

    address = run_host_lookup();
    if(address.has_value()) {
        LOG(logger_, INFO) << "Using host address " << address->to_string();
        return address.value();
    }

    LOG(logger_, WARNING) << "No usable network address found, falling back to loopback";
    return asio::ip::address_v4::loopback();
}

asio::ip::address_v4 uxbeacon::beacon::select_address() {
    AddressSelector selector {};
    return selector.select();
}
