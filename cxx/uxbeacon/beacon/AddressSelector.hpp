/**
 * @file
 * @brief Selection of the IPv4 address to advertise
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <asio/ip/address_v4.hpp>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Logger.hpp"
#include "uxbeacon/core/networking/Port.hpp"

namespace uxbeacon::beacon {

    /**
     * @brief Selects the IPv4 address under which the receiver is most likely reachable
     *
     * The selection never fails. The route lookup is tried first, then the addresses assigned to the hostname, and
     * finally the loopback address is returned. Errors of either lookup are logged and treated as no result.
     */
    class AddressSelector {
    public:
        /** Lookup returning the local address of the outbound route, if any */
        using RouteLookup = std::function<std::optional<asio::ip::address_v4>()>;

        /** Lookup returning all IPv4 addresses assigned to the host */
        using HostLookup = std::function<std::vector<asio::ip::address_v4>()>;

    public:
        /**
         * @brief Construct an address selector probing the local network stack
         *
         * @param route_address Remote address used to select the outbound route
         * @param route_port Remote port used to select the outbound route
         * @param route_timeout Maximum time to wait for the route selection
         */
        UXBCN_API
        AddressSelector(asio::ip::address_v4 route_address = asio::ip::make_address_v4(DEFAULT_ROUTE_HOST.data()),
                        networking::Port route_port = DEFAULT_ROUTE_PORT,
                        std::chrono::milliseconds route_timeout = DEFAULT_ROUTE_TIMEOUT);

        /**
         * @brief Construct an address selector with custom lookups
         *
         * @param route_lookup Lookup for the outbound route address
         * @param host_lookup Lookup for the addresses assigned to the host
         */
        UXBCN_API AddressSelector(RouteLookup route_lookup, HostLookup host_lookup);

        /**
         * @brief Select the address to advertise
         *
         * @return Selected IPv4 address, `127.0.0.1` if no lookup yields a usable address
         */
        UXBCN_API asio::ip::address_v4 select();

        /**
         * @brief Pick the preferred address from a list of host addresses
         *
         * Private ranges are preferred in the order 192.168.0.0/16, 10.0.0.0/8 and 172.16.0.0/12, otherwise the first
         * non-loopback address is picked.
         *
         * @param addresses Addresses assigned to the host
         * @return Preferred address, empty if the list only contains loopback addresses
         */
        UXBCN_API static std::optional<asio::ip::address_v4>
        pick_preferred(std::span<const asio::ip::address_v4> addresses);

    private:
        std::optional<asio::ip::address_v4> run_route_lookup();
        std::optional<asio::ip::address_v4> run_host_lookup();

    private:
        RouteLookup route_lookup_;
        HostLookup host_lookup_;
        log::Logger logger_;
    };

    /**
     * @brief Select the address to advertise by probing the local network stack with default settings
     *
     * @return Selected IPv4 address
     */
    UXBCN_API asio::ip::address_v4 select_address();

} // namespace uxbeacon::beacon
