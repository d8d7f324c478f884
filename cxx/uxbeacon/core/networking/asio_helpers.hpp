/**
 * @file
 * @brief Asio helper functions
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <asio/ip/address_v4.hpp>

#include "uxbeacon/build.hpp"
#include "uxbeacon/core/networking/Port.hpp"

namespace uxbeacon::networking {

    /**
     * @brief Get hostname of the local machine
     *
     * @throw NetworkError if the hostname cannot be retrieved
     */
    UXBCN_API std::string get_hostname();

    /**
     * @brief Resolve a hostname to all of its IPv4 addresses
     *
     * The addresses are returned in resolver order with duplicates removed.
     *
     * @param hostname Hostname to resolve
     * @return List of IPv4 addresses, empty if the name has no IPv4 address
     * @throw NetworkError if the name cannot be resolved
     */
    UXBCN_API std::vector<asio::ip::address_v4> resolve_host_addresses(std::string_view hostname);

    /**
     * @brief Get the local address the operating system selects to reach a remote endpoint
     *
     * A UDP socket is connected to the remote endpoint, which only performs route selection and does not send any
     * packets. The address the socket was bound to is returned.
     *
     * @param remote_address Remote address used to select the outbound route
     * @param remote_port Remote port
     * @param timeout Maximum time to wait for the connect operation
     * @return Local address of the outbound route
     * @throw NetworkError if no route exists or the timeout was reached
     */
    UXBCN_API asio::ip::address_v4 get_outbound_address(const asio::ip::address_v4& remote_address,
                                                        Port remote_port,
                                                        std::chrono::milliseconds timeout);

    /**
     * @brief Build a URI from an IP address and a port
     *
     * @param address IPv4 address
     * @param port Port
     * @param protocol Protocol (without `://`), can be empty
     * @return URI in the form `protocol://address:port`
     */
    UXBCN_API std::string to_uri(const asio::ip::address_v4& address, Port port, std::string_view protocol = "tcp");

} // namespace uxbeacon::networking
