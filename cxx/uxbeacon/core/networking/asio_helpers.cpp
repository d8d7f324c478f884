/**
 * @file
 * @brief Implementation of Asio helper functions
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "asio_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>
#include <asio/ip/address_v4.hpp>

#include "uxbeacon/core/networking/exceptions.hpp"
#include "uxbeacon/core/networking/Port.hpp"
#include "uxbeacon/core/utils/string.hpp"

using namespace uxbeacon::networking;
using namespace uxbeacon::utils;

std::string uxbeacon::networking::get_hostname() {
    asio::error_code ec {};
    auto host_name = asio::ip::host_name(ec);
    if(ec) {
        throw NetworkError("Unable to get hostname: " + ec.message());
    }
    return host_name;
}

std::vector<asio::ip::address_v4> uxbeacon::networking::resolve_host_addresses(std::string_view hostname) {
    asio::io_context io_context {};
    asio::ip::udp::resolver resolver {io_context};

    asio::error_code ec {};
    const auto results = resolver.resolve(asio::ip::udp::v4(), std::string(hostname), std::string(), ec);
    if(ec) {
        throw NetworkError("Unable to resolve host " + quote(hostname) + ": " + ec.message());
    }

    // getaddrinfo returns one entry per socket type, remove duplicates without changing the order
    std::vector<asio::ip::address_v4> addresses {};
    for(const auto& entry : results) {
        const auto address = entry.endpoint().address();
        if(!address.is_v4()) {
            continue;
        }
        if(std::ranges::find(addresses, address.to_v4()) == addresses.end()) {
            addresses.emplace_back(address.to_v4());
        }
    }

    return addresses;
}

asio::ip::address_v4 uxbeacon::networking::get_outbound_address(const asio::ip::address_v4& remote_address,
                                                                 Port remote_port,
                                                                 std::chrono::milliseconds timeout) {
    asio::io_context io_context {};
    asio::ip::udp::socket socket {io_context};

    asio::error_code ec {};
    socket.open(asio::ip::udp::v4(), ec);
    if(ec) {
        throw NetworkError("Unable to open socket: " + ec.message());
    }

    // Connecting a datagram socket only selects the route, nothing is sent
    asio::error_code connect_ec {};
    const auto remote_endpoint = asio::ip::udp::endpoint(remote_address, remote_port);
    socket.async_connect(remote_endpoint, [&](const asio::error_code& error) { connect_ec = error; });

    // Run IO context for timeout
    io_context.run_for(timeout);

    // If IO context not stopped, then the connect operation did not complete
    if(!io_context.stopped()) {
        socket.close(ec);
        throw NetworkError("Route selection towards " + to_uri(remote_address, remote_port, "") + " timed out after " +
                           to_string(timeout));
    }
    if(connect_ec) {
        throw NetworkError("No route towards " + to_uri(remote_address, remote_port, "") + ": " + connect_ec.message());
    }

    const auto local_endpoint = socket.local_endpoint(ec);
    if(ec) {
        throw NetworkError("Unable to get local address of socket: " + ec.message());
    }
    return local_endpoint.address().to_v4();
}

std::string uxbeacon::networking::to_uri(const asio::ip::address_v4& address, Port port, std::string_view protocol) {
    std::string uri {};
    if(!protocol.empty()) {
        uri += protocol;
        uri += "://";
    }
    uri += address.to_string();
    uri += ":";
    uri += to_string(port);
    return uri;
}
