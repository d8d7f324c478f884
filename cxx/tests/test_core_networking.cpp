/**
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <algorithm>
#include <chrono>
#include <string>

#include <asio/ip/address_v4.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "uxbeacon/core/networking/asio_helpers.hpp"
#include "uxbeacon/core/networking/exceptions.hpp"

using namespace Catch::Matchers;
using namespace uxbeacon::networking;
using namespace std::chrono_literals;
using asio::ip::make_address_v4;

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Get hostname", "[core][networking]") {
    REQUIRE_FALSE(get_hostname().empty());
}

TEST_CASE("Resolve numeric host", "[core][networking]") {
    const auto addresses = resolve_host_addresses("127.0.0.1");
    REQUIRE(addresses.size() == 1);
    REQUIRE(addresses.front() == make_address_v4("127.0.0.1"));
}

TEST_CASE("Resolve localhost", "[core][networking]") {
    const auto addresses = resolve_host_addresses("localhost");
    REQUIRE(std::ranges::all_of(addresses, [](const auto& address) { return address.is_loopback(); }));
}

TEST_CASE("Resolve invalid hostname", "[core][networking]") {
    REQUIRE_THROWS_AS(resolve_host_addresses("invalid hostname with spaces.invalid"), NetworkError);
}

TEST_CASE("Outbound address towards loopback", "[core][networking]") {
    const auto address = get_outbound_address(make_address_v4("127.0.0.1"), 9, 1s);
    REQUIRE(address.is_loopback());
}

TEST_CASE("Build URI", "[core][networking]") {
    REQUIRE_THAT(to_uri(make_address_v4("192.168.1.42"), 7000), Equals("tcp://192.168.1.42:7000"));
    REQUIRE_THAT(to_uri(make_address_v4("10.0.0.1"), 7124, "udp"), Equals("udp://10.0.0.1:7124"));
    REQUIRE_THAT(to_uri(make_address_v4("10.0.0.1"), 80, ""), Equals("10.0.0.1:80"));
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
