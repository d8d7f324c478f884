/**
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <optional>
#include <vector>

#include <asio/ip/address_v4.hpp>
#include <catch2/catch_test_macros.hpp>

#include "uxbeacon/beacon/AddressSelector.hpp"
#include "uxbeacon/core/networking/exceptions.hpp"

using namespace uxbeacon::beacon;
using namespace uxbeacon::networking;
using asio::ip::make_address_v4;

namespace {
    using Addresses = std::vector<asio::ip::address_v4>;

    AddressSelector::RouteLookup no_route() {
        return []() -> std::optional<asio::ip::address_v4> { return std::nullopt; };
    }

    AddressSelector::RouteLookup route(const char* address) {
        return [address]() -> std::optional<asio::ip::address_v4> { return make_address_v4(address); };
    }

    AddressSelector::HostLookup host(Addresses addresses) {
        return [addresses]() { return addresses; };
    }
} // namespace

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Route address takes precedence", "[beacon][address]") {
    AddressSelector selector {route("10.1.2.3"), host({make_address_v4("192.168.1.10")})};
    REQUIRE(selector.select() == make_address_v4("10.1.2.3"));
}

TEST_CASE("Loopback route address is ignored", "[beacon][address]") {
    AddressSelector selector {route("127.0.1.1"), host({make_address_v4("10.0.0.5")})};
    REQUIRE(selector.select() == make_address_v4("10.0.0.5"));
}

TEST_CASE("Unspecified route address is ignored", "[beacon][address]") {
    AddressSelector selector {route("0.0.0.0"), host({make_address_v4("10.0.0.5")})};
    REQUIRE(selector.select() == make_address_v4("10.0.0.5"));
}

TEST_CASE("Prefer 192.168 over 10 network", "[beacon][address]") {
    AddressSelector selector {no_route(), host({make_address_v4("10.0.0.5"), make_address_v4("192.168.1.7")})};
    REQUIRE(selector.select() == make_address_v4("192.168.1.7"));
}

TEST_CASE("Prefer 10 over 172.16 network", "[beacon][address]") {
    AddressSelector selector {no_route(), host({make_address_v4("172.20.0.2"), make_address_v4("10.8.0.1")})};
    REQUIRE(selector.select() == make_address_v4("10.8.0.1"));
}

TEST_CASE("Prefer private network over public address", "[beacon][address]") {
    const Addresses addresses {make_address_v4("203.0.113.9"), make_address_v4("172.31.255.1")};
    REQUIRE(AddressSelector::pick_preferred(addresses) == make_address_v4("172.31.255.1"));
}

TEST_CASE("Addresses outside 172.16/12 are not private", "[beacon][address]") {
    const Addresses addresses {make_address_v4("172.32.0.1"), make_address_v4("172.15.0.1")};
    REQUIRE(AddressSelector::pick_preferred(addresses) == make_address_v4("172.32.0.1"));
}

TEST_CASE("First non-loopback address without private networks", "[beacon][address]") {
    const Addresses addresses {make_address_v4("127.0.0.1"), make_address_v4("198.51.100.4"),
                               make_address_v4("203.0.113.9")};
    REQUIRE(AddressSelector::pick_preferred(addresses) == make_address_v4("198.51.100.4"));
}

TEST_CASE("Only loopback addresses", "[beacon][address]") {
    const Addresses addresses {make_address_v4("127.0.0.1"), make_address_v4("127.0.1.1")};
    REQUIRE_FALSE(AddressSelector::pick_preferred(addresses).has_value());

    AddressSelector selector {no_route(), host(addresses)};
    REQUIRE(selector.select() == make_address_v4("127.0.0.1"));
}

TEST_CASE("Fall back to loopback without any address", "[beacon][address]") {
    AddressSelector selector {no_route(), host({})};
    REQUIRE(selector.select() == asio::ip::address_v4::loopback());
}

TEST_CASE("Lookup failures are treated as no result", "[beacon][address]") {
    AddressSelector failing_route {[]() -> std::optional<asio::ip::address_v4> { throw NetworkError("no route"); },
                                   host({make_address_v4("192.168.0.2")})};
    REQUIRE(failing_route.select() == make_address_v4("192.168.0.2"));

    AddressSelector failing_both {[]() -> std::optional<asio::ip::address_v4> { throw NetworkError("no route"); },
                                  []() -> Addresses { throw NetworkError("no hostname"); }};
    REQUIRE_NOTHROW(failing_both.select());
    REQUIRE(failing_both.select() == make_address_v4("127.0.0.1"));
}

TEST_CASE("Select address on the local host", "[beacon][address]") {
    // Result depends on the host network, but selection never fails
    REQUIRE_NOTHROW(select_address());
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
