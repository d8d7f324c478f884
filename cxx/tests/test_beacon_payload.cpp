/**
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <cstddef>
#include <vector>

#include <asio/ip/address_v4.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_range_equals.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/beacon/BeaconPayload.hpp"
#include "uxbeacon/beacon/exceptions.hpp"
#include "uxbeacon/core/utils/string.hpp"

using namespace Catch::Matchers;
using namespace uxbeacon::beacon;
using namespace uxbeacon::utils;

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Assemble reference payload", "[beacon][payload]") {
    const auto payload = assemble_payload("192.168.1.42", 7000);
    REQUIRE(payload.size() == PAYLOAD_LENGTH);
    REQUIRE_THAT(bytes_to_hex_string(payload), Equals("4C 00 09 08 13 30 C0 A8 01 2A 1B 58"));
}

TEST_CASE("Assemble payload with boundary values", "[beacon][payload]") {
    REQUIRE_THAT(bytes_to_hex_string(assemble_payload("0.0.0.0", 0)), Equals("4C 00 09 08 13 30 00 00 00 00 00 00"));
    REQUIRE_THAT(bytes_to_hex_string(assemble_payload("255.255.255.255", 65535)),
                 Equals("4C 00 09 08 13 30 FF FF FF FF FF FF"));
}

TEST_CASE("Payload is deterministic", "[beacon][payload]") {
    REQUIRE(assemble_payload("10.0.0.1", 7100) == assemble_payload("10.0.0.1", 7100));
    REQUIRE(BeaconPayload(asio::ip::make_address_v4("10.0.0.1"), 7100).assemble() ==
            assemble_payload("10.0.0.1", 7100));
}

TEST_CASE("Reject invalid addresses", "[beacon][payload]") {
    REQUIRE_THROWS_AS(assemble_payload("not-an-ip", 7000), InvalidAddressError);
    REQUIRE_THROWS_AS(assemble_payload("", 7000), InvalidAddressError);
    REQUIRE_THROWS_AS(assemble_payload("192.168.1", 7000), InvalidAddressError);
    REQUIRE_THROWS_AS(assemble_payload("192.168.1.256", 7000), InvalidAddressError);
    REQUIRE_THROWS_AS(assemble_payload("::1", 7000), InvalidAddressError);
    REQUIRE_THROWS_WITH(assemble_payload("not-an-ip", 7000), Equals("Invalid IPv4 address `not-an-ip`"));
}

TEST_CASE("Disassemble payload", "[beacon][payload]") {
    const auto payload = BeaconPayload::disassemble(assemble_payload("192.168.1.42", 7000));
    REQUIRE(payload.getAddress() == asio::ip::make_address_v4("192.168.1.42"));
    REQUIRE(payload.getPort() == 7000);
    REQUIRE_THAT(payload.to_string(), Equals("192.168.1.42:7000"));
}

TEST_CASE("Detect invalid length in payload", "[beacon][payload]") {
    std::vector<std::byte> payload_data {};
    payload_data.resize(PAYLOAD_LENGTH + 1);

    REQUIRE_THROWS_WITH(BeaconPayload::disassemble(payload_data),
                        Equals("Error decoding beacon payload: payload length is not 12 bytes"));
}

TEST_CASE("Detect invalid company identifier in payload", "[beacon][payload]") {
    auto payload = assemble_payload("192.168.1.42", 7000);
    payload[1] = std::byte {0x01};

    REQUIRE_THROWS_WITH(BeaconPayload::disassemble(payload),
                        Equals("Error decoding beacon payload: company identifier does not match"));
}

TEST_CASE("Detect invalid magic in payload", "[beacon][payload]") {
    auto payload = assemble_payload("192.168.1.42", 7000);
    payload[5] = std::byte {0x31};

    REQUIRE_THROWS_AS(BeaconPayload::disassemble(payload), PayloadDecodingError);
    REQUIRE_THROWS_WITH(BeaconPayload::disassemble(payload),
                        Equals("Error decoding beacon payload: not a receiver beacon"));
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
