/**
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "uxbeacon/beacon/BeaconPayload.hpp"
#include "uxbeacon/beacon/BluezRadio.hpp"
#include "uxbeacon/beacon/exceptions.hpp"

using namespace Catch::Matchers;
using namespace uxbeacon::beacon;

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Split beacon payload into company identifier and data", "[beacon][bluez]") {
    const auto payload = assemble_payload("192.168.1.42", 7000);
    const auto split = split_manufacturer_data(payload);

    REQUIRE(split.company_id == COMPANY_ID);
    REQUIRE(split.data == std::vector<std::uint8_t>({0x09, 0x08, 0x13, 0x30, 0xC0, 0xA8, 0x01, 0x2A, 0x1B, 0x58}));
}

TEST_CASE("Company identifier is little-endian", "[beacon][bluez]") {
    const std::array<std::byte, 3> data {std::byte {0x34}, std::byte {0x12}, std::byte {0xFF}};
    const auto split = split_manufacturer_data(data);

    REQUIRE(split.company_id == 0x1234);
    REQUIRE(split.data == std::vector<std::uint8_t>({0xFF}));
}

TEST_CASE("Manufacturer data with only a company identifier", "[beacon][bluez]") {
    const std::array<std::byte, 2> data {std::byte {0x4C}, std::byte {0x00}};
    const auto split = split_manufacturer_data(data);

    REQUIRE(split.company_id == 0x004C);
    REQUIRE(split.data.empty());
}

TEST_CASE("Manufacturer data without company identifier", "[beacon][bluez]") {
    const std::array<std::byte, 1> data {std::byte {0x4C}};
    REQUIRE_THROWS_MATCHES(split_manufacturer_data(data),
                           AdvertisementError,
                           Message("Unable to advertise: manufacturer data of 1 bytes does not contain a company "
                                   "identifier"));
    REQUIRE_THROWS_AS(split_manufacturer_data({}), AdvertisementError);
}

TEST_CASE("Object path of Bluetooth adapters", "[beacon][bluez]") {
    REQUIRE_THAT(adapter_object_path("hci0"), Equals("/org/bluez/hci0"));
    REQUIRE_THAT(adapter_object_path(DEFAULT_ADAPTER), Equals("/org/bluez/hci0"));
    REQUIRE_THAT(adapter_object_path("usb_dongle1"), Equals("/org/bluez/usb_dongle1"));
}

TEST_CASE("Reject invalid adapter names", "[beacon][bluez]") {
    REQUIRE_THROWS_AS(adapter_object_path(""), RadioError);
    REQUIRE_THROWS_AS(adapter_object_path("hci0/dev"), RadioError);
    REQUIRE_THROWS_MATCHES(
        adapter_object_path("hci-1"), RadioError, Message("Radio unavailable: invalid Bluetooth adapter name `hci-1`"));
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
