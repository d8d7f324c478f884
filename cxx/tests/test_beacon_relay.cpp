/**
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include <asio/ip/address_v4.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_range_equals.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "uxbeacon/beacon/BeaconPayload.hpp"
#include "uxbeacon/beacon/exceptions.hpp"
#include "uxbeacon/beacon/Publisher.hpp"
#include "uxbeacon/beacon/RelayRadio.hpp"
#include "uxbeacon/beacon/RelayReceiver.hpp"

using namespace Catch::Matchers;
using namespace uxbeacon::beacon;
using namespace std::chrono_literals;
using asio::ip::make_address_v4;

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Relay radio notifies ready callback on start", "[beacon][relay]") {
    RelayReceiver receiver {make_address_v4("127.0.0.1"), 0};
    RelayRadio radio {make_address_v4("127.0.0.1"), receiver.getPort(), 50ms};

    int ready_calls {0};
    radio.onReady([&]() { ++ready_calls; });
    radio.start();

    REQUIRE(ready_calls == 1);
    REQUIRE_FALSE(radio.isAdvertising());
}

TEST_CASE("Relay advertisement to receiver", "[beacon][relay]") {
    RelayReceiver receiver {make_address_v4("127.0.0.1"), 0};
    RelayRadio radio {make_address_v4("127.0.0.1"), receiver.getPort(), 50ms};

    const auto payload = assemble_payload("192.168.1.42", 7000);
    radio.startAdvertising("UxPlay", payload);
    REQUIRE(radio.isAdvertising());

    const auto frame = receiver.asyncRecvFrame(1s);
    REQUIRE(frame.has_value());
    REQUIRE(frame->address == make_address_v4("127.0.0.1"));

    const auto advertising_data = frame->getAdvertisingData();
    REQUIRE_THAT(advertising_data.getName(), Equals("UxPlay"));
    REQUIRE_THAT(advertising_data.getManufacturerData(), RangeEquals(payload));

    radio.stopAdvertising();
    REQUIRE_FALSE(radio.isAdvertising());
}

TEST_CASE("Relay repeats advertisement", "[beacon][relay]") {
    RelayReceiver receiver {make_address_v4("127.0.0.1"), 0};
    RelayRadio radio {make_address_v4("127.0.0.1"), receiver.getPort(), 20ms};

    radio.startAdvertising("UxPlay", assemble_payload("10.0.0.1", 7100));

    for(int n = 0; n < 3; ++n) {
        const auto frame = receiver.asyncRecvFrame(1s);
        REQUIRE(frame.has_value());
        const auto payload = BeaconPayload::disassemble(frame->getAdvertisingData().getManufacturerData());
        REQUIRE(payload.getPort() == 7100);
    }
    REQUIRE(radio.getSentCount() >= 3);
}

TEST_CASE("Relay radio rejects oversized advertisement", "[beacon][relay]") {
    RelayRadio radio {make_address_v4("127.0.0.1"), 49160, 50ms};
    const std::vector<std::byte> manufacturer_data(40);
    REQUIRE_THROWS_AS(radio.startAdvertising("UxPlay", manufacturer_data), AdvertisementError);
    REQUIRE_FALSE(radio.isAdvertising());
}

TEST_CASE("Receive timeout without advertisement", "[beacon][relay]") {
    RelayReceiver receiver {make_address_v4("127.0.0.1"), 0};
    REQUIRE_FALSE(receiver.asyncRecvFrame(50ms).has_value());
}

TEST_CASE("Publisher advertises through relay radio", "[beacon][relay]") {
    RelayReceiver receiver {make_address_v4("127.0.0.1"), 0};
    RelayRadio radio {make_address_v4("127.0.0.1"), receiver.getPort(), 50ms};
    const AdvertisementPublisher publisher {
        radio, []() { return uxbeacon::networking::Port(7000); }, []() { return make_address_v4("192.168.1.42"); }};

    radio.start();
    REQUIRE_FALSE(publisher.hasFailed());

    const auto frame = receiver.asyncRecvFrame(1s);
    REQUIRE(frame.has_value());
    const auto payload = BeaconPayload::disassemble(frame->getAdvertisingData().getManufacturerData());
    REQUIRE(payload.getAddress() == make_address_v4("192.168.1.42"));
    REQUIRE(payload.getPort() == 7000);
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
