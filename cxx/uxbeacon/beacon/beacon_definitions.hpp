/**
 * @file
 * @brief Beacon advertisement definitions
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "uxbeacon/core/networking/Port.hpp"

namespace uxbeacon::beacon {

    /** Bluetooth company identifier carried in the first two bytes of the manufacturer data */
    constexpr std::uint16_t COMPANY_ID = 0x004C;

    /** Type and length prefix following the company identifier */
    constexpr std::array<std::byte, 2> TYPE_PREFIX {std::byte {0x09}, std::byte {0x08}};

    /** Magic marker identifying a mirroring receiver beacon */
    constexpr std::array<std::byte, 2> MAGIC {std::byte {0x13}, std::byte {0x30}};

    /** Beacon payload length in bytes */
    constexpr std::size_t PAYLOAD_LENGTH = 12;

    /** Display name used for the advertisement */
    constexpr std::string_view DEFAULT_NAME = "UxPlay";

    /** Name of the file in the home directory to which the receiver writes its port */
    constexpr std::string_view PORT_FILE_NAME = ".uxplay.ble";

    /** Lowest port accepted when the port file contains a binary port number */
    constexpr networking::Port MIN_BINARY_PORT = 1024;

    /** Public endpoint used to select the outbound route, no packets are sent to it */
    constexpr std::string_view DEFAULT_ROUTE_HOST = "8.8.8.8";

    /** Port of the route selection endpoint */
    constexpr networking::Port DEFAULT_ROUTE_PORT = 80;

    /** Maximum time to wait for the route selection */
    constexpr std::chrono::milliseconds DEFAULT_ROUTE_TIMEOUT {1000};

    /** Bluetooth adapter used for advertising */
    constexpr std::string_view DEFAULT_ADAPTER = "hci0";

    /** Radio implementations available to the beacon */
    enum class RadioBackend : std::uint8_t {
        /** Bluetooth LE advertising through the BlueZ daemon */
        BLUEZ,
        /** UDP broadcast of the advertising data */
        RELAY,
    };

    /** Port on which the relay radio broadcasts advertisements */
    constexpr networking::Port RELAY_PORT = 7124;

    /** Interval at which the relay radio repeats the advertisement */
    constexpr std::chrono::milliseconds DEFAULT_RELAY_INTERVAL {1000};

    /** Maximum length of legacy advertising data */
    constexpr std::size_t MAX_ADVERTISING_DATA_LENGTH = 31;

    /** Advertising data flags: LE General Discoverable Mode, BR/EDR Not Supported */
    constexpr std::uint8_t ADVERTISING_FLAGS = 0x06;

    /** Advertising data types as assigned by the Bluetooth SIG */
    enum class ADType : std::uint8_t {
        FLAGS = 0x01,
        SHORTENED_LOCAL_NAME = 0x08,
        COMPLETE_LOCAL_NAME = 0x09,
        MANUFACTURER_SPECIFIC_DATA = 0xFF,
    };

} // namespace uxbeacon::beacon
