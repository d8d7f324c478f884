/**
 * @file
 * @brief Beacon payload advertised as manufacturer specific data
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include <asio/ip/address_v4.hpp>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/build.hpp"
#include "uxbeacon/core/networking/Port.hpp"

namespace uxbeacon::beacon {

    /** Beacon payload assembled to array of bytes */
    using AssembledPayload = std::array<std::byte, PAYLOAD_LENGTH>;

    /**
     * @brief Beacon payload announcing the address and port of a mirroring receiver
     *
     * Layout: company ID `4C 00`, type prefix `09 08`, magic `13 30`, IPv4 address in network byte order, port in
     * network byte order.
     */
    class BeaconPayload {
    public:
        /**
         * @param address IPv4 address of the receiver
         * @param port Port of the receiver
         */
        BeaconPayload(asio::ip::address_v4 address, networking::Port port) : address_(address), port_(port) {}

        /**
         * @param address IPv4 address of the receiver in dotted-quad notation
         * @param port Port of the receiver
         * @throw InvalidAddressError if the address is not a dotted-quad IPv4 address
         */
        UXBCN_API BeaconPayload(std::string_view address, networking::Port port);

        asio::ip::address_v4 getAddress() const { return address_; }

        constexpr networking::Port getPort() const { return port_; }

        /** Assemble payload to bytes */
        UXBCN_API AssembledPayload assemble() const;

        /**
         * @brief Disassemble payload from bytes
         *
         * @param assembled_payload Manufacturer specific data of an advertisement
         * @return Decoded beacon payload
         * @throw PayloadDecodingError if the bytes are not a beacon payload
         */
        UXBCN_API static BeaconPayload disassemble(std::span<const std::byte> assembled_payload);

        /** Human readable representation as `address:port` */
        UXBCN_API std::string to_string() const;

    private:
        asio::ip::address_v4 address_;
        networking::Port port_;
    };

    /**
     * @brief Assemble the beacon payload for an address and port
     *
     * @param address IPv4 address in dotted-quad notation
     * @param port Port of the receiver
     * @return Assembled 12-byte payload
     * @throw InvalidAddressError if the address is not a dotted-quad IPv4 address
     */
    UXBCN_API AssembledPayload assemble_payload(std::string_view address, networking::Port port);

} // namespace uxbeacon::beacon
