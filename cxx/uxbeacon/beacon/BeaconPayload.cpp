/**
 * @file
 * @brief Implementation of the beacon payload
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "BeaconPayload.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <asio/ip/address_v4.hpp>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/beacon/exceptions.hpp"
#include "uxbeacon/core/networking/asio_helpers.hpp"
#include "uxbeacon/core/utils/string.hpp"

using namespace uxbeacon::beacon;

namespace {
    asio::ip::address_v4 parse_address(std::string_view address) {
        std::error_code ec {};
        const auto parsed = asio::ip::make_address_v4(std::string(address), ec);
        if(ec) {
            throw InvalidAddressError(address);
        }
        return parsed;
    }
} // namespace

BeaconPayload::BeaconPayload(std::string_view address, networking::Port port)
    : address_(parse_address(address)), port_(port) {}

AssembledPayload BeaconPayload::assemble() const {
    AssembledPayload ret {};

    // Company ID, least significant byte first
    ret.at(0) = std::byte(static_cast<std::uint8_t>(COMPANY_ID & 0x00FFU));
    ret.at(1) = std::byte(static_cast<std::uint8_t>(static_cast<unsigned int>(COMPANY_ID >> 8U) & 0x00FFU));
    // Type prefix and magic
    ret.at(2) = TYPE_PREFIX.at(0);
    ret.at(3) = TYPE_PREFIX.at(1);
    ret.at(4) = MAGIC.at(0);
    ret.at(5) = MAGIC.at(1);
    // Address in network byte order
    const auto octets = address_.to_bytes();
    for(std::size_t n = 0; n < octets.size(); ++n) {
        ret.at(6 + n) = std::byte(octets.at(n));
    }
    // Port in network byte order (MSB first)
    ret.at(10) = std::byte(static_cast<std::uint8_t>(static_cast<unsigned int>(port_ >> 8U) & 0x00FFU));
    ret.at(11) = std::byte(static_cast<std::uint8_t>(port_ & 0x00FFU));

    return ret;
}

BeaconPayload BeaconPayload::disassemble(std::span<const std::byte> assembled_payload) {
    // Check size
    if(assembled_payload.size() != PAYLOAD_LENGTH) {
        throw PayloadDecodingError("payload length is not " + utils::to_string(PAYLOAD_LENGTH) + " bytes");
    }
    // Check company ID
    const auto company_id = static_cast<std::uint16_t>(std::to_integer<unsigned int>(assembled_payload[1]) << 8U) +
                            std::to_integer<std::uint8_t>(assembled_payload[0]);
    if(company_id != COMPANY_ID) {
        throw PayloadDecodingError("company identifier does not match");
    }
    // Check type prefix and magic
    if(assembled_payload[2] != TYPE_PREFIX.at(0) || assembled_payload[3] != TYPE_PREFIX.at(1)) {
        throw PayloadDecodingError("type prefix does not match");
    }
    if(assembled_payload[4] != MAGIC.at(0) || assembled_payload[5] != MAGIC.at(1)) {
        throw PayloadDecodingError("not a receiver beacon");
    }
    // Address in network byte order
    asio::ip::address_v4::bytes_type octets {};
    for(std::size_t n = 0; n < octets.size(); ++n) {
        octets.at(n) = std::to_integer<unsigned char>(assembled_payload[6 + n]);
    }
    // Port from network byte order (MSB first)
    const auto port = static_cast<networking::Port>(
        static_cast<std::uint16_t>(std::to_integer<unsigned int>(assembled_payload[10]) << 8U) +
        std::to_integer<std::uint8_t>(assembled_payload[11]));

    return {asio::ip::address_v4(octets), port};
}

std::string BeaconPayload::to_string() const {
    return networking::to_uri(address_, port_, "");
}

AssembledPayload uxbeacon::beacon::assemble_payload(std::string_view address, networking::Port port) {
    return BeaconPayload(address, port).assemble();
}
