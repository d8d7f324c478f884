/**
 * @file
 * @brief Legacy advertising data made of AD structures
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/build.hpp"

namespace uxbeacon::beacon {

    /**
     * @brief Advertising data consisting of flags, local name and manufacturer specific data
     *
     * Each field is encoded as AD structure `length | type | data`, where the length covers type and data. The
     * assembled data has to fit into a legacy advertising PDU of 31 bytes. If the local name does not fit completely,
     * it is shortened and sent as shortened local name.
     */
    class AdvertisingData {
    public:
        /**
         * @param name Local name of the device
         * @param manufacturer_data Manufacturer specific data, starting with the company identifier
         * @param flags Advertising flags
         */
        UXBCN_API AdvertisingData(std::string name,
                                  std::vector<std::byte> manufacturer_data,
                                  std::uint8_t flags = ADVERTISING_FLAGS);

        const std::string& getName() const { return name_; }
        std::span<const std::byte> getManufacturerData() const { return manufacturer_data_; }
        std::uint8_t getFlags() const { return flags_; }

        /** Whether the name was received as shortened local name */
        bool isNameShortened() const { return name_shortened_; }

        /**
         * @brief Assemble the advertising data
         *
         * @return AD structures as bytes
         * @throw AdvertisementError if the manufacturer data does not fit into a legacy advertising PDU
         */
        UXBCN_API std::vector<std::byte> assemble() const;

        /**
         * @brief Disassemble advertising data
         *
         * Unknown AD types are skipped, a zero length terminates the data.
         *
         * @param assembled_data AD structures as bytes
         * @return Decoded advertising data
         * @throw PayloadDecodingError if an AD structure exceeds the data
         */
        UXBCN_API static AdvertisingData disassemble(std::span<const std::byte> assembled_data);

    private:
        std::string name_;
        std::vector<std::byte> manufacturer_data_;
        std::uint8_t flags_;
        bool name_shortened_ {false};
    };

} // namespace uxbeacon::beacon
