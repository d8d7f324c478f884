/**
 * @file
 * @brief Implementation of the advertising data
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "AdvertisingData.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/beacon/exceptions.hpp"
#include "uxbeacon/core/utils/casts.hpp"
#include "uxbeacon/core/utils/std_future.hpp"
#include "uxbeacon/core/utils/string.hpp"

using namespace uxbeacon::beacon;

namespace {
    // Length and type byte of each AD structure
    constexpr std::size_t AD_HEADER_LENGTH = 2;

    void append_structure(std::vector<std::byte>& out, ADType type, std::span<const std::byte> data) {
        out.push_back(std::byte(static_cast<std::uint8_t>(data.size() + 1)));
        out.push_back(std::byte(std::to_underlying(type)));
        out.insert(out.end(), data.begin(), data.end());
    }
} // namespace

AdvertisingData::AdvertisingData(std::string name, std::vector<std::byte> manufacturer_data, std::uint8_t flags)
    : name_(std::move(name)), manufacturer_data_(std::move(manufacturer_data)), flags_(flags) {}

std::vector<std::byte> AdvertisingData::assemble() const {
    const auto flags_length = AD_HEADER_LENGTH + 1;
    const auto manufacturer_length = AD_HEADER_LENGTH + manufacturer_data_.size();
    if(flags_length + manufacturer_length > MAX_ADVERTISING_DATA_LENGTH) {
        throw AdvertisementError("manufacturer data of " + utils::to_string(manufacturer_data_.size()) +
                                 " bytes exceeds legacy advertising data of " +
                                 utils::to_string(MAX_ADVERTISING_DATA_LENGTH) + " bytes");
    }

    std::vector<std::byte> out {};
    out.reserve(MAX_ADVERTISING_DATA_LENGTH);

    const std::array<std::byte, 1> flags {std::byte(flags_)};
    append_structure(out, ADType::FLAGS, flags);

    // Local name, shortened if it does not fit completely
    const auto available = MAX_ADVERTISING_DATA_LENGTH - flags_length - manufacturer_length;
    if(available > AD_HEADER_LENGTH && !name_.empty()) {
        const auto name_length = std::min(name_.size(), available - AD_HEADER_LENGTH);
        const auto type = name_length < name_.size() ? ADType::SHORTENED_LOCAL_NAME : ADType::COMPLETE_LOCAL_NAME;
        append_structure(out, type, utils::to_byte_span(std::string_view(name_).substr(0, name_length)));
    }

    append_structure(out, ADType::MANUFACTURER_SPECIFIC_DATA, manufacturer_data_);

    return out;
}

AdvertisingData AdvertisingData::disassemble(std::span<const std::byte> assembled_data) {
    auto advertising_data = AdvertisingData({}, {}, 0);

    std::size_t pos = 0;
    while(pos < assembled_data.size()) {
        const auto length = std::to_integer<std::size_t>(assembled_data[pos]);
        // Zero length marks the end of significant data
        if(length == 0) {
            break;
        }
        if(pos + 1 + length > assembled_data.size()) {
            throw PayloadDecodingError("AD structure at offset " + utils::to_string(pos) + " exceeds advertising data");
        }
        const auto type = std::to_integer<std::uint8_t>(assembled_data[pos + 1]);
        const auto data = assembled_data.subspan(pos + AD_HEADER_LENGTH, length - 1);

        switch(static_cast<ADType>(type)) {
        case ADType::FLAGS: {
            if(!data.empty()) {
                advertising_data.flags_ = std::to_integer<std::uint8_t>(data[0]);
            }
            break;
        }
        case ADType::SHORTENED_LOCAL_NAME:
        case ADType::COMPLETE_LOCAL_NAME: {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
            advertising_data.name_ = std::string(reinterpret_cast<const char*>(data.data()), data.size());
            advertising_data.name_shortened_ = static_cast<ADType>(type) == ADType::SHORTENED_LOCAL_NAME;
            break;
        }
        case ADType::MANUFACTURER_SPECIFIC_DATA: {
            advertising_data.manufacturer_data_.assign(data.begin(), data.end());
            break;
        }
        default: {
            break;
        }
        }

        pos += 1 + length;
    }

    return advertising_data;
}
