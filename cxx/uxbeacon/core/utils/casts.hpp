/**
 * @file
 * @brief Compatibility casts for std::byte
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <ranges>
#include <span>

namespace uxbeacon::utils {

    template <typename T> inline char* to_char_ptr(T* data) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<char*>(data);
    }

    template <typename R>
        requires std::ranges::contiguous_range<R>
    inline std::span<const std::byte> to_byte_span(const R& range) {
        return std::as_bytes(std::span(std::ranges::cdata(range), std::ranges::size(range)));
    }

} // namespace uxbeacon::utils
