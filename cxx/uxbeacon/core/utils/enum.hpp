/**
 * @file
 * @brief Enums functions
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <concepts>
#include <ios>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include <magic_enum.hpp>

namespace uxbeacon::utils {

    template <typename E>
        requires std::is_enum_v<E>
    constexpr auto enum_cast(std::string_view value, bool case_insensitive = true) noexcept {
        std::optional<E> retval {};
        retval = case_insensitive ? magic_enum::enum_cast<E>(value, magic_enum::case_insensitive)
                                  : magic_enum::enum_cast<E>(value);
        return retval;
    }

    template <typename E>
        requires std::is_enum_v<E>
    constexpr auto enum_name(E enum_val) noexcept {
        return magic_enum::enum_name<E>(enum_val);
    }

} // namespace uxbeacon::utils

// Stream operator<< for enums
template <typename S, typename E>
    requires std::derived_from<std::remove_cvref_t<S>, std::ios_base> && std::is_enum_v<E>
inline S&& operator<<(S&& os, E value) {
    os << uxbeacon::utils::enum_name(value);
    return std::forward<S>(os);
}
