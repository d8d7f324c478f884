/**
 * @file
 * @brief Future C++ library features for C++20 and newer on older compilers
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

// IWYU pragma: always_keep

#pragma once

#include <version>

// NOLINTBEGIN(cert-dcl58-cpp)

// std::to_underlying
#ifndef __cpp_lib_to_underlying

#include <type_traits>

namespace std {
    template <typename E> constexpr typename std::underlying_type_t<E> to_underlying(E e) noexcept {
        return static_cast<typename std::underlying_type_t<E>>(e);
    }
} // namespace std

#endif

// NOLINTEND(cert-dcl58-cpp)
