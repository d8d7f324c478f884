/**
 * @file
 * @brief Utilities for manipulating strings
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <algorithm>
#include <array>
#include <cctype> // IWYU pragma: export
#include <charconv>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include <magic_enum.hpp>

namespace uxbeacon::utils {

    /** Transforms a string with a given operation */
    template <typename F> inline std::string transform(std::string_view string, F operation) {
        std::string out {};
        out.reserve(string.size());
        std::ranges::transform(string, std::back_inserter(out), [&](char character) {
            return static_cast<char>(operation(static_cast<unsigned char>(character)));
        });
        return out;
    }

    /** Converts a string-like object to a string */
    template <typename S>
        requires std::convertible_to<S, std::string_view>
    inline std::string to_string(S string_like) {
        return std::string(std::string_view(string_like));
    }

    /** Converts a non-boolean arithmetic object to a string */
    template <typename A>
        requires std::is_arithmetic_v<A> && (!std::same_as<A, bool>)
    inline std::string to_string(A t) {
        std::array<char, 32> buffer {};
        const auto res = std::to_chars(buffer.data(), buffer.data() + buffer.size(), t);
        return std::string(buffer.data(), res.ptr);
    }

    /** Object that is an std::chrono::duration */
    template <typename D>
    concept is_chrono_duration = requires(D d) { std::chrono::duration(d); };

    /** Convert a duration to a string with its unit, durations without SI unit are converted to seconds */
    template <typename D>
        requires is_chrono_duration<D>
    std::string to_string(D d) {
        using namespace std::chrono;
        if constexpr(std::same_as<D, nanoseconds>) {
            return to_string(d.count()) + "ns";
        } else if constexpr(std::same_as<D, microseconds>) {
            return to_string(d.count()) + "us";
        } else if constexpr(std::same_as<D, milliseconds>) {
            return to_string(d.count()) + "ms";
        } else if constexpr(std::same_as<D, seconds>) {
            return to_string(d.count()) + "s";
        } else {
            return to_string(duration_cast<duration<double>>(d).count()) + "s";
        }
    }

    /** Converts an enum to a string */
    template <typename E>
        requires std::is_enum_v<E>
    inline std::string to_string(E enum_val) {
        return to_string(magic_enum::enum_name<E>(enum_val));
    }

    /** Default element formatter for range_to_string */
    struct to_string_fn {
        template <typename T> std::string operator()(const T& t) const { return to_string(t); }
    };

    /** Joins the elements of a range into a string, each element formatted with the given function */
    template <std::ranges::input_range R, typename F = to_string_fn>
    inline std::string range_to_string(const R& range, std::string_view delim = ", ", F to_string_func = {}) {
        std::string out {};
        bool first = true;
        for(const auto& element : range) {
            if(!first) {
                out += delim;
            }
            out += to_string_func(element);
            first = false;
        }
        return out;
    }

    /** List all possible enum values */
    template <typename E>
        requires std::is_enum_v<E>
    inline std::string list_enum_names() {
        return range_to_string(magic_enum::enum_names<E>());
    }

    /** Quote a string with backticks */
    template <typename S>
        requires std::convertible_to<S, std::string_view>
    inline std::string quote(S string_like) {
        return "`" + to_string(string_like) + "`";
    }

    /** Convert byte to a two-character uppercase hex string */
    inline std::string byte_to_hex_string(std::byte byte) {
        constexpr std::string_view digits {"0123456789ABCDEF"};
        const auto value = std::to_integer<std::uint8_t>(byte);
        return {digits[value >> 4U], digits[value & 0x0FU]};
    }

    /** Convert bytes to a space-separated uppercase hex string, e.g. `4C 00 09` */
    inline std::string bytes_to_hex_string(std::span<const std::byte> bytes) {
        return range_to_string(bytes, " ", byte_to_hex_string);
    }

} // namespace uxbeacon::utils
