/**
 * @file
 * @brief Interface to a low-power radio capable of advertising
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <functional>
#include <span>
#include <string_view>

namespace uxbeacon::beacon {

    /**
     * @brief Radio capability used by the advertisement publisher
     *
     * Implementations notify the registered callback once the radio is powered on and able to advertise.
     */
    class Radio {
    public:
        using ReadyCallback = std::function<void()>;

    public:
        Radio() = default;
        virtual ~Radio() = default;

        // No copy/move constructor/assignment
        /// @cond doxygen_suppress
        Radio(const Radio& other) = delete;
        Radio& operator=(const Radio& other) = delete;
        Radio(Radio&& other) = delete;
        Radio& operator=(Radio&& other) = delete;
        /// @endcond

        /**
         * @brief Register the callback invoked when the radio is ready
         *
         * @param callback Callback invoked on every ready notification
         */
        virtual void onReady(ReadyCallback callback) = 0;

        /**
         * @brief Start advertising
         *
         * @param name Local name to advertise
         * @param manufacturer_data Manufacturer specific data to advertise
         * @throw AdvertisementError if the radio cannot advertise the data
         */
        virtual void startAdvertising(std::string_view name, std::span<const std::byte> manufacturer_data) = 0;
    };

} // namespace uxbeacon::beacon
