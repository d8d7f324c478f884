/**
 * @file
 * @brief Radio advertising through the BlueZ Bluetooth daemon
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sdbus-c++/sdbus-c++.h>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/beacon/Radio.hpp"
#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Logger.hpp"

namespace uxbeacon::beacon {

    /** Manufacturer data split into company identifier and remaining bytes as expected by BlueZ */
    struct BluezManufacturerData {
        std::uint16_t company_id;
        std::vector<std::uint8_t> data;
    };

    /**
     * @brief Split manufacturer specific data into company identifier and data
     *
     * @param manufacturer_data Manufacturer data starting with the little-endian company identifier
     * @return Company identifier and remaining bytes
     * @throw AdvertisementError if the data does not contain a company identifier
     */
    UXBCN_API BluezManufacturerData split_manufacturer_data(std::span<const std::byte> manufacturer_data);

    /**
     * @brief Get the D-Bus object path of a Bluetooth adapter
     *
     * @param adapter Adapter name such as `hci0`
     * @return Object path of the adapter
     * @throw RadioError if the adapter name is not a valid object path element
     */
    UXBCN_API std::string adapter_object_path(std::string_view adapter);

    /**
     * @brief Radio using the LE advertising manager of the BlueZ daemon
     *
     * The advertisement is exported on the system bus as `org.bluez.LEAdvertisement1` object and registered with the
     * `org.bluez.LEAdvertisingManager1` interface of the adapter. The ready callback is invoked once the adapter is
     * powered, either immediately on `start()` or when the adapter reports being powered on.
     */
    class BluezRadio final : public Radio {
    public:
        /**
         * @brief Construct BlueZ radio
         *
         * @param adapter Name of the Bluetooth adapter
         * @throw RadioError if the system bus or the adapter is not available
         */
        UXBCN_API explicit BluezRadio(std::string_view adapter = DEFAULT_ADAPTER);

        UXBCN_API ~BluezRadio() override;

        // No copy/move constructor/assignment
        /// @cond doxygen_suppress
        BluezRadio(const BluezRadio& other) = delete;
        BluezRadio& operator=(const BluezRadio& other) = delete;
        BluezRadio(BluezRadio&& other) = delete;
        BluezRadio& operator=(BluezRadio&& other) = delete;
        /// @endcond

        UXBCN_API void onReady(ReadyCallback callback) override;

        /**
         * @brief Check the adapter power state and notify the ready callback if the adapter is powered
         *
         * @throw RadioError if the power state of the adapter cannot be read
         */
        UXBCN_API void start();

        UXBCN_API void startAdvertising(std::string_view name, std::span<const std::byte> manufacturer_data) override;

        /**
         * @brief Unregister the advertisement from the adapter
         */
        UXBCN_API void stopAdvertising();

        bool isAdvertising() const { return registered_.load(); }

    private:
        void register_advertisement_object();
        void on_properties_changed(const std::string& interface,
                                   const std::map<std::string, sdbus::Variant>& changed,
                                   const std::vector<std::string>& invalidated);
        void notify_ready();

    private:
        log::Logger logger_;
        std::string adapter_;
        std::string adapter_path_;

        // BlueZ queries the advertisement while registering it, the object is served by its own connection
        std::unique_ptr<sdbus::IConnection> proxy_connection_;
        std::unique_ptr<sdbus::IConnection> object_connection_;
        std::unique_ptr<sdbus::IProxy> adapter_proxy_;
        std::unique_ptr<sdbus::IObject> advertisement_;

        std::mutex callback_mutex_;
        ReadyCallback ready_callback_;
        std::atomic_bool ready_notified_ {false};

        std::mutex data_mutex_;
        std::string local_name_;
        BluezManufacturerData manufacturer_data_ {};
        std::atomic_bool registered_ {false};
    };

} // namespace uxbeacon::beacon
