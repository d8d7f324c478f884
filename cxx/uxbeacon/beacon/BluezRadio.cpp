/**
 * @file
 * @brief Implementation of the BlueZ radio
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "BluezRadio.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sdbus-c++/sdbus-c++.h>

#include "uxbeacon/beacon/AdvertisingData.hpp"
#include "uxbeacon/beacon/exceptions.hpp"
#include "uxbeacon/core/log/log.hpp"
#include "uxbeacon/core/utils/string.hpp"

using namespace uxbeacon::beacon;
using namespace uxbeacon::utils;

namespace {
    constexpr std::string_view BLUEZ_SERVICE = "org.bluez";
    constexpr std::string_view ADAPTER_INTERFACE = "org.bluez.Adapter1";
    constexpr std::string_view ADVERTISING_MANAGER_INTERFACE = "org.bluez.LEAdvertisingManager1";
    constexpr std::string_view ADVERTISEMENT_INTERFACE = "org.bluez.LEAdvertisement1";
    constexpr std::string_view PROPERTIES_INTERFACE = "org.freedesktop.DBus.Properties";

    constexpr std::string_view ADVERTISEMENT_PATH = "/org/uxbeacon/advertisement0";

    // Non-connectable advertisement
    constexpr std::string_view ADVERTISEMENT_TYPE = "broadcast";
} // namespace

BluezManufacturerData uxbeacon::beacon::split_manufacturer_data(std::span<const std::byte> manufacturer_data) {
    if(manufacturer_data.size() < 2) {
        throw AdvertisementError("manufacturer data of " + to_string(manufacturer_data.size()) +
                                 " bytes does not contain a company identifier");
    }

    BluezManufacturerData split {};
    split.company_id = static_cast<std::uint16_t>(std::to_integer<unsigned int>(manufacturer_data[0]) |
                                                  (std::to_integer<unsigned int>(manufacturer_data[1]) << 8U));
    split.data.reserve(manufacturer_data.size() - 2);
    std::ranges::transform(manufacturer_data.subspan(2), std::back_inserter(split.data), [](std::byte byte) {
        return std::to_integer<std::uint8_t>(byte);
    });
    return split;
}

std::string uxbeacon::beacon::adapter_object_path(std::string_view adapter) {
    const auto valid_char = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; };
    if(adapter.empty() || !std::ranges::all_of(adapter, valid_char)) {
        throw RadioError("invalid Bluetooth adapter name " + quote(adapter));
    }
    return "/org/bluez/" + std::string(adapter);
}

BluezRadio::BluezRadio(std::string_view adapter)
    : logger_("BLUEZ"), adapter_(adapter), adapter_path_(adapter_object_path(adapter)) {
    try {
        proxy_connection_ = sdbus::createSystemBusConnection();
        object_connection_ = sdbus::createSystemBusConnection();

        adapter_proxy_ = sdbus::createProxy(*proxy_connection_, std::string(BLUEZ_SERVICE), adapter_path_);
        adapter_proxy_->uponSignal("PropertiesChanged")
            .onInterface(std::string(PROPERTIES_INTERFACE))
            .call([this](const std::string& interface,
                         const std::map<std::string, sdbus::Variant>& changed,
                         const std::vector<std::string>& invalidated) {
                on_properties_changed(interface, changed, invalidated);
            });
        adapter_proxy_->finishRegistration();

        register_advertisement_object();

        object_connection_->enterEventLoopAsync();
        proxy_connection_->enterEventLoopAsync();
    } catch(const sdbus::Error& error) {
        throw RadioError("unable to connect to BlueZ on the system bus: " + error.getMessage());
    }
    LOG(logger_, DEBUG) << "Connected to Bluetooth adapter " << adapter_path_;
}

BluezRadio::~BluezRadio() {
    stopAdvertising();
    proxy_connection_->leaveEventLoop();
    object_connection_->leaveEventLoop();
}

void BluezRadio::register_advertisement_object() {
    const std::string interface {ADVERTISEMENT_INTERFACE};
    advertisement_ = sdbus::createObject(*object_connection_, std::string(ADVERTISEMENT_PATH));

    advertisement_->registerMethod("Release").onInterface(interface).implementedAs([this]() {
        registered_ = false;
        LOG(logger_, WARNING) << "Advertisement released by BlueZ";
    });

    advertisement_->registerProperty("Type").onInterface(interface).withGetter(
        []() { return std::string(ADVERTISEMENT_TYPE); });
    advertisement_->registerProperty("LocalName").onInterface(interface).withGetter([this]() {
        const std::lock_guard data_lock {data_mutex_};
        return local_name_;
    });
    advertisement_->registerProperty("ManufacturerData").onInterface(interface).withGetter([this]() {
        const std::lock_guard data_lock {data_mutex_};
        return std::map<std::uint16_t, sdbus::Variant> {
            {manufacturer_data_.company_id, sdbus::Variant(manufacturer_data_.data)}};
    });

    advertisement_->finishRegistration();
}

void BluezRadio::onReady(ReadyCallback callback) {
    const std::lock_guard callback_lock {callback_mutex_};
    ready_callback_ = std::move(callback);
}

void BluezRadio::start() {
    bool powered {false};
    try {
        const sdbus::Variant value = adapter_proxy_->getProperty("Powered").onInterface(std::string(ADAPTER_INTERFACE));
        powered = value.get<bool>();
    } catch(const sdbus::Error& error) {
        throw RadioError("unable to read power state of " + adapter_ + ": " + error.getMessage());
    }

    if(powered) {
        notify_ready();
    } else {
        LOG(logger_, INFO) << "Waiting for Bluetooth adapter " << adapter_ << " to be powered on";
    }
}

void BluezRadio::on_properties_changed(const std::string& interface,
                                       const std::map<std::string, sdbus::Variant>& changed,
                                       const std::vector<std::string>& /*invalidated*/) {
    if(interface != ADAPTER_INTERFACE) {
        return;
    }
    const auto powered_it = changed.find("Powered");
    if(powered_it == changed.end() || !powered_it->second.containsValueOfType<bool>()) {
        return;
    }

    const auto powered = powered_it->second.get<bool>();
    LOG(logger_, DEBUG) << "Adapter " << adapter_ << " powered " << (powered ? "on" : "off");
    if(powered) {
        notify_ready();
    }
}

void BluezRadio::notify_ready() {
    // Only the first power-on is reported
    if(ready_notified_.exchange(true)) {
        return;
    }
    LOG(logger_, DEBUG) << "Radio powered on";

    const std::lock_guard callback_lock {callback_mutex_};
    if(ready_callback_) {
        ready_callback_();
    }
}

void BluezRadio::startAdvertising(std::string_view name, std::span<const std::byte> manufacturer_data) {
    // Throws if the advertising data does not fit
    const auto frame =
        AdvertisingData(std::string(name), {manufacturer_data.begin(), manufacturer_data.end()}).assemble();
    const auto fitted = AdvertisingData::disassemble(frame);
    auto split = split_manufacturer_data(manufacturer_data);

    std::unique_lock data_lock {data_mutex_};
    local_name_ = fitted.getName();
    manufacturer_data_ = std::move(split);
    data_lock.unlock();

    if(registered_) {
        LOG(logger_, DEBUG) << "Advertisement already registered, updated advertising data";
        return;
    }

    try {
        adapter_proxy_->callMethod("RegisterAdvertisement")
            .onInterface(std::string(ADVERTISING_MANAGER_INTERFACE))
            .withArguments(sdbus::ObjectPath(std::string(ADVERTISEMENT_PATH)), std::map<std::string, sdbus::Variant> {});
    } catch(const sdbus::Error& error) {
        throw AdvertisementError("BlueZ refused the advertisement: " + error.getMessage());
    }
    registered_ = true;
    LOG(logger_, INFO) << "Started advertising as " << quote(fitted.getName()) << " on " << adapter_;
}

void BluezRadio::stopAdvertising() {
    if(!registered_.exchange(false)) {
        return;
    }
    try {
        adapter_proxy_->callMethod("UnregisterAdvertisement")
            .onInterface(std::string(ADVERTISING_MANAGER_INTERFACE))
            .withArguments(sdbus::ObjectPath(std::string(ADVERTISEMENT_PATH)));
        LOG(logger_, DEBUG) << "Stopped advertising";
    } catch(const sdbus::Error& error) {
        LOG(logger_, WARNING) << "Failed to unregister advertisement: " << error.getMessage();
    }
}
