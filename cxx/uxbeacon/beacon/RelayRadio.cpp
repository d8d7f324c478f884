/**
 * @file
 * @brief Implementation of the relay radio
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "RelayRadio.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <asio.hpp>

#include "uxbeacon/beacon/AdvertisingData.hpp"
#include "uxbeacon/core/log/log.hpp"
#include "uxbeacon/core/networking/asio_helpers.hpp"
#include "uxbeacon/core/networking/exceptions.hpp"
#include "uxbeacon/core/utils/string.hpp"
#include "uxbeacon/core/utils/thread.hpp"
#include "uxbeacon/core/utils/timers.hpp"

using namespace uxbeacon::beacon;
using namespace uxbeacon::networking;
using namespace uxbeacon::utils;
using namespace std::chrono_literals;

RelayRadio::RelayRadio(asio::ip::address_v4 address, Port port, std::chrono::milliseconds interval)
    : logger_("RELAY"), endpoint_(address, port), socket_(io_context_), interval_(interval) {
    std::error_code ec {};
    socket_.open(endpoint_.protocol(), ec);
    if(ec) {
        throw NetworkError("Unable to open relay socket: " + ec.message());
    }

    // Set reusable address and broadcast socket options
    socket_.set_option(asio::socket_base::reuse_address(true), ec);
    if(!ec) {
        socket_.set_option(asio::socket_base::broadcast(true), ec);
    }
    // Set destination address for use in send() function
    if(!ec) {
        socket_.connect(endpoint_, ec);
    }
    if(ec) {
        throw NetworkError("Unable to relay to " + to_uri(address, port, "udp") + ": " + ec.message());
    }
    LOG(logger_, DEBUG) << "Relaying advertisements to " << to_uri(address, port, "udp");
}

RelayRadio::~RelayRadio() {
    stopAdvertising();
}

void RelayRadio::onReady(ReadyCallback callback) {
    ready_callback_ = std::move(callback);
}

void RelayRadio::start() {
    LOG(logger_, DEBUG) << "Radio powered on";
    if(ready_callback_) {
        ready_callback_();
    }
}

void RelayRadio::startAdvertising(std::string_view name, std::span<const std::byte> manufacturer_data) {
    // Throws if the advertising data does not fit
    auto frame = AdvertisingData(std::string(name), {manufacturer_data.begin(), manufacturer_data.end()}).assemble();
    LOG(logger_, TRACE) << "Advertising data: " << bytes_to_hex_string(frame);

    std::unique_lock frame_lock {frame_mutex_};
    frame_ = std::move(frame);
    frame_lock.unlock();

    if(!sender_thread_.joinable()) {
        sender_thread_ = std::jthread(std::bind_front(&RelayRadio::loop, this));
    }
    LOG(logger_, INFO) << "Started advertising as " << quote(name) << " every " << to_string(interval_);
}

void RelayRadio::stopAdvertising() {
    sender_thread_.request_stop();
    if(sender_thread_.joinable()) {
        sender_thread_.join();
        LOG(logger_, DEBUG) << "Stopped advertising";
    }
    sender_thread_ = {};
}

void RelayRadio::loop(const std::stop_token& stop_token) {
    set_current_thread_name("RelayRadio");

    while(!stop_token.stop_requested()) {
        send_frame();

        // Wait until stop request or timeout of interval is reached
        TimeoutTimer interval_timer {interval_};
        interval_timer.reset();
        while(!interval_timer.timeoutReached() && !stop_token.stop_requested()) {
            std::this_thread::sleep_for(10ms);
        }
    }
}

void RelayRadio::send_frame() {
    const std::lock_guard frame_lock {frame_mutex_};
    std::error_code ec {};
    socket_.send(asio::const_buffer(frame_.data(), frame_.size()), {}, ec);
    if(ec) {
        LOG_N(logger_, WARNING, 3) << "Failed to send advertisement: " << ec.message();
        return;
    }
    ++sent_count_;
}
