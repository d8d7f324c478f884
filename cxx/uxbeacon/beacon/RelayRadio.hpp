/**
 * @file
 * @brief Radio relaying advertisements as UDP broadcasts
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <span>
#include <stop_token>
#include <string_view>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/udp.hpp>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/beacon/Radio.hpp"
#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Logger.hpp"
#include "uxbeacon/core/networking/Port.hpp"

namespace uxbeacon::beacon {

    /**
     * @brief Radio sending the advertising data as UDP datagrams
     *
     * Each datagram contains the legacy advertising data exactly as it would be sent over the air. The datagram is
     * repeated at a fixed interval from a sender thread until advertising is stopped.
     */
    class RelayRadio final : public Radio {
    public:
        /**
         * @brief Construct relay radio
         *
         * @param address Destination address for the datagrams, usually a broadcast address
         * @param port Destination port for the datagrams
         * @param interval Interval at which the advertisement is repeated
         * @throw NetworkError if the socket cannot be opened
         */
        UXBCN_API RelayRadio(asio::ip::address_v4 address = asio::ip::address_v4::broadcast(),
                             networking::Port port = RELAY_PORT,
                             std::chrono::milliseconds interval = DEFAULT_RELAY_INTERVAL);

        UXBCN_API ~RelayRadio() override;

        // No copy/move constructor/assignment
        /// @cond doxygen_suppress
        RelayRadio(const RelayRadio& other) = delete;
        RelayRadio& operator=(const RelayRadio& other) = delete;
        RelayRadio(RelayRadio&& other) = delete;
        RelayRadio& operator=(RelayRadio&& other) = delete;
        /// @endcond

        UXBCN_API void onReady(ReadyCallback callback) override;

        /**
         * @brief Power on the radio and notify the ready callback
         */
        UXBCN_API void start();

        UXBCN_API void startAdvertising(std::string_view name, std::span<const std::byte> manufacturer_data) override;

        /**
         * @brief Stop repeating the advertisement
         */
        UXBCN_API void stopAdvertising();

        bool isAdvertising() const { return sender_thread_.joinable(); }

        /** Number of datagrams sent since construction */
        std::size_t getSentCount() const { return sent_count_.load(); }

    private:
        void loop(const std::stop_token& stop_token);
        void send_frame();

    private:
        log::Logger logger_;
        asio::io_context io_context_;
        asio::ip::udp::endpoint endpoint_;
        asio::ip::udp::socket socket_;
        std::chrono::milliseconds interval_;

        ReadyCallback ready_callback_;

        std::mutex frame_mutex_;
        std::vector<std::byte> frame_;
        std::atomic_size_t sent_count_ {0};

        std::jthread sender_thread_;
    };

} // namespace uxbeacon::beacon
