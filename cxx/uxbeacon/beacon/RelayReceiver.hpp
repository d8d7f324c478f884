/**
 * @file
 * @brief Receiver for advertisements relayed as UDP broadcasts
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

#include <asio.hpp>

#include "uxbeacon/beacon/AdvertisingData.hpp"
#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/build.hpp"
#include "uxbeacon/core/networking/Port.hpp"

namespace uxbeacon::beacon {

    /** Incoming relay frame */
    struct RelayFrame {
        /** Advertising data in bytes */
        std::vector<std::byte> content;

        /** Address from which the frame was received */
        asio::ip::address_v4 address;

        /**
         * @brief Decode the advertising data of the frame
         *
         * @throw PayloadDecodingError if the content is not valid advertising data
         */
        UXBCN_API AdvertisingData getAdvertisingData() const;
    };

    /** Receiver for relay frames */
    class RelayReceiver {
    public:
        /**
         * @brief Construct relay receiver
         *
         * @param any_address Address for incoming frames (e.g. `asio::ip::address_v4::any()`)
         * @param port Port for incoming frames, zero to bind to an ephemeral port
         * @throw NetworkError if the socket cannot be bound
         */
        UXBCN_API RelayReceiver(const asio::ip::address_v4& any_address = asio::ip::address_v4::any(),
                                networking::Port port = RELAY_PORT);

        /** Port to which the receiver is bound */
        UXBCN_API networking::Port getPort() const;

        /**
         * @brief Receive relay frame (blocking)
         *
         * @return Received relay frame
         */
        UXBCN_API RelayFrame recvFrame();

        /**
         * @brief Receive relay frame (asynchronously)
         *
         * @param timeout Duration for which to block function call
         * @return Relay frame if received
         */
        UXBCN_API std::optional<RelayFrame> asyncRecvFrame(std::chrono::steady_clock::duration timeout);

    private:
        asio::io_context io_context_;
        asio::ip::udp::endpoint endpoint_;
        asio::ip::udp::socket socket_;
    };

} // namespace uxbeacon::beacon
