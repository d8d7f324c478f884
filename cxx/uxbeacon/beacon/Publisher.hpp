/**
 * @file
 * @brief Advertisement publisher driving the radio state machine
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <asio/ip/address_v4.hpp>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/beacon/BeaconPayload.hpp"
#include "uxbeacon/beacon/Radio.hpp"
#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Logger.hpp"
#include "uxbeacon/core/networking/Port.hpp"

namespace uxbeacon::beacon {

    /**
     * @brief Publishes the beacon once the radio is ready
     *
     * The publisher starts in the `IDLE` state. The first ready notification of the radio moves it to `POWERED_ON`
     * and triggers the port resolution, the address selection, the payload assembly and the start of the
     * advertisement exactly once. Further ready notifications are ignored.
     */
    class AdvertisementPublisher {
    public:
        enum class State : std::uint8_t {
            IDLE,
            POWERED_ON,
        };

        /** Source for the port of the receiver, throws on failure */
        using PortSource = std::function<networking::Port()>;

        /** Source for the address to advertise */
        using AddressSource = std::function<asio::ip::address_v4()>;

    public:
        /**
         * @brief Construct publisher and register it with the radio
         *
         * @param radio Radio used to advertise, has to outlive the publisher
         * @param port_source Source for the port of the receiver
         * @param address_source Source for the address to advertise
         * @param name Local name to advertise
         */
        UXBCN_API AdvertisementPublisher(Radio& radio,
                                         PortSource port_source,
                                         AddressSource address_source,
                                         std::string name = std::string(DEFAULT_NAME));

        // No copy/move constructor/assignment
        /// @cond doxygen_suppress
        AdvertisementPublisher(const AdvertisementPublisher& other) = delete;
        AdvertisementPublisher& operator=(const AdvertisementPublisher& other) = delete;
        AdvertisementPublisher(AdvertisementPublisher&& other) = delete;
        AdvertisementPublisher& operator=(AdvertisementPublisher&& other) = delete;
        /// @endcond

        UXBCN_API ~AdvertisementPublisher();

        State getState() const { return state_.load(); }

        const std::string& getName() const { return name_; }

        /** Whether publishing failed after the radio became ready */
        UXBCN_API bool hasFailed() const;

        /** Message of the error which prevented publishing */
        UXBCN_API std::optional<std::string> getError() const;

        /** Payload being advertised */
        UXBCN_API std::optional<AssembledPayload> getPayload() const;

    private:
        void on_ready();
        void publish();

    private:
        Radio& radio_;
        PortSource port_source_;
        AddressSource address_source_;
        std::string name_;
        log::Logger logger_;

        std::atomic<State> state_ {State::IDLE};

        mutable std::mutex mutex_;
        std::optional<std::string> error_;
        std::optional<AssembledPayload> payload_;
    };

} // namespace uxbeacon::beacon
