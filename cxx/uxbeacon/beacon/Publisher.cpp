/**
 * @file
 * @brief Implementation of the advertisement publisher
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "Publisher.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "uxbeacon/beacon/BeaconPayload.hpp"
#include "uxbeacon/beacon/exceptions.hpp"
#include "uxbeacon/core/log/log.hpp"
#include "uxbeacon/core/utils/exceptions.hpp"
#include "uxbeacon/core/utils/string.hpp"

using namespace uxbeacon::beacon;
using namespace uxbeacon::utils;

AdvertisementPublisher::AdvertisementPublisher(Radio& radio,
                                               PortSource port_source,
                                               AddressSource address_source,
                                               std::string name)
    : radio_(radio), port_source_(std::move(port_source)), address_source_(std::move(address_source)),
      name_(std::move(name)), logger_("PUBLISHER") {
    radio_.onReady([this]() { on_ready(); });
}

AdvertisementPublisher::~AdvertisementPublisher() {
    // Radio might outlive the publisher
    radio_.onReady({});
}

bool AdvertisementPublisher::hasFailed() const {
    const std::lock_guard lock {mutex_};
    return error_.has_value();
}

std::optional<std::string> AdvertisementPublisher::getError() const {
    const std::lock_guard lock {mutex_};
    return error_;
}

std::optional<AssembledPayload> AdvertisementPublisher::getPayload() const {
    const std::lock_guard lock {mutex_};
    return payload_;
}

void AdvertisementPublisher::on_ready() {
    auto expected = State::IDLE;
    if(!state_.compare_exchange_strong(expected, State::POWERED_ON)) {
        LOG(logger_, DEBUG) << "Ignoring ready notification in state " << to_string(expected);
        return;
    }
    LOG(logger_, DEBUG) << "Radio powered on";

    try {
        publish();
    } catch(const RuntimeError& error) {
        LOG(logger_, CRITICAL) << error.what();
        const std::lock_guard lock {mutex_};
        error_ = error.what();
    }
}

void AdvertisementPublisher::publish() {
    const auto port = port_source_();
    if(port == 0) {
        throw PortParseError("port 0 cannot be advertised");
    }
    LOG(logger_, INFO) << "Receiver port: " << port;

    const auto address = address_source_();
    LOG(logger_, INFO) << "Receiver address: " << address.to_string();

    const auto payload = assemble_payload(address.to_string(), port);
    LOG(logger_, DEBUG) << "Beacon payload: " << bytes_to_hex_string(payload);

    radio_.startAdvertising(name_, payload);
    LOG(logger_, STATUS) << "Advertising " << quote(name_) << " for receiver at "
                         << BeaconPayload::disassemble(payload).to_string();

    const std::lock_guard lock {mutex_};
    payload_ = payload;
}
