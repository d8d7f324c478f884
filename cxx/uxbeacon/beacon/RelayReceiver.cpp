/**
 * @file
 * @brief Implementation of the relay receiver
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "RelayReceiver.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <system_error>

#include <asio.hpp>

#include "uxbeacon/beacon/AdvertisingData.hpp"
#include "uxbeacon/core/networking/asio_helpers.hpp"
#include "uxbeacon/core/networking/exceptions.hpp"
#include "uxbeacon/core/networking/Port.hpp"

using namespace uxbeacon::beacon;
using namespace uxbeacon::networking;

namespace {
    // Advertising data never exceeds a few dozen bytes, anything longer is truncated and rejected when decoded
    constexpr std::size_t FRAME_BUFFER = 256;
} // namespace

AdvertisingData RelayFrame::getAdvertisingData() const {
    return AdvertisingData::disassemble(content);
}

RelayReceiver::RelayReceiver(const asio::ip::address_v4& any_address, Port port)
    : endpoint_(any_address, port), socket_(io_context_) {
    std::error_code ec {};
    socket_.open(endpoint_.protocol(), ec);
    // Set reusable address socket option
    if(!ec) {
        socket_.set_option(asio::socket_base::reuse_address(true), ec);
    }
    // Bind socket on receiving side
    if(!ec) {
        socket_.bind(endpoint_, ec);
    }
    if(ec) {
        throw NetworkError("Unable to listen on " + to_uri(any_address, port, "udp") + ": " + ec.message());
    }
}

Port RelayReceiver::getPort() const {
    return socket_.local_endpoint().port();
}

RelayFrame RelayReceiver::recvFrame() {
    RelayFrame frame {};

    // Reserve some space for frame
    frame.content.resize(FRAME_BUFFER);

    // Receive content and length of frame
    asio::ip::udp::endpoint sender_endpoint {};
    const auto length = socket_.receive_from(asio::buffer(frame.content), sender_endpoint);

    frame.address = sender_endpoint.address().to_v4();
    frame.content.resize(length);

    return frame;
}

std::optional<RelayFrame> RelayReceiver::asyncRecvFrame(std::chrono::steady_clock::duration timeout) {
    RelayFrame frame {};
    frame.content.resize(FRAME_BUFFER);
    asio::ip::udp::endpoint sender_endpoint {};

    // Receive as future
    auto length_future = socket_.async_receive_from(asio::buffer(frame.content), sender_endpoint, asio::use_future);

    // Run IO context for timeout
    io_context_.restart();
    io_context_.run_for(timeout);

    // If IO context not stopped, then no frame received
    if(!io_context_.stopped()) {
        // Cancel async operations and let the cancelled handler complete
        socket_.cancel();
        io_context_.restart();
        io_context_.poll();
        return std::nullopt;
    }

    frame.address = sender_endpoint.address().to_v4();
    frame.content.resize(length_future.get());
    return frame;
}
