/**
 * @file
 * @brief Receiver printing advertisements relayed by the beacon
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <charconv>
#include <chrono> // IWYU pragma: keep
#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <span>
#include <stop_token>
#include <string_view>
#include <system_error>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/beacon/BeaconPayload.hpp"
#include "uxbeacon/beacon/exceptions.hpp"
#include "uxbeacon/beacon/RelayReceiver.hpp"
#include "uxbeacon/core/log/log.hpp"
#include "uxbeacon/core/log/Logger.hpp"
#include "uxbeacon/core/networking/Port.hpp"
#include "uxbeacon/core/utils/string.hpp"

using namespace uxbeacon;
using namespace uxbeacon::beacon;
using namespace uxbeacon::log;
using namespace uxbeacon::utils;
using namespace std::chrono_literals;

namespace {
    // Use global std::function to work around C linkage
    std::function<void(int)> signal_handler_f {}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
} // namespace

extern "C" void signal_handler(int signal) {
    signal_handler_f(signal);
}

namespace {
    void cli_loop(std::span<char*> args) {
        // Get port via cmdline
        std::cout << "Usage: uxbeacon_relay_recv [PORT]\n" << std::flush;

        auto port = RELAY_PORT;
        if(args.size() >= 2) {
            const std::string_view port_str {args[1]};
            const auto result = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
            if(result.ec != std::errc() || result.ptr != port_str.data() + port_str.size()) {
                std::cerr << quote(port_str) << " is not a valid port\n" << std::flush;
                return;
            }
        }

        RelayReceiver receiver {asio::ip::address_v4::any(), port};
        std::cout << "Listening for relayed advertisements on port " << receiver.getPort() << "\n" << std::flush;

        Logger logger {"RELAY_RECV"};

        std::stop_source stop_source;
        signal_handler_f = [&](int /*signal*/) -> void { stop_source.request_stop(); };

        // NOLINTBEGIN(cert-err33-c)
        std::signal(SIGTERM, &signal_handler);
        std::signal(SIGINT, &signal_handler);
        // NOLINTEND(cert-err33-c)

        while(!stop_source.stop_requested()) {
            const auto frame = receiver.asyncRecvFrame(100ms);
            if(!frame.has_value()) {
                continue;
            }
            try {
                const auto advertising_data = frame->getAdvertisingData();
                const auto payload = BeaconPayload::disassemble(advertising_data.getManufacturerData());
                LOG(logger, INFO) << quote(advertising_data.getName()) << " from " << frame->address.to_string()
                                  << " announces receiver at " << payload.to_string();
            } catch(const BeaconError& error) {
                LOG(logger, WARNING) << "Ignoring frame from " << frame->address.to_string() << ": " << error.what();
            }
        }
    }
} // namespace

int main(int argc, char* argv[]) {
    try {
        cli_loop(std::span(argv, argc));
    } catch(const std::exception& error) {
        std::cerr << "Critical failure: " << error.what() << "\n" << std::flush;
        return 1;
    }
    return 0;
}
