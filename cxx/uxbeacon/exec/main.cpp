/**
 * @file
 * @brief Beacon executable
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include "uxbeacon/exec/beacon.hpp"
#include "uxbeacon/exec/cli.hpp"

using namespace uxbeacon::exec;

int main(int argc, char* argv[]) {
    return beacon_main(to_span(argc, argv), "uxbeacon");
}
