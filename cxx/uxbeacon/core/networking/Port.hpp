/**
 * @file
 * @brief Network port definition
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstdint>

namespace uxbeacon::networking {

    /**
     * @brief Port number for a network connection
     *
     * The mirroring receiver usually listens on an ephemeral port, see also https://en.wikipedia.org/wiki/Ephemeral_port.
     */
    using Port = std::uint16_t;

} // namespace uxbeacon::networking
