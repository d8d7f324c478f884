/**
 * @file
 * @brief Timer utilities
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <chrono>

namespace uxbeacon::utils {

    /** Timer that can be used to wait for timeouts */
    class TimeoutTimer {
    public:
        TimeoutTimer(std::chrono::nanoseconds timeout) : timeout_(timeout) {}
        void reset() { start_time_ = std::chrono::steady_clock::now(); }
        bool timeoutReached() const { return start_time_ + timeout_ < std::chrono::steady_clock::now(); }
        std::chrono::steady_clock::time_point startTime() const { return start_time_; }

    private:
        std::chrono::steady_clock::time_point start_time_;
        std::chrono::nanoseconds timeout_;
    };

} // namespace uxbeacon::utils
