/**
 * @file
 * @brief Naming of worker threads
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string>
#include <string_view>

#ifdef __linux__
#include <pthread.h>
#endif

namespace uxbeacon::utils {

    /**
     * @brief Name the calling thread as shown by `top -H` and debuggers
     *
     * @param name Thread name, cut to 15 characters on Linux
     */
    inline void set_current_thread_name([[maybe_unused]] std::string_view name) {
#ifdef __linux__
        const std::string truncated {name.substr(0, 15)};
        pthread_setname_np(pthread_self(), truncated.c_str());
#endif
    }

} // namespace uxbeacon::utils
