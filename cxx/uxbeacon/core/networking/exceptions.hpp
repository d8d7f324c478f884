/**
 * @file
 * @brief Network communication exceptions used in the framework
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <string>
#include <utility>

#include "uxbeacon/build.hpp"
#include "uxbeacon/core/utils/exceptions.hpp"

namespace uxbeacon::networking {

    /**
     * @ingroup Exceptions
     * @brief Errors related to network communication
     *
     * Problems that could never have been detected at compile time
     */
    class UXBCN_API NetworkError : public utils::RuntimeError {
    public:
        /**
         * @brief Creates exception with the given network problem
         * @param what_arg Text describing the problem
         */
        explicit NetworkError(std::string what_arg) : RuntimeError(std::move(what_arg)) {}

    protected:
        NetworkError() = default;
    };

} // namespace uxbeacon::networking
