/**
 * @file
 * @brief Base exceptions used in the framework
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

/**
 * @defgroup Exceptions Exception classes
 * @brief Collection of all the exceptions used in the framework
 */

#pragma once

#include <exception>
#include <string>
#include <utility>

#include "uxbeacon/build.hpp"

namespace uxbeacon::utils {

    /**
     * @ingroup Exceptions
     * @brief Base class for all non-internal exceptions in framework.
     */
    class UXBCN_API Exception : public std::exception {
    public:
        /**
         * @brief Creates exception with the specified problem
         * @param what_arg Text describing the problem
         */
        explicit Exception(std::string what_arg) : error_message_(std::move(what_arg)) {}

        /**
         * @brief Return the error message
         * @return Text describing the error
         */
        const char* what() const noexcept override { return error_message_.c_str(); }

    protected:
        /**
         * @brief Internal constructor for exceptions setting the error message indirectly
         */
        Exception() = default;

        // NOLINTNEXTLINE(misc-non-private-member-variables-in-classes)
        std::string error_message_;
    };

    /**
     * @ingroup Exceptions
     * @brief Errors related to problems occurring at runtime
     *
     * Problems that could never have been detected at compile time, such as a missing file or an unreachable network
     */
    class UXBCN_API RuntimeError : public Exception {
    public:
        /**
         * @brief Creates exception with the given runtime problem
         * @param what_arg Text describing the problem
         */
        explicit RuntimeError(std::string what_arg) : Exception(std::move(what_arg)) {}

    protected:
        RuntimeError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief Errors related to logical problems in the code structure
     */
    class UXBCN_API LogicError : public Exception {
    public:
        explicit LogicError(std::string what_arg) : Exception(std::move(what_arg)) {}

    protected:
        LogicError() = default;
    };

} // namespace uxbeacon::utils
