/**
 * @file
 * @brief Collection of all beacon exceptions
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "uxbeacon/build.hpp"
#include "uxbeacon/core/utils/exceptions.hpp"
#include "uxbeacon/core/utils/string.hpp"

namespace uxbeacon::beacon {

    /**
     * @ingroup Exceptions
     * @brief Base class for all errors preventing a beacon from being advertised
     */
    class UXBCN_API BeaconError : public utils::RuntimeError {
    protected:
        BeaconError() = default;
    };

    /**
     * @ingroup Exceptions
     * @brief The port file written by the receiver does not exist
     */
    class UXBCN_API FileMissingError : public BeaconError {
    public:
        explicit FileMissingError(const std::filesystem::path& path) {
            error_message_ = "Port file " + utils::quote(path.string()) + " not found, is the receiver running?";
        }
    };

    /**
     * @ingroup Exceptions
     * @brief The port file exists but could not be read
     */
    class UXBCN_API PortFileReadError : public BeaconError {
    public:
        explicit PortFileReadError(const std::filesystem::path& path) {
            error_message_ = "Could not read port file " + utils::quote(path.string());
        }
    };

    /**
     * @ingroup Exceptions
     * @brief The content of the port file could not be interpreted as a port number
     */
    class UXBCN_API PortParseError : public BeaconError {
    public:
        explicit PortParseError(std::string_view reason) {
            error_message_ = "Could not parse port: ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief The address is not a well-formed dotted-quad IPv4 address
     */
    class UXBCN_API InvalidAddressError : public BeaconError {
    public:
        explicit InvalidAddressError(std::string_view address) {
            error_message_ = "Invalid IPv4 address " + utils::quote(address);
        }
    };

    /**
     * @ingroup Exceptions
     * @brief A beacon payload could not be decoded
     */
    class UXBCN_API PayloadDecodingError : public BeaconError {
    public:
        explicit PayloadDecodingError(std::string_view reason) {
            error_message_ = "Error decoding beacon payload: ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief The radio could not advertise the requested data
     */
    class UXBCN_API AdvertisementError : public BeaconError {
    public:
        explicit AdvertisementError(std::string_view reason) {
            error_message_ = "Unable to advertise: ";
            error_message_ += reason;
        }
    };

    /**
     * @ingroup Exceptions
     * @brief The radio subsystem is not available
     */
    class UXBCN_API RadioError : public BeaconError {
    public:
        explicit RadioError(std::string_view reason) {
            error_message_ = "Radio unavailable: ";
            error_message_ += reason;
        }
    };

} // namespace uxbeacon::beacon
