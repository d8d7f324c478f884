/**
 * @file
 * @brief Resolution of the receiver port from the port file
 *
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Logger.hpp"
#include "uxbeacon/core/networking/Port.hpp"

namespace uxbeacon::beacon {

    /**
     * @brief Parse the port from the first line of the file content as decimal text
     *
     * The line ends at the first newline, and within that at the first null byte. The line has to consist of ASCII
     * digits only. No range check is applied apart from the port fitting into 16 bits.
     *
     * @param content Raw content of the port file
     * @return Port if the first line is a decimal number, otherwise an empty optional
     * @throw PortParseError if the decimal number does not fit into 16 bits
     */
    UXBCN_API std::optional<networking::Port> parse_text_port(std::span<const std::byte> content);

    /**
     * @brief Parse the port from the first two bytes of the file content as big-endian integer
     *
     * @param content Raw content of the port file
     * @return Port if at least two bytes are present and the value is not below 1024, otherwise an empty optional
     */
    UXBCN_API std::optional<networking::Port> parse_binary_port(std::span<const std::byte> content);

    /** Default location of the port file in the home directory of the current user */
    UXBCN_API std::filesystem::path default_port_file();

    /**
     * @brief Reads the port file written by the receiver and extracts the port
     *
     * The file content is passed to an ordered list of strategies, the first strategy yielding a port wins. The file is
     * read anew on every call.
     */
    class PortResolver {
    public:
        /** Single strategy to extract a port from the raw file content */
        struct Strategy {
            std::string_view name;
            std::function<std::optional<networking::Port>(std::span<const std::byte>)> parse;
        };

    public:
        /**
         * @brief Construct a resolver with the text strategy followed by the binary strategy
         */
        UXBCN_API PortResolver();

        /**
         * @brief Construct a resolver with a custom list of strategies
         *
         * @param strategies Strategies in the order in which they are tried
         */
        UXBCN_API explicit PortResolver(std::vector<Strategy> strategies);

        /**
         * @brief Read the port file and extract the port
         *
         * @param path Path to the port file
         * @return Resolved port
         * @throw FileMissingError if the file does not exist
         * @throw PortFileReadError if the file is not a regular file or cannot be read
         * @throw PortParseError if no strategy yields a port
         */
        UXBCN_API networking::Port resolve(const std::filesystem::path& path);

        /**
         * @brief Extract the port from raw file content
         *
         * @param content Raw content of the port file
         * @return Resolved port
         * @throw PortParseError if no strategy yields a port
         */
        UXBCN_API networking::Port parse(std::span<const std::byte> content);

        const std::vector<Strategy>& getStrategies() const { return strategies_; }

    private:
        std::vector<Strategy> strategies_;
        log::Logger logger_;
    };

    /**
     * @brief Resolve the port from a port file using the default strategies
     *
     * @param path Path to the port file
     * @return Resolved port
     * @throw BeaconError if the port cannot be resolved
     */
    UXBCN_API networking::Port resolve_port(const std::filesystem::path& path);

} // namespace uxbeacon::beacon
