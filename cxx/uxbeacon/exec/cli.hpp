/**
 * @file
 * @brief Command Line Interface
 *
 * @copyright Copyright (c) 2023 DESY and the Constellation authors.
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

#include <argparse/argparse.hpp>

#include "uxbeacon/build.hpp"
#include "uxbeacon/core/log/Level.hpp"
#include "uxbeacon/exec/BeaconConfig.hpp"

namespace uxbeacon::exec {

    /**
     * @brief Cast C-style main argument to C++ span
     *
     * @param argc Argument count
     * @param argv Pointer to arguments
     * @return Span of arguments
     */
    inline std::span<const char*> to_span(int argc, char** argv) {
        return {const_cast<const char**>(argv), static_cast<std::size_t>(argc)};
    };

    class UXBCN_API BaseParser : protected argparse::ArgumentParser {
    public:
        struct BaseOptions {
            /** Console log level, if given */
            std::optional<log::Level> log_level;
        };

    public:
        /**
         * @brief Construct a new parser
         *
         * @param program Name of the program to display in help
         */
        BaseParser(std::string program);

        virtual ~BaseParser() = default;

        /// @cond doxygen_suppress
        // No copy/move constructor/assignment
        BaseParser(const BaseParser& other) = delete;
        BaseParser& operator=(const BaseParser& other) = delete;
        BaseParser(BaseParser&& other) = delete;
        BaseParser& operator=(BaseParser&& other) = delete;
        /// @endcond

        /**
         * @brief Add the CLI options to the parser
         *
         * This add the `--level` option
         *
         * @note Inheriting classes might override this function but have to call `BaseParser::setup()` to add the CLI
         *       options from the base parser.
         */
        virtual void setup();

        /**
         * @brief Parse options from the command line
         *
         * @note Inheriting classes might override this function but have to call `BaseParser::parse()` to add parse the
         *       options from the base parser.
         *
         * @return Parsed options
         */
        BaseOptions parse(std::span<const char*> args);

        /**
         * @brief Get program help
         *
         * @return String containing the program help
         */
        std::string help() const;
    };

    class UXBCN_API BeaconParser : public BaseParser {
    public:
        struct BeaconOptions : BaseOptions {
            /** Configuration file */
            std::optional<std::filesystem::path> config_file;

            /** Configuration given on the command line */
            BeaconConfig config;
        };

    public:
        /**
         * @brief Construct a new parser
         *
         * @param program Name of the program to display in help
         */
        BeaconParser(std::string program);

        virtual ~BeaconParser() = default;

        /// @cond doxygen_suppress
        // No copy/move constructor/assignment
        BeaconParser(const BeaconParser& other) = delete;
        BeaconParser& operator=(const BeaconParser& other) = delete;
        BeaconParser(BeaconParser&& other) = delete;
        BeaconParser& operator=(BeaconParser&& other) = delete;
        /// @endcond

        /**
         * @brief Add the CLI options to the parser
         *
         * This add the `--config`, `--port-file`, `--name`, route and relay options in addition to the options from the
         * `BaseParser`.
         */
        void setup() override;

        /**
         * @brief Parse options from the command line
         *
         * @return Parsed options
         */
        BeaconOptions parse(std::span<const char*> args);
    };

} // namespace uxbeacon::exec
