/**
 * @copyright Copyright (c) 2026 the UxBeacon authors.
 * This software is distributed under the terms of the EUPL-1.2 License.
 * SPDX-License-Identifier: EUPL-1.2
 */

#include <chrono>
#include <cstdlib>
#include <string>
#include <vector>

#include <asio/ip/address_v4.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "uxbeacon/beacon/beacon_definitions.hpp"
#include "uxbeacon/core/log/Level.hpp"
#include "uxbeacon/exec/beacon.hpp"
#include "uxbeacon/exec/BeaconConfig.hpp"
#include "uxbeacon/exec/cli.hpp"
#include "uxbeacon/exec/ConfigParser.hpp"
#include "uxbeacon/exec/exceptions.hpp"

#include "radio_mock.hpp"

using namespace Catch::Matchers;
using namespace uxbeacon::beacon;
using namespace uxbeacon::exec;
using namespace uxbeacon::log;
using namespace std::chrono_literals;
using asio::ip::make_address_v4;

// NOLINTBEGIN(cert-err58-cpp,misc-use-anonymous-namespace)

TEST_CASE("Parse full configuration", "[exec][config]") {
    const auto config = ConfigParser::getConfig(R"(
        [beacon]
        name = "Kitchen"
        port_file = "/run/uxplay/port"
        level = "warning"

        [address]
        route_host = "1.1.1.1"
        route_port = 53
        route_timeout = 200

        [radio]
        backend = "relay"
        adapter = "hci1"

        [relay]
        address = "192.168.1.255"
        port = 7200
        interval = 2000
    )");

    REQUIRE(config.name == "Kitchen");
    REQUIRE(config.port_file == "/run/uxplay/port");
    REQUIRE(config.level == Level::WARNING);
    REQUIRE(config.route_host == "1.1.1.1");
    REQUIRE(config.route_port == 53);
    REQUIRE(config.route_timeout == 200ms);
    REQUIRE(config.radio == RadioBackend::RELAY);
    REQUIRE(config.adapter == "hci1");
    REQUIRE(config.relay_address == "192.168.1.255");
    REQUIRE(config.relay_port == 7200);
    REQUIRE(config.relay_interval == 2000ms);
}

TEST_CASE("Parse partial configuration", "[exec][config]") {
    const auto config = ConfigParser::getConfig("[beacon]\nname = \"Office\"\n");

    REQUIRE(config.name == "Office");
    REQUIRE_FALSE(config.port_file.has_value());
    REQUIRE_FALSE(config.relay_port.has_value());
}

TEST_CASE("Resolve environment variables in configuration", "[exec][config]") {
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    ::setenv("UXBEACON_TEST_HOME", "/home/mirror", 1);

    const auto config = ConfigParser::getConfig("[beacon]\nport_file = \"${UXBEACON_TEST_HOME}/.uxplay.ble\"\n");
    REQUIRE(config.port_file == "/home/mirror/.uxplay.ble");

    REQUIRE_THROWS_AS(ConfigParser::getConfig("[beacon]\nname = \"$UXBEACON_UNDEFINED_VAR\"\n"), ConfigValueError);
}

TEST_CASE("Ignore unknown keys", "[exec][config]") {
    const auto config = ConfigParser::getConfig("[beacon]\nname = \"Office\"\ncolor = \"blue\"\n[extra]\nkey = 1\n");
    REQUIRE(config.name == "Office");
}

TEST_CASE("Invalid TOML", "[exec][config]") {
    REQUIRE_THROWS_AS(ConfigParser::getConfig("[beacon\nname = "), ConfigFileParseError);
}

TEST_CASE("Invalid value types", "[exec][config]") {
    REQUIRE_THROWS_MATCHES(ConfigParser::getConfig("[relay]\nport = \"7200\"\n"),
                           ConfigFileTypeError,
                           Message("Invalid value type for key relay.port: expected integer"));
    REQUIRE_THROWS_AS(ConfigParser::getConfig("[beacon]\nname = 42\n"), ConfigFileTypeError);
    REQUIRE_THROWS_AS(ConfigParser::getConfig("beacon = 1\n"), ConfigFileTypeError);
}

TEST_CASE("Invalid values", "[exec][config]") {
    REQUIRE_THROWS_AS(ConfigParser::getConfig("[relay]\nport = 0\n"), ConfigValueError);
    REQUIRE_THROWS_AS(ConfigParser::getConfig("[relay]\nport = 65536\n"), ConfigValueError);
    REQUIRE_THROWS_AS(ConfigParser::getConfig("[address]\nroute_timeout = -5\n"), ConfigValueError);
    REQUIRE_THROWS_AS(ConfigParser::getConfig("[beacon]\nlevel = \"LOUD\"\n"), ConfigValueError);
    REQUIRE_THROWS_AS(ConfigParser::getConfig("[radio]\nbackend = \"laser\"\n"), ConfigValueError);
    REQUIRE_THROWS_WITH(ConfigParser::getConfig("[radio]\nbackend = \"laser\"\n"),
                        StartsWith("Invalid value for key radio.backend: `laser` is not a valid radio backend"));
}

TEST_CASE("Read configuration from file", "[exec][config]") {
    const TemporaryFile file {"config.toml", "[beacon]\nname = \"File\"\n"};
    const auto config = ConfigParser::getConfigFromFile(file.path());
    REQUIRE(config.name == "File");
}

TEST_CASE("Missing configuration file", "[exec][config]") {
    const TemporaryFile file {"config_missing.toml"};
    REQUIRE_THROWS_AS(ConfigParser::getConfigFromFile(file.path()), ConfigFileNotFoundError);
}

TEST_CASE("Resolve configuration with defaults", "[exec][config]") {
    const auto settings = BeaconConfig().resolve();

    REQUIRE(settings.name == "UxPlay");
    REQUIRE(settings.port_file.filename() == ".uxplay.ble");
    REQUIRE(settings.level == Level::INFO);
    REQUIRE(settings.route_address == make_address_v4("8.8.8.8"));
    REQUIRE(settings.route_port == 80);
    REQUIRE(settings.route_timeout == 1s);
    REQUIRE(settings.radio == RadioBackend::BLUEZ);
    REQUIRE(settings.adapter == "hci0");
    REQUIRE(settings.relay_address == asio::ip::address_v4::broadcast());
    REQUIRE(settings.relay_port == uxbeacon::beacon::RELAY_PORT);
    REQUIRE(settings.relay_interval == 1s);
}

TEST_CASE("Resolve configuration with invalid address", "[exec][config]") {
    BeaconConfig config {};
    config.relay_address = "relay.local";
    REQUIRE_THROWS_AS(config.resolve(), ConfigValueError);
}

TEST_CASE("Command line takes precedence over configuration file", "[exec][config]") {
    const TemporaryFile file {"config_precedence.toml", "[beacon]\nname = \"File\"\nlevel = \"TRACE\"\n"
                                                        "[radio]\nbackend = \"relay\"\nadapter = \"hci1\"\n"
                                                        "[relay]\nport = 7300\n"};

    auto parser = BeaconParser("uxbeacon");
    parser.setup();
    const auto config_path = file.path().string();
    std::vector<const char*> args {"uxbeacon", "-c", config_path.c_str(), "-n", "Cli", "--adapter", "hci2"};
    const auto settings = load_settings(parser.parse(args));

    REQUIRE(settings.name == "Cli");
    REQUIRE(settings.level == Level::TRACE);
    REQUIRE(settings.relay_port == 7300);
    REQUIRE(settings.radio == RadioBackend::RELAY);
    REQUIRE(settings.adapter == "hci2");
    REQUIRE(settings.route_port == uxbeacon::beacon::DEFAULT_ROUTE_PORT);
}

TEST_CASE("Beacon exits with failure on missing port file", "[exec]") {
    const TemporaryFile port_file {"main_missing_port"};
    const auto port_file_path = port_file.path().string();
    std::vector<const char*> args {"uxbeacon", "-l", "OFF", "-f", port_file_path.c_str(), "--radio", "relay",
                                   "--relay-address", "127.0.0.1", "--route-host", "127.0.0.1", "--route-timeout",
                                   "100"};
    REQUIRE(beacon_main(args, "uxbeacon") == 1);
}

TEST_CASE("Beacon exits with failure on invalid arguments", "[exec]") {
    std::vector<const char*> args {"uxbeacon", "--relay-port", "0"};
    REQUIRE(beacon_main(args, "uxbeacon") == 1);
}

TEST_CASE("Beacon exits with failure on missing configuration file", "[exec]") {
    const TemporaryFile config_file {"main_missing_config.toml"};
    const auto config_file_path = config_file.path().string();
    std::vector<const char*> args {"uxbeacon", "-c", config_file_path.c_str()};
    REQUIRE(beacon_main(args, "uxbeacon") == 1);
}

// NOLINTEND(cert-err58-cpp,misc-use-anonymous-namespace)
