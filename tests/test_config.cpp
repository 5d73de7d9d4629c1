#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include "config.h"

TEST_CASE("Config loads defaults", "[config]") {
    Config config;
    config.loadDefaults();

    REQUIRE(config.device.config_tool == "hdhomerun_config");
    REQUIRE(config.device.status_timeout_ms == 750);
    REQUIRE(config.device.command_timeout_ms == 5000);
    REQUIRE(config.device.scan_timeout_ms == 60000);
    REQUIRE(config.discovery.auto_discovery == true);
    REQUIRE(config.discovery.manual_hosts.empty());
    REQUIRE(config.discovery.cache_ttl_seconds == 300);
    REQUIRE(config.monitor.poll_interval_ms == 1000);
    REQUIRE(config.monitor.program_retries == 3);
    REQUIRE(config.debug.log_level == 1);
}

TEST_CASE("Config parses device section", "[config]") {
    Config config;
    config.loadDefaults();

    std::ofstream file("test_config.ini");
    file << "[device]\n";
    file << "config_tool = /opt/hdhomerun/hdhomerun_config  # vendor build\n";
    file << "command_timeout_ms = 3000\n";
    file << "status_timeout_ms = 500\n";
    file.close();

    bool result = config.loadFromFile("test_config.ini");
    REQUIRE(result == true);
    REQUIRE(config.device.config_tool == "/opt/hdhomerun/hdhomerun_config");
    REQUIRE(config.device.command_timeout_ms == 3000);
    REQUIRE(config.device.status_timeout_ms == 500);

    std::remove("test_config.ini");
}

TEST_CASE("Config comments do not cut semicolon host lists", "[config]") {
    Config config;
    config.loadDefaults();

    std::ofstream file("test_config_comments.ini");
    file << "; leading comment\n";
    file << "[discovery]\n";
    file << "  ; indented comment\n";
    file << "manual_hosts = 10.0.0.7;hdhr.lan;10.0.0.9 # office rack\n";
    file.close();

    REQUIRE(config.loadFromFile("test_config_comments.ini"));
    REQUIRE(config.discovery.manual_hosts.size() == 3);
    REQUIRE(config.discovery.manual_hosts[0] == "10.0.0.7");
    REQUIRE(config.discovery.manual_hosts[1] == "hdhr.lan");
    REQUIRE(config.discovery.manual_hosts[2] == "10.0.0.9");

    std::remove("test_config_comments.ini");
}

TEST_CASE("Config parses discovery section", "[config]") {
    Config config;
    config.loadDefaults();

    std::ofstream file("test_config.ini");
    file << "[Discovery]\n";
    file << "auto_discovery = no\n";
    file << "manual_hosts = 192.168.1.50, 10.0.0.7;hdhr.lan\n";
    file << "cache_ttl_seconds = 60\n";
    file.close();

    bool result = config.loadFromFile("test_config.ini");
    REQUIRE(result == true);
    REQUIRE(config.discovery.auto_discovery == false);
    REQUIRE(config.discovery.manual_hosts.size() == 3);
    REQUIRE(config.discovery.manual_hosts[0] == "192.168.1.50");
    REQUIRE(config.discovery.manual_hosts[1] == "10.0.0.7");
    REQUIRE(config.discovery.manual_hosts[2] == "hdhr.lan");
    REQUIRE(config.discovery.cache_ttl_seconds == 60);

    std::remove("test_config.ini");
}

TEST_CASE("Config handles invalid values gracefully", "[config]") {
    Config config;
    config.loadDefaults();

    std::ofstream file("test_config.ini");
    file << "[device]\n";
    file << "status_timeout_ms = 1500\n";
    file << "scan_timeout_ms = soon\n";
    file << "[discovery]\n";
    file << "cloud_url = http://api.hdhomerun.com/discover\n";
    file << "[monitor]\n";
    file << "poll_interval_ms = 10\n";
    file << "program_retries = 50\n";
    file << "[debug]\n";
    file << "log_level = 9\n";
    file << "this line has no equals sign\n";
    file.close();

    bool result = config.loadFromFile("test_config.ini");
    REQUIRE(result == true);
    REQUIRE(config.device.status_timeout_ms == 750);
    REQUIRE(config.device.scan_timeout_ms == 60000);
    REQUIRE(config.discovery.cloud_url == "https://api.hdhomerun.com/discover");
    REQUIRE(config.monitor.poll_interval_ms == 1000);
    REQUIRE(config.monitor.program_retries == 10);
    REQUIRE(config.debug.log_level == 2);

    std::remove("test_config.ini");
}

TEST_CASE("Config ignores unknown sections", "[config]") {
    Config config;
    config.loadDefaults();

    std::ofstream file("test_config.ini");
    file << "[unknown_section]\n";
    file << "foo = bar\n";
    file.close();

    bool result = config.loadFromFile("test_config.ini");
    REQUIRE(result == true);
    REQUIRE(config.device.config_tool == "hdhomerun_config");

    std::remove("test_config.ini");
}

TEST_CASE("Config reports a missing file", "[config]") {
    Config config;
    config.loadDefaults();
    REQUIRE(config.loadFromFile("does_not_exist.ini") == false);
}

TEST_CASE("Host lists split on commas, semicolons and spaces", "[config]") {
    const std::vector<std::string> hosts = splitHostList(" 192.168.1.50,,10.0.0.7 ; hdhr.lan ");
    REQUIRE(hosts.size() == 3);
    REQUIRE(hosts[0] == "192.168.1.50");
    REQUIRE(hosts[1] == "10.0.0.7");
    REQUIRE(hosts[2] == "hdhr.lan");
    REQUIRE(splitHostList("").empty());
}
