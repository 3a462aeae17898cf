#include "govee/lan/LanConfig.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path writeConfig(const std::string& content) {
    static std::size_t counter = 0;
    const auto suffix = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count() + counter++);
    const auto tempPath = std::filesystem::temp_directory_path()
                          / ("govee-lan-" + suffix + ".yaml");
    std::ofstream output(tempPath);
    REQUIRE(output.good());
    output << content;
    output.close();
    return tempPath;
}

govee::lan::LanConfig loadFrom(const std::string& content) {
    const auto path = writeConfig(content);
    try {
        auto config = govee::lan::loadConfig(path);
        std::filesystem::remove(path);
        return config;
    } catch (...) {
        std::filesystem::remove(path);
        throw;
    }
}

}  // namespace

TEST_CASE("LanConfig defaults match the Govee LAN protocol", "[config]") {
    const govee::lan::LanConfig config;
    CHECK(config.multicastAddress == "239.255.255.250");
    CHECK(config.scanPort == 4001);
    CHECK(config.receiverPort == 4002);
    CHECK(config.devicePort == 4003);
    CHECK(config.scanPeriod == std::chrono::milliseconds(5000));
    CHECK(config.statusDelay == std::chrono::milliseconds(50));
    REQUIRE_NOTHROW(govee::lan::validateConfig(config));
}

TEST_CASE("loadConfig reads the lan section", "[config]") {
    const auto config = loadFrom(R"(
lan:
  listen_address: 192.168.1.2
  receiver_port: 14002
  scan_period_ms: 2500
  status_delay_ms: 120
  lan_models_extra: [H7099]
  log_level: debug
)");

    CHECK(config.listenAddress == "192.168.1.2");
    CHECK(config.receiverPort == 14002);
    CHECK(config.scanPort == 4001);
    CHECK(config.scanPeriod == std::chrono::milliseconds(2500));
    CHECK(config.statusDelay == std::chrono::milliseconds(120));
    CHECK(config.logLevel == spdlog::level::debug);

    const auto catalog = govee::lan::buildCatalog(config);
    CHECK(catalog.contains("H7099"));
    CHECK(catalog.contains("H6072"));
}

TEST_CASE("loadConfig without a lan section keeps defaults", "[config]") {
    const auto config = loadFrom("other:\n  key: value\n");
    CHECK(config.receiverPort == 4002);
    CHECK_FALSE(config.lanModels.has_value());
}

TEST_CASE("lan_models replaces the built-in catalog", "[config]") {
    const auto config = loadFrom("lan:\n  lan_models: [H0001, H0002]\n");
    const auto catalog = govee::lan::buildCatalog(config);
    CHECK(catalog.size() == 2);
    CHECK(catalog.contains("H0001"));
    CHECK_FALSE(catalog.contains("H6072"));
}

TEST_CASE("loadConfig rejects invalid values", "[config]") {
    CHECK_THROWS_AS(loadFrom("lan:\n  scan_port: 70000\n"), std::runtime_error);
    CHECK_THROWS_AS(loadFrom("lan:\n  device_port: 0\n"), std::runtime_error);
    CHECK_THROWS_AS(loadFrom("lan:\n  scan_period_ms: -5\n"), std::runtime_error);
    CHECK_THROWS_AS(loadFrom("lan:\n  receiver_port: [1, 2]\n"), std::runtime_error);
    CHECK_THROWS_AS(loadFrom("lan:\n  multicast_address: 10.0.0.1\n"), std::runtime_error);
    CHECK_THROWS_AS(loadFrom("lan:\n  listen_address: not-an-ip\n"), std::runtime_error);
    CHECK_THROWS_AS(loadFrom("lan:\n  log_level: chatty\n"), std::runtime_error);
    CHECK_THROWS_AS(loadFrom("lan: [1, 2]\n"), std::runtime_error);
}

TEST_CASE("loadConfig reports missing files", "[config]") {
    CHECK_THROWS_AS(govee::lan::loadConfig("/nonexistent/govee-lan.yaml"), std::runtime_error);
}
