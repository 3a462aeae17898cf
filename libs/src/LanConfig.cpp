#include "govee/lan/LanConfig.h"

#include <boost/asio/ip/address_v4.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <utility>

namespace govee::lan {

namespace {

template <typename T>
T scalarOrThrow(const YAML::Node& node, const std::string& field) {
    if (!node.IsScalar()) {
        throw std::runtime_error("Field '" + field + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Field '" + field + "' has an invalid value: " + ex.what());
    }
}

std::uint16_t portOrThrow(const YAML::Node& node, const std::string& field) {
    const auto value = scalarOrThrow<long long>(node, field);
    if (value <= 0 || value > 65535) {
        throw std::runtime_error("Field '" + field + "' must be a port in 1..65535");
    }
    return static_cast<std::uint16_t>(value);
}

std::chrono::milliseconds durationOrThrow(const YAML::Node& node, const std::string& field) {
    const auto value = scalarOrThrow<long long>(node, field);
    if (value <= 0) {
        throw std::runtime_error("Field '" + field + "' must be a positive number of milliseconds");
    }
    return std::chrono::milliseconds(value);
}

std::vector<std::string> stringListOrThrow(const YAML::Node& node, const std::string& field) {
    if (!node.IsSequence()) {
        throw std::runtime_error("Field '" + field + "' must be a sequence of strings");
    }
    std::vector<std::string> values;
    values.reserve(node.size());
    for (const auto& element : node) {
        values.push_back(scalarOrThrow<std::string>(element, field + "[]"));
    }
    return values;
}

void requireIpv4(const std::string& value, const std::string& field) {
    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(value, ec);
    if (ec) {
        throw std::runtime_error("Field '" + field + "' is not an IPv4 address: " + value);
    }
}

}  // namespace

LanConfig loadConfig(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Failed to load config " + path.string() + ": " + ex.what());
    }

    LanConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config root must be a mapping: " + path.string());
    }

    auto lan = root["lan"];
    if (!lan) {
        return config;
    }
    if (!lan.IsMap()) {
        throw std::runtime_error("Field 'lan' must be a mapping");
    }

    if (lan["multicast_address"]) {
        config.multicastAddress = scalarOrThrow<std::string>(lan["multicast_address"], "lan.multicast_address");
    }
    if (lan["listen_address"]) {
        config.listenAddress = scalarOrThrow<std::string>(lan["listen_address"], "lan.listen_address");
    }
    if (lan["scan_port"]) {
        config.scanPort = portOrThrow(lan["scan_port"], "lan.scan_port");
    }
    if (lan["receiver_port"]) {
        config.receiverPort = portOrThrow(lan["receiver_port"], "lan.receiver_port");
    }
    if (lan["device_port"]) {
        config.devicePort = portOrThrow(lan["device_port"], "lan.device_port");
    }
    if (lan["scan_period_ms"]) {
        config.scanPeriod = durationOrThrow(lan["scan_period_ms"], "lan.scan_period_ms");
    }
    if (lan["status_delay_ms"]) {
        config.statusDelay = durationOrThrow(lan["status_delay_ms"], "lan.status_delay_ms");
    }
    if (lan["lan_models"]) {
        config.lanModels = stringListOrThrow(lan["lan_models"], "lan.lan_models");
    }
    if (lan["lan_models_extra"]) {
        config.lanModelsExtra = stringListOrThrow(lan["lan_models_extra"], "lan.lan_models_extra");
    }
    if (lan["log_level"]) {
        config.logLevel = parseLogLevel(scalarOrThrow<std::string>(lan["log_level"], "lan.log_level"));
    }

    validateConfig(config);
    return config;
}

void validateConfig(const LanConfig& config) {
    requireIpv4(config.multicastAddress, "lan.multicast_address");
    requireIpv4(config.listenAddress, "lan.listen_address");
    if (!boost::asio::ip::make_address_v4(config.multicastAddress).is_multicast()) {
        throw std::runtime_error("Field 'lan.multicast_address' must be a multicast group: " +
                                 config.multicastAddress);
    }
    if (config.scanPeriod.count() <= 0) {
        throw std::runtime_error("Field 'lan.scan_period_ms' must be positive");
    }
    if (config.statusDelay.count() <= 0) {
        throw std::runtime_error("Field 'lan.status_delay_ms' must be positive");
    }
}

ModelCatalog buildCatalog(const LanConfig& config) {
    ModelCatalog catalog = config.lanModels ? ModelCatalog(*config.lanModels) : ModelCatalog();
    for (const auto& sku : config.lanModelsExtra) {
        catalog.add(sku);
    }
    return catalog;
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw std::runtime_error("Unknown log level: " + name);
    }
    return level;
}

}  // namespace govee::lan
