#pragma once

#include "govee/lan/ModelCatalog.h"

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace govee::lan {

struct LanConfig {
    std::string multicastAddress{"239.255.255.250"};
    std::string listenAddress{"0.0.0.0"};
    std::uint16_t scanPort{4001};
    std::uint16_t receiverPort{4002};
    std::uint16_t devicePort{4003};
    std::chrono::milliseconds scanPeriod{5000};
    std::chrono::milliseconds statusDelay{50};
    // Replaces the built-in catalog when set.
    std::optional<std::vector<std::string>> lanModels;
    std::vector<std::string> lanModelsExtra;
    spdlog::level::level_enum logLevel{spdlog::level::info};
};

// Reads the optional `lan:` section of a YAML file. Missing keys keep their
// defaults. Throws std::runtime_error naming the offending field.
LanConfig loadConfig(const std::filesystem::path& path);

// Throws std::runtime_error on unusable addresses or timings.
void validateConfig(const LanConfig& config);

ModelCatalog buildCatalog(const LanConfig& config);

spdlog::level::level_enum parseLogLevel(const std::string& name);

}  // namespace govee::lan
