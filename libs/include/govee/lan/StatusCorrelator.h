#pragma once

#include "govee/lan/DeviceRegistry.h"

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <functional>
#include <memory>
#include <string>

namespace govee::lan {

// Routes `devStatus` replies to the owner by matching the sender address
// against the registry.
class StatusCorrelator {
public:
    using DeviceUpdateHandler =
        std::function<void(const std::string& deviceId, const nlohmann::json& payload)>;

    StatusCorrelator(const DeviceRegistry& registry, std::shared_ptr<spdlog::logger> logger);

    void setDeviceUpdateHandler(DeviceUpdateHandler handler);

    // Tags `msg` with `source = "LAN"` and hands it to the owner. Returns
    // false when no registered device uses `sourceAddress`.
    bool correlate(const std::string& sourceAddress, nlohmann::json msg) const;

private:
    const DeviceRegistry& registry_;
    std::shared_ptr<spdlog::logger> logger_;
    DeviceUpdateHandler handler_;
};

}  // namespace govee::lan
