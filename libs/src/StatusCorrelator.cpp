#include "govee/lan/StatusCorrelator.h"

#include "govee/lan/Protocol.h"

#include <utility>

namespace govee::lan {

StatusCorrelator::StatusCorrelator(const DeviceRegistry& registry, std::shared_ptr<spdlog::logger> logger)
    : registry_(registry), logger_(std::move(logger)) {}

void StatusCorrelator::setDeviceUpdateHandler(DeviceUpdateHandler handler) {
    handler_ = std::move(handler);
}

bool StatusCorrelator::correlate(const std::string& sourceAddress, nlohmann::json msg) const {
    auto device = registry_.findByAddress(sourceAddress);
    if (!device) {
        logger_->debug("[LAN] status from unregistered address {} dropped", sourceAddress);
        return false;
    }

    msg["source"] = kLanSource;
    if (handler_) {
        handler_(device->deviceId, msg);
    }
    return true;
}

}  // namespace govee::lan
