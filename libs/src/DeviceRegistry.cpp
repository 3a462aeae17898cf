#include "govee/lan/DeviceRegistry.h"

#include <algorithm>
#include <utility>

namespace govee::lan {

bool DeviceRegistry::add(DeviceRecord record) {
    auto id = record.deviceId;
    auto [it, inserted] = devicesById_.try_emplace(id, std::move(record));
    if (!inserted) {
        return false;
    }
    registrationOrder_.push_back(std::move(id));
    return true;
}

std::optional<DeviceRecord> DeviceRegistry::findById(const std::string& deviceId) const {
    auto it = devicesById_.find(deviceId);
    if (it == devicesById_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<DeviceRecord> DeviceRegistry::findByAddress(const std::string& ip) const {
    for (const auto& id : registrationOrder_) {
        const auto& record = devicesById_.at(id);
        if (record.ip == ip) {
            return record;
        }
    }
    return std::nullopt;
}

bool DeviceRegistry::remove(const std::string& deviceId) {
    if (devicesById_.erase(deviceId) == 0) {
        return false;
    }
    registrationOrder_.erase(
        std::remove(registrationOrder_.begin(), registrationOrder_.end(), deviceId),
        registrationOrder_.end());
    return true;
}

std::vector<DeviceRecord> DeviceRegistry::snapshot() const {
    std::vector<DeviceRecord> out;
    out.reserve(registrationOrder_.size());
    for (const auto& id : registrationOrder_) {
        out.push_back(devicesById_.at(id));
    }
    return out;
}

}  // namespace govee::lan
