#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace govee::lan {

struct DeviceRecord {
    std::string deviceId;
    std::string sku;
    std::string ip;
    // Scan reply `data` object as received, including fields we do not interpret.
    nlohmann::json attributes = nlohmann::json::object();
};

// Known devices keyed by device id. Not thread-safe: owned by the event loop
// that runs the listener and the command sender.
class DeviceRegistry {
public:
    DeviceRegistry() = default;

    // Inserts the record unless its id is already registered. An existing
    // entry is left untouched, even if the new record carries another ip.
    bool add(DeviceRecord record);

    std::optional<DeviceRecord> findById(const std::string& deviceId) const;

    // First registered device whose current ip matches. Devices sharing an
    // address resolve to the earliest registration.
    std::optional<DeviceRecord> findByAddress(const std::string& ip) const;

    bool remove(const std::string& deviceId);

    std::size_t size() const noexcept { return devicesById_.size(); }
    bool empty() const noexcept { return devicesById_.empty(); }

    std::vector<DeviceRecord> snapshot() const;

private:
    std::unordered_map<std::string, DeviceRecord> devicesById_;
    std::vector<std::string> registrationOrder_;
};

}  // namespace govee::lan
