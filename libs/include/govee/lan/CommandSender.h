#pragma once

#include "govee/lan/DeviceRegistry.h"
#include "govee/lan/UdpTransport.h"

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace govee::lan {

// The host-side accessory a command originates from. Only used for lookup
// and diagnostics.
struct AccessoryContext {
    std::string displayName;
    std::string deviceId;
    bool enableDebugLogging{false};
};

enum class SendStatus {
    Sent,
    DeviceNotFound,
    TransportError,
};

const char* toString(SendStatus status) noexcept;

// Outcome of one unicast send. `Sent` only means the local stack accepted
// the datagram; UDP says nothing about the device receiving it.
struct SendOutcome {
    SendStatus status{SendStatus::Sent};
    std::string error;
    DeviceRecord device;

    bool ok() const noexcept { return status == SendStatus::Sent; }
};

class CommandSender {
public:
    using SendHandler = std::function<void(const SendOutcome&)>;

    CommandSender(DeviceRegistry& registry,
                  DatagramSender& sender,
                  std::uint16_t devicePort,
                  std::shared_ptr<spdlog::logger> logger);

    CommandSender(const CommandSender&) = delete;
    CommandSender& operator=(const CommandSender&) = delete;

    // Completions still queued on the io_context become no-ops.
    ~CommandSender();

    // Resolves the accessory's device id in the registry. An unknown id
    // completes with DeviceNotFound before returning, without any traffic.
    void sendControl(const AccessoryContext& accessory,
                     const nlohmann::json& params,
                     SendHandler handler);

    void sendControl(const DeviceRecord& device,
                     const nlohmann::json& params,
                     SendHandler handler);

    void sendStatusRequest(const DeviceRecord& device, SendHandler handler);

    // Post-send hook for failed unicasts: the device is treated as gone.
    void evictUnreachable(const DeviceRecord& device, const std::string& reason);

private:
    void transmit(const DeviceRecord& device, std::string payload, SendHandler handler);

    DeviceRegistry& registry_;
    DatagramSender& sender_;
    std::uint16_t devicePort_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<bool> alive_;
};

}  // namespace govee::lan
