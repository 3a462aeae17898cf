#include "govee/lan/CommandSender.h"

#include "govee/lan/Protocol.h"

#include <boost/asio/ip/address.hpp>

#include <utility>

namespace govee::lan {

const char* toString(SendStatus status) noexcept {
    switch (status) {
    case SendStatus::Sent:
        return "sent";
    case SendStatus::DeviceNotFound:
        return "device not found";
    case SendStatus::TransportError:
        return "transport error";
    }
    return "unknown";
}

CommandSender::CommandSender(DeviceRegistry& registry,
                             DatagramSender& sender,
                             std::uint16_t devicePort,
                             std::shared_ptr<spdlog::logger> logger)
    : registry_(registry),
      sender_(sender),
      devicePort_(devicePort),
      logger_(std::move(logger)),
      alive_(std::make_shared<bool>(true)) {}

CommandSender::~CommandSender() {
    *alive_ = false;
}

void CommandSender::sendControl(const AccessoryContext& accessory,
                                const nlohmann::json& params,
                                SendHandler handler) {
    const std::string payload = wrapCommand(params);
    if (accessory.enableDebugLogging) {
        logger_->info("[{}] [LAN] starting update with params [{}].", accessory.displayName, payload);
    }

    auto device = registry_.findById(accessory.deviceId);
    if (!device) {
        logger_->info("[{}] [LAN] device not found with id [{}].", accessory.displayName, accessory.deviceId);
        if (handler) {
            SendOutcome outcome;
            outcome.status = SendStatus::DeviceNotFound;
            outcome.error = "device not found: " + accessory.deviceId;
            handler(outcome);
        }
        return;
    }

    transmit(*device, payload,
             [this, displayName = accessory.displayName, handler = std::move(handler)](const SendOutcome& outcome) {
                 if (outcome.ok()) {
                     logger_->info("[{}] [LAN] command sent to [{}] [{}].",
                                   displayName,
                                   outcome.device.deviceId,
                                   outcome.device.ip);
                 } else {
                     logger_->info("[{}] [LAN] Failed to send command: {}", displayName, outcome.error);
                 }
                 if (handler) {
                     handler(outcome);
                 }
             });
}

void CommandSender::sendControl(const DeviceRecord& device,
                                const nlohmann::json& params,
                                SendHandler handler) {
    transmit(device, wrapCommand(params), std::move(handler));
}

void CommandSender::sendStatusRequest(const DeviceRecord& device, SendHandler handler) {
    transmit(device, makeStatusRequest(), std::move(handler));
}

void CommandSender::evictUnreachable(const DeviceRecord& device, const std::string& reason) {
    if (registry_.remove(device.deviceId)) {
        logger_->info("[LAN] removed device: [{}] [{}] ({}).", device.deviceId, device.sku, reason);
    }
}

void CommandSender::transmit(const DeviceRecord& device, std::string payload, SendHandler handler) {
    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(device.ip, ec);
    if (ec) {
        SendOutcome outcome;
        outcome.status = SendStatus::TransportError;
        outcome.error = "invalid device address '" + device.ip + "': " + ec.message();
        outcome.device = device;
        evictUnreachable(device, outcome.error);
        if (handler) {
            handler(outcome);
        }
        return;
    }

    sender_.sendTo(std::move(payload), Endpoint(address, devicePort_),
                   [this, alive = alive_, device, handler = std::move(handler)](
                       const boost::system::error_code& sendEc) {
                       if (!*alive) {
                           return;
                       }
                       SendOutcome outcome;
                       outcome.device = device;
                       if (sendEc) {
                           outcome.status = SendStatus::TransportError;
                           outcome.error = sendEc.message();
                           evictUnreachable(device, outcome.error);
                       }
                       if (handler) {
                           handler(outcome);
                       }
                   });
}

}  // namespace govee::lan
