#include "govee/lan/LanClient.h"

#include <boost/asio/ip/address_v4.hpp>

#include <utility>

namespace govee::lan {

namespace {

LanConfig validated(LanConfig config) {
    validateConfig(config);
    return config;
}

Endpoint groupEndpoint(const LanConfig& config) {
    return Endpoint(boost::asio::ip::make_address_v4(config.multicastAddress), config.scanPort);
}

}  // namespace

LanClient::LanClient(boost::asio::io_context& ctx,
                     LanConfig config,
                     std::shared_ptr<spdlog::logger> logger)
    : LanClient(ctx, std::move(config), logger, std::make_unique<UdpSender>(ctx, logger), nullptr) {}

LanClient::LanClient(boost::asio::io_context& ctx,
                     LanConfig config,
                     std::shared_ptr<spdlog::logger> logger,
                     DatagramSender& sender)
    : LanClient(ctx, std::move(config), std::move(logger), nullptr, &sender) {}

LanClient::LanClient(boost::asio::io_context& ctx,
                     LanConfig config,
                     std::shared_ptr<spdlog::logger> logger,
                     std::unique_ptr<UdpSender> ownedSender,
                     DatagramSender* externalSender)
    : ioContext_(ctx),
      config_(validated(std::move(config))),
      logger_(std::move(logger)),
      ownedSender_(std::move(ownedSender)),
      sender_(externalSender != nullptr ? *externalSender : *ownedSender_),
      registry_(),
      catalog_(buildCatalog(config_)),
      correlator_(registry_, logger_),
      listener_(ctx, registry_, catalog_, correlator_, logger_),
      broadcaster_(sender_, groupEndpoint(config_), logger_),
      scheduler_(ctx, broadcaster_, config_.scanPeriod),
      commandSender_(registry_, sender_, config_.devicePort, logger_),
      alive_(std::make_shared<bool>(true)) {}

LanClient::~LanClient() {
    stop();
    *alive_ = false;
}

bool LanClient::start() {
    if (started_) {
        return listener_.listening();
    }
    started_ = true;
    stopped_ = false;

    const auto listenAddress = boost::asio::ip::make_address_v4(config_.listenAddress);
    const auto group = boost::asio::ip::make_address_v4(config_.multicastAddress);
    const bool listening = listener_.start(Endpoint(listenAddress, config_.receiverPort), group, listenAddress);

    scheduler_.start();
    logger_->debug("[LAN] scanning {}:{} every {} ms",
                   config_.multicastAddress,
                   config_.scanPort,
                   config_.scanPeriod.count());
    return listening;
}

void LanClient::stop() {
    stopped_ = true;
    if (!started_ && pendingRefreshes_.empty()) {
        return;
    }
    started_ = false;
    scheduler_.stop();
    listener_.stop();
    for (const auto& timer : pendingRefreshes_) {
        timer->cancel();
    }
    pendingRefreshes_.clear();
}

void LanClient::setDeviceUpdateHandler(DeviceUpdateHandler handler) {
    correlator_.setDeviceUpdateHandler(std::move(handler));
}

void LanClient::updateDevice(const AccessoryContext& accessory,
                             const nlohmann::json& params,
                             SendHandler handler) {
    commandSender_.sendControl(accessory, params,
                               [this, alive = alive_, handler = std::move(handler)](const SendOutcome& outcome) {
                                   if (!*alive) {
                                       return;
                                   }
                                   if (outcome.ok() && !stopped_) {
                                       scheduleStatusRefresh(outcome.device);
                                   }
                                   if (handler) {
                                       handler(outcome);
                                   }
                               });
}

void LanClient::requestStatus(const std::string& deviceId, SendHandler handler) {
    auto device = registry_.findById(deviceId);
    if (!device) {
        if (handler) {
            SendOutcome outcome;
            outcome.status = SendStatus::DeviceNotFound;
            outcome.error = "device not found: " + deviceId;
            handler(outcome);
        }
        return;
    }
    commandSender_.sendStatusRequest(*device, std::move(handler));
}

void LanClient::handleDatagram(std::string_view datagram, const Endpoint& sender) {
    listener_.handleDatagram(datagram, sender);
}

void LanClient::scheduleStatusRefresh(const DeviceRecord& device) {
    if (stopped_) {
        return;
    }
    auto timer = std::make_shared<boost::asio::steady_timer>(ioContext_, config_.statusDelay);
    pendingRefreshes_.insert(timer);
    timer->async_wait([this, alive = alive_, timer, device](const boost::system::error_code& ec) {
        if (ec || !*alive) {
            return;
        }
        pendingRefreshes_.erase(timer);
        commandSender_.sendStatusRequest(device, [logger = logger_, deviceId = device.deviceId](const SendOutcome& outcome) {
            if (!outcome.ok()) {
                logger->info("[LAN] status request to [{}] failed: {}", deviceId, outcome.error);
            }
        });
    });
}

}  // namespace govee::lan
