#include "govee/lan/DiscoveryListener.h"

#include <exception>
#include <string>
#include <utility>

namespace govee::lan {

DiscoveryListener::DiscoveryListener(boost::asio::io_context& ctx,
                                     DeviceRegistry& registry,
                                     const ModelCatalog& catalog,
                                     const StatusCorrelator& correlator,
                                     std::shared_ptr<spdlog::logger> logger)
    : registry_(registry),
      catalog_(catalog),
      correlator_(correlator),
      logger_(std::move(logger)),
      receiver_(ctx, logger_) {}

bool DiscoveryListener::start(const Endpoint& listenEndpoint,
                              const boost::asio::ip::address_v4& group,
                              const boost::asio::ip::address_v4& interfaceAddress) {
    return receiver_.start(listenEndpoint, group, interfaceAddress,
                           [this](std::string_view datagram, const Endpoint& sender) {
                               handleDatagram(datagram, sender);
                           });
}

void DiscoveryListener::stop() {
    receiver_.stop();
}

void DiscoveryListener::handleDatagram(std::string_view datagram, const Endpoint& sender) {
    try {
        Envelope envelope = parseEnvelope(datagram);
        if (envelope.cmd == command::kScan) {
            handleScanReply(envelope, datagram, sender);
        } else if (envelope.cmd == command::kDeviceStatus) {
            handleStatusReply(std::move(envelope), sender);
        }
    } catch (const std::exception& ex) {
        logger_->info("[LAN] could not parse message {}: {}", datagram, ex.what());
    }
}

void DiscoveryListener::handleScanReply(const Envelope& envelope,
                                        std::string_view datagram,
                                        const Endpoint& sender) {
    DeviceRecord record = parseScanReply(envelope.data());
    const std::string deviceId = record.deviceId;
    const std::string sku = record.sku;

    if (!registry_.add(std::move(record))) {
        return;
    }

    logger_->info("[LAN] added new device: {} : {}:{}",
                  datagram,
                  sender.address().to_string(),
                  sender.port());

    if (!catalog_.contains(sku)) {
        logger_->warn("[{}] [LAN] model may not support LAN control [{}].", deviceId, sku);
    }
}

void DiscoveryListener::handleStatusReply(Envelope envelope, const Endpoint& sender) {
    correlator_.correlate(sender.address().to_string(), std::move(envelope.msg));
}

}  // namespace govee::lan
