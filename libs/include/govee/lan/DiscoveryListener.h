#pragma once

#include "govee/lan/DeviceRegistry.h"
#include "govee/lan/ModelCatalog.h"
#include "govee/lan/Protocol.h"
#include "govee/lan/StatusCorrelator.h"
#include "govee/lan/UdpTransport.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <spdlog/logger.h>

#include <memory>
#include <string_view>

namespace govee::lan {

// Owns the receiver socket. Every datagram arriving on it, scan replies and
// status replies alike, goes through handleDatagram().
class DiscoveryListener {
public:
    DiscoveryListener(boost::asio::io_context& ctx,
                      DeviceRegistry& registry,
                      const ModelCatalog& catalog,
                      const StatusCorrelator& correlator,
                      std::shared_ptr<spdlog::logger> logger);

    bool start(const Endpoint& listenEndpoint,
               const boost::asio::ip::address_v4& group,
               const boost::asio::ip::address_v4& interfaceAddress);
    void stop();

    bool listening() const noexcept { return receiver_.running(); }

    void handleDatagram(std::string_view datagram, const Endpoint& sender);

private:
    void handleScanReply(const Envelope& envelope, std::string_view datagram, const Endpoint& sender);
    void handleStatusReply(Envelope envelope, const Endpoint& sender);

    DeviceRegistry& registry_;
    const ModelCatalog& catalog_;
    const StatusCorrelator& correlator_;
    std::shared_ptr<spdlog::logger> logger_;
    UdpReceiver receiver_;
};

}  // namespace govee::lan
