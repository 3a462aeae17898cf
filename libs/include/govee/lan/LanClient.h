#pragma once

#include "govee/lan/CommandSender.h"
#include "govee/lan/DeviceRegistry.h"
#include "govee/lan/DiscoveryListener.h"
#include "govee/lan/LanConfig.h"
#include "govee/lan/ModelCatalog.h"
#include "govee/lan/ScanScheduler.h"
#include "govee/lan/StatusCorrelator.h"
#include "govee/lan/UdpTransport.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace govee::lan {

// LAN discovery and control for one host. Everything runs on the given
// io_context; the client must be used from the thread running it.
class LanClient {
public:
    using DeviceUpdateHandler = StatusCorrelator::DeviceUpdateHandler;
    using SendHandler = CommandSender::SendHandler;

    LanClient(boost::asio::io_context& ctx,
              LanConfig config,
              std::shared_ptr<spdlog::logger> logger);

    // Uses `sender` for every outbound datagram instead of opening a socket.
    LanClient(boost::asio::io_context& ctx,
              LanConfig config,
              std::shared_ptr<spdlog::logger> logger,
              DatagramSender& sender);

    LanClient(const LanClient&) = delete;
    LanClient& operator=(const LanClient&) = delete;

    ~LanClient();

    // Opens the receiver and starts scanning. Returns false when the
    // receiver could not be set up; scanning starts regardless.
    bool start();
    // Cancels pending status refreshes. Commands whose send completes after
    // stop() do not schedule one.
    void stop();

    void setDeviceUpdateHandler(DeviceUpdateHandler handler);

    // Sends `params` (which carries its own `cmd`/`data`) to the accessory's
    // device, then asks it for its status once the device had time to apply
    // the change.
    void updateDevice(const AccessoryContext& accessory,
                      const nlohmann::json& params,
                      SendHandler handler = nullptr);

    void requestStatus(const std::string& deviceId, SendHandler handler = nullptr);

    // Entry point for datagrams read outside the client's own socket.
    void handleDatagram(std::string_view datagram, const Endpoint& sender);

    const DeviceRegistry& registry() const noexcept { return registry_; }
    std::vector<DeviceRecord> devices() const { return registry_.snapshot(); }
    const LanConfig& config() const noexcept { return config_; }
    bool listening() const noexcept { return listener_.listening(); }
    std::uint64_t scansSent() const noexcept { return broadcaster_.scansSent(); }

private:
    LanClient(boost::asio::io_context& ctx,
              LanConfig config,
              std::shared_ptr<spdlog::logger> logger,
              std::unique_ptr<UdpSender> ownedSender,
              DatagramSender* externalSender);

    void scheduleStatusRefresh(const DeviceRecord& device);

    boost::asio::io_context& ioContext_;
    LanConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<UdpSender> ownedSender_;
    DatagramSender& sender_;
    DeviceRegistry registry_;
    ModelCatalog catalog_;
    StatusCorrelator correlator_;
    DiscoveryListener listener_;
    ScanBroadcaster broadcaster_;
    ScanScheduler scheduler_;
    CommandSender commandSender_;
    std::set<std::shared_ptr<boost::asio::steady_timer>> pendingRefreshes_;
    std::shared_ptr<bool> alive_;
    bool started_{false};
    bool stopped_{false};
};

}  // namespace govee::lan
