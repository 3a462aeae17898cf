#pragma once

#include "govee/lan/UdpTransport.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <memory>

namespace govee::lan {

// Emits `scan` requests to the multicast group. Devices with LAN control
// enabled answer on the receiver port.
class ScanBroadcaster {
public:
    ScanBroadcaster(DatagramSender& sender,
                    Endpoint groupEndpoint,
                    std::shared_ptr<spdlog::logger> logger);

    void broadcast();

    std::uint64_t scansSent() const noexcept { return scansSent_; }

private:
    DatagramSender& sender_;
    Endpoint groupEndpoint_;
    std::shared_ptr<spdlog::logger> logger_;
    std::uint64_t scansSent_{0};
};

// One scan on start(), then one per period until stop().
class ScanScheduler {
public:
    ScanScheduler(boost::asio::io_context& ctx,
                  ScanBroadcaster& broadcaster,
                  std::chrono::milliseconds period);

    ScanScheduler(const ScanScheduler&) = delete;
    ScanScheduler& operator=(const ScanScheduler&) = delete;

    ~ScanScheduler();

    void start();
    void stop();

    bool running() const noexcept { return running_; }

private:
    void scheduleNext();

    ScanBroadcaster& broadcaster_;
    std::chrono::milliseconds period_;
    boost::asio::steady_timer timer_;
    bool running_{false};
    // Bumped by start() so a tick queued before a stop/start cycle is dropped.
    std::uint64_t generation_{0};
};

}  // namespace govee::lan
