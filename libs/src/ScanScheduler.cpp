#include "govee/lan/ScanScheduler.h"

#include "govee/lan/Protocol.h"

#include <utility>

namespace govee::lan {

ScanBroadcaster::ScanBroadcaster(DatagramSender& sender,
                                 Endpoint groupEndpoint,
                                 std::shared_ptr<spdlog::logger> logger)
    : sender_(sender), groupEndpoint_(std::move(groupEndpoint)), logger_(std::move(logger)) {}

void ScanBroadcaster::broadcast() {
    ++scansSent_;
    sender_.sendTo(makeScanRequest(), groupEndpoint_,
                   [logger = logger_](const boost::system::error_code& ec) {
                       if (ec) {
                           logger->warn("[LAN] failed to send scan request: {}", ec.message());
                       }
                   });
}

ScanScheduler::ScanScheduler(boost::asio::io_context& ctx,
                             ScanBroadcaster& broadcaster,
                             std::chrono::milliseconds period)
    : broadcaster_(broadcaster), period_(period), timer_(ctx) {}

ScanScheduler::~ScanScheduler() {
    stop();
}

void ScanScheduler::start() {
    if (running_) {
        return;
    }
    running_ = true;
    ++generation_;
    broadcaster_.broadcast();
    timer_.expires_after(period_);
    scheduleNext();
}

void ScanScheduler::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    timer_.cancel();
}

void ScanScheduler::scheduleNext() {
    timer_.async_wait([this, generation = generation_](const boost::system::error_code& ec) {
        if (ec || !running_ || generation != generation_) {
            return;
        }
        broadcaster_.broadcast();
        if (!running_) {
            return;
        }
        // Anchor on the previous deadline so the period does not drift.
        timer_.expires_at(timer_.expiry() + period_);
        scheduleNext();
    });
}

}  // namespace govee::lan
