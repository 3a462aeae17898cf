#include "govee/lan/UdpTransport.h"

#include <boost/asio/error.hpp>
#include <boost/asio/ip/multicast.hpp>

#include <utility>

namespace govee::lan {

namespace {

constexpr int kMulticastHops = 1;

}  // namespace

bool isTransientReceiveError(const boost::system::error_code& ec) noexcept {
    return ec == boost::asio::error::connection_refused
           || ec == boost::asio::error::connection_reset
           || ec == boost::asio::error::message_size
           || ec == boost::asio::error::interrupted;
}

UdpSender::UdpSender(boost::asio::io_context& ctx, std::shared_ptr<spdlog::logger> logger)
    : socket_(ctx), logger_(std::move(logger)) {
    boost::system::error_code ec;
    socket_.open(boost::asio::ip::udp::v4(), ec);
    if (ec) {
        logger_->warn("[LAN] failed to open sender socket: {}", ec.message());
        return;
    }
    socket_.bind(Endpoint(boost::asio::ip::udp::v4(), 0), ec);
    if (ec) {
        logger_->warn("[LAN] failed to bind sender socket: {}", ec.message());
        return;
    }
    socket_.set_option(boost::asio::ip::multicast::hops(kMulticastHops), ec);
    if (ec) {
        logger_->warn("[LAN] failed to set multicast hops: {}", ec.message());
    }
}

void UdpSender::sendTo(std::string payload,
                       const Endpoint& destination,
                       CompletionHandler handler) {
    auto buffer = std::make_shared<std::string>(std::move(payload));
    logger_->debug("[LAN] sending {} bytes to {}:{}: {}",
                   buffer->size(),
                   destination.address().to_string(),
                   destination.port(),
                   *buffer);
    socket_.async_send_to(
        boost::asio::buffer(*buffer),
        destination,
        [buffer, handler = std::move(handler)](const boost::system::error_code& ec, std::size_t) {
            if (handler) {
                handler(ec);
            }
        });
}

UdpReceiver::UdpReceiver(boost::asio::io_context& ctx, std::shared_ptr<spdlog::logger> logger)
    : socket_(ctx), logger_(std::move(logger)) {}

bool UdpReceiver::start(const Endpoint& listenEndpoint,
                        const boost::asio::ip::address_v4& group,
                        const boost::asio::ip::address_v4& interfaceAddress,
                        DatagramHandler handler) {
    if (running_) {
        return true;
    }

    boost::system::error_code ec;
    socket_.open(listenEndpoint.protocol(), ec);
    if (!ec) {
        socket_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        socket_.bind(listenEndpoint, ec);
    }
    if (!ec) {
        socket_.set_option(boost::asio::ip::multicast::join_group(group, interfaceAddress), ec);
    }
    if (ec) {
        logger_->warn("[LAN] server error: {}", ec.message());
        boost::system::error_code ignored;
        socket_.close(ignored);
        return false;
    }

    handler_ = std::move(handler);
    running_ = true;
    const auto local = localEndpoint();
    logger_->info("[LAN] server started listening {}:{}", local.address().to_string(), local.port());
    issueReceive();
    return true;
}

void UdpReceiver::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    boost::system::error_code ec;
    socket_.cancel(ec);
    socket_.close(ec);
}

Endpoint UdpReceiver::localEndpoint() const {
    boost::system::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    if (ec) {
        return Endpoint{};
    }
    return endpoint;
}

void UdpReceiver::issueReceive() {
    socket_.async_receive_from(
        boost::asio::buffer(buffer_),
        remoteEndpoint_,
        [this](const boost::system::error_code& ec, std::size_t bytesReceived) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            handleReceive(ec, bytesReceived);
        });
}

void UdpReceiver::handleReceiveError(const boost::system::error_code& ec) {
    if (!running_) {
        return;
    }
    logger_->warn("[LAN] server error: {}", ec.message());
    if (isTransientReceiveError(ec)) {
        issueReceive();
        return;
    }
    logger_->warn("[LAN] receiver stopped, discovery disabled until restart");
    stop();
}

void UdpReceiver::handleReceive(const boost::system::error_code& ec, std::size_t bytesReceived) {
    if (ec) {
        handleReceiveError(ec);
        return;
    }

    logger_->debug("[LAN] raw datagram from {}:{} ({} bytes)",
                   remoteEndpoint_.address().to_string(),
                   remoteEndpoint_.port(),
                   bytesReceived);
    if (handler_) {
        handler_(std::string_view(buffer_.data(), bytesReceived), remoteEndpoint_);
    }

    if (running_) {
        issueReceive();
    }
}

}  // namespace govee::lan
