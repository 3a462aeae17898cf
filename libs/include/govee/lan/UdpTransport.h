#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/system/error_code.hpp>
#include <spdlog/logger.h>

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace govee::lan {

using Endpoint = boost::asio::ip::udp::endpoint;

// Receive errors a UDP socket can report for a single datagram (ICMP
// feedback, truncation) while the socket itself stays usable.
bool isTransientReceiveError(const boost::system::error_code& ec) noexcept;

// Outbound datagram channel. Completion handlers run on the io_context that
// owns the implementation, never inline from sendTo().
class DatagramSender {
public:
    using CompletionHandler = std::function<void(const boost::system::error_code&)>;

    virtual ~DatagramSender() = default;

    virtual void sendTo(std::string payload,
                        const Endpoint& destination,
                        CompletionHandler handler) = 0;
};

// IPv4 socket on an ephemeral local port, used for the multicast scan and
// for unicast commands alike.
class UdpSender : public DatagramSender {
public:
    UdpSender(boost::asio::io_context& ctx, std::shared_ptr<spdlog::logger> logger);

    UdpSender(const UdpSender&) = delete;
    UdpSender& operator=(const UdpSender&) = delete;

    void sendTo(std::string payload,
                const Endpoint& destination,
                CompletionHandler handler) override;

private:
    boost::asio::ip::udp::socket socket_;
    std::shared_ptr<spdlog::logger> logger_;
};

class UdpReceiver {
public:
    using DatagramHandler = std::function<void(std::string_view, const Endpoint&)>;

    UdpReceiver(boost::asio::io_context& ctx, std::shared_ptr<spdlog::logger> logger);

    UdpReceiver(const UdpReceiver&) = delete;
    UdpReceiver& operator=(const UdpReceiver&) = delete;

    // Binds with address reuse and joins `group` on `interfaceAddress`.
    // Returns false (after logging) when the socket cannot be set up.
    bool start(const Endpoint& listenEndpoint,
               const boost::asio::ip::address_v4& group,
               const boost::asio::ip::address_v4& interfaceAddress,
               DatagramHandler handler);
    void stop();

    bool running() const noexcept { return running_; }
    Endpoint localEndpoint() const;

    // Transient errors are logged and receiving continues. Any other error
    // is logged and stops the receiver for good.
    void handleReceiveError(const boost::system::error_code& ec);

private:
    void issueReceive();
    void handleReceive(const boost::system::error_code& ec, std::size_t bytesReceived);

    boost::asio::ip::udp::socket socket_;
    std::shared_ptr<spdlog::logger> logger_;
    DatagramHandler handler_;
    std::array<char, 65536> buffer_{};
    Endpoint remoteEndpoint_{};
    bool running_{false};
};

}  // namespace govee::lan
