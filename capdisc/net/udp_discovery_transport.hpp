#pragma once

#include "boost/asio.hpp"
#include "capdisc/discovery/discovery_message.hpp"
#include "capdisc/flags/flags.hpp"
#include "capdisc/net/discovery_states.hpp"
#include "capdisc/net/discovery_transport.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace capdisc
{

/**
 * @brief DiscoveryTransport sending DISCO-INFO datagrams to one responder over UDP.
 *
 * Each discover_info() call runs a private io_context on the calling thread
 * until the reply arrives, the reply timeout expires or cancel() is called.
 * One request at a time; a concurrent second request fails immediately.
 */
class UdpDiscoveryTransport : public DiscoveryTransport
{
public:
    /**
     * @param host Responder host name or address
     * @param port Responder UDP port
     * @param reply_timeout Bound on the wait for a reply; default_reply_timeout() when empty
     */
    UdpDiscoveryTransport(const std::string& host, unsigned short port,
                          std::optional<std::chrono::milliseconds> reply_timeout = std::nullopt);

    ~UdpDiscoveryTransport() override;

    UdpDiscoveryTransport(const UdpDiscoveryTransport&)            = delete;
    UdpDiscoveryTransport& operator=(const UdpDiscoveryTransport&) = delete;
    UdpDiscoveryTransport(UdpDiscoveryTransport&&)                 = delete;
    UdpDiscoveryTransport& operator=(UdpDiscoveryTransport&&)      = delete;

    bool supports_discovery() const override;
    DiscoveryResult discover_info(const std::string& peer) override;
    void cancel() override;

    std::chrono::milliseconds reply_timeout() const { return _reply_timeout; }

private:
    void start_request();
    void start_receive();
    void handle_send_complete(const boost::system::error_code& error_code);
    void handle_response(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void handle_timeout(const boost::system::error_code& error_code);
    void complete(DiscoveryResult result);

    std::mutex _mutex;
    boost::asio::io_context _io_context;
    boost::asio::ip::udp::socket _socket;
    boost::asio::ip::udp::endpoint _responder_endpoint;
    boost::asio::ip::udp::endpoint _sender_endpoint;
    boost::asio::steady_timer _timer;
    std::chrono::milliseconds _reply_timeout;
    bool _usable = false;

    /// One byte more than the largest valid datagram, so that a full buffer reveals truncation.
    std::array<char, DiscoveryMessage::max_datagram_size + 1> _recv_buffer;
    std::string _send_buffer;

    std::uint64_t _next_request_id = 0;
    std::uint64_t _pending_id      = 0;
    std::string _pending_peer;
    std::optional<DiscoveryResult> _result;

    Flags<TransportRequestState> _flags;
};
} // namespace capdisc
