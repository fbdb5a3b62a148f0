#pragma once

#include "boost/asio.hpp"
#include "capdisc/discovery/capability.hpp"
#include "capdisc/discovery/discovery_message.hpp"
#include "capdisc/flags/flags.hpp"
#include "capdisc/net/discovery_states.hpp"

#include <array>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace capdisc
{

/**
 * @brief Answers DISCO-INFO datagrams for the peers registered on it.
 *
 * Known peers get a DISCO-RESULT with their features, unknown peers a
 * DISCO-ERROR "item-not-found". Silent peers get no reply at all.
 * Malformed datagrams are dropped.
 */
class CapabilityResponder
{
public:
    /// Binds to the given UDP port on all interfaces; 0 picks an ephemeral port.
    CapabilityResponder(boost::asio::io_context& io_context, unsigned short port);
    ~CapabilityResponder();

    CapabilityResponder(const CapabilityResponder&)            = delete;
    CapabilityResponder& operator=(const CapabilityResponder&) = delete;
    CapabilityResponder(CapabilityResponder&&)                 = delete;
    CapabilityResponder& operator=(CapabilityResponder&&)      = delete;

    bool async_start();

    bool async_stop(std::function<void()> on_stopped);

    /// Blocks until stopped. Returns without waiting if the io_context has already stopped.
    void stop();

    /*Must be called after a succesfull stop if you want to restart this object again*/
    void reset();

    void add_peer(const std::string& peer, const CapabilitySet& features);
    void add_silent_peer(const std::string& peer);
    void remove_peer(const std::string& peer);

    unsigned short local_port() const;

private:
    std::mutex _mutex;

    void start_receive();
    void handle_receive(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void handle_send(const boost::system::error_code& error_code, std::size_t bytes_transferred);
    void resolve_on_stopped();
    std::string build_reply(const DiscoveryPacket& request);

    boost::asio::io_context& _io_context;
    boost::asio::ip::udp::socket _socket;
    boost::asio::ip::udp::endpoint _remote_endpoint;

    std::array<char, DiscoveryMessage::max_datagram_size> _recv_buffer;

    std::unordered_map<std::string, CapabilitySet> _peers;
    std::unordered_set<std::string> _silent_peers;
    mutable std::mutex _peers_mutex;

    std::function<void()> _on_stopped;
    Flags<ResponderState> _flags;
};
} // namespace capdisc
