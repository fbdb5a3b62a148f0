#include "capdisc/net/udp_discovery_transport.hpp"

#include "boost/asio/post.hpp"
#include "capdisc/logging/capdisc_logging.hpp"
#include "capdisc/net/transport_config.hpp"

namespace capdisc
{

UdpDiscoveryTransport::UdpDiscoveryTransport(const std::string& host, unsigned short port,
                                             std::optional<std::chrono::milliseconds> reply_timeout)
    : _socket(_io_context)
    , _timer(_io_context)
    , _reply_timeout(reply_timeout ? *reply_timeout : default_reply_timeout())
    , _recv_buffer()
{
    boost::system::error_code error_code;
    boost::asio::ip::udp::resolver resolver(_io_context);
    auto endpoints = resolver.resolve(boost::asio::ip::udp::v4(), host, std::to_string(port), error_code);
    if (error_code || endpoints.empty())
    {
        CAPDISC_LOG_ERROR("Failed to resolve responder " << host << ":" << port << ": " << error_code.message());
        return;
    }
    _responder_endpoint = endpoints.begin()->endpoint();

    _socket.open(boost::asio::ip::udp::v4(), error_code);
    if (!error_code)
    {
        _socket.bind(boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), 0), error_code);
    }
    if (error_code)
    {
        CAPDISC_LOG_ERROR("Failed to open discovery socket: " << error_code.message());
        return;
    }

    _usable = true;
    CAPDISC_LOG_DEBUG("Discovery transport to " << _responder_endpoint << ", reply timeout " << _reply_timeout.count() << " ms");
}

UdpDiscoveryTransport::~UdpDiscoveryTransport()
{
    boost::system::error_code error_code;
    _socket.close(error_code);
}

bool UdpDiscoveryTransport::supports_discovery() const
{
    return _usable;
}

DiscoveryResult UdpDiscoveryTransport::discover_info(const std::string& peer)
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (!_usable)
        {
            return DiscoveryResult::failure(DiscoveryOutcome::transport_error, "transport is not connected");
        }
        if (_flags.get_flag(TransportRequestState::in_flight))
        {
            return DiscoveryResult::failure(DiscoveryOutcome::transport_error, "another discovery request is in flight");
        }
        if (!DiscoveryMessage::is_valid_peer(peer))
        {
            return DiscoveryResult::failure(DiscoveryOutcome::transport_error, "invalid peer address '" + peer + "'");
        }

        _flags.clear_all();
        _flags.set_flag(TransportRequestState::in_flight);
        _pending_id   = ++_next_request_id;
        _pending_peer = peer;
        _result.reset();
    }

    _io_context.restart();
    boost::asio::post(_io_context, [this]() { start_request(); });

    // Returns once every handler of this request has run
    _io_context.run();

    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_all();
    if (!_result)
    {
        return DiscoveryResult::failure(DiscoveryOutcome::transport_error, "request ended without a result");
    }
    DiscoveryResult result = std::move(*_result);
    _result.reset();
    return result;
}

void UdpDiscoveryTransport::cancel()
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (!_flags.get_flag(TransportRequestState::in_flight) || _flags.get_flag(TransportRequestState::cancel_requested))
    {
        return;
    }

    _flags.set_flag(TransportRequestState::cancel_requested);
    std::uint64_t request_id = _pending_id;
    boost::asio::post(_io_context,
                      [this, request_id]()
                      {
                          std::unique_lock<std::mutex> my_lock(_mutex);
                          if (request_id == _pending_id && _flags.get_flag(TransportRequestState::in_flight))
                          {
                              complete(DiscoveryResult::failure(DiscoveryOutcome::cancelled, "discovery cancelled"));
                          }
                      });
}

void UdpDiscoveryTransport::start_request()
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_result)
    {
        // Cancelled before the request went out
        return;
    }

    start_receive();

    _send_buffer = DiscoveryMessage::construct_request(_pending_id, _pending_peer);
    CAPDISC_LOG_TRACE("Sending discovery request: " << _send_buffer);
    _flags.set_flag(TransportRequestState::sending_async);
    _socket.async_send_to(boost::asio::buffer(_send_buffer), _responder_endpoint,
                          [this](const boost::system::error_code& error_code, std::size_t) { handle_send_complete(error_code); });
}

void UdpDiscoveryTransport::start_receive()
{
    _flags.set_flag(TransportRequestState::receiving_async);
    _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _sender_endpoint,
                               [this](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                               { handle_response(error_code, bytes_transferred); });
}

void UdpDiscoveryTransport::handle_send_complete(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(TransportRequestState::sending_async);
    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            CAPDISC_LOG_DEBUG("Discovery request sending aborted.");
        }
        else
        {
            complete(DiscoveryResult::failure(DiscoveryOutcome::transport_error,
                                              "failed to send discovery request: " + error_code.message()));
        }
        return;
    }

    if (!_result)
    {
        _flags.set_flag(TransportRequestState::timer_running);
        _timer.expires_after(_reply_timeout);
        _timer.async_wait([this](const boost::system::error_code& error_code) { handle_timeout(error_code); });
    }
}

void UdpDiscoveryTransport::handle_response(const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(TransportRequestState::receiving_async);
    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            CAPDISC_LOG_DEBUG("Discovery response receiving aborted.");
        }
        else
        {
            complete(DiscoveryResult::failure(DiscoveryOutcome::transport_error,
                                              "error receiving discovery response: " + error_code.message()));
        }
        return;
    }

    if (_result)
    {
        return;
    }

    if (_sender_endpoint != _responder_endpoint)
    {
        CAPDISC_LOG_DEBUG("Ignoring datagram from unexpected sender " << _sender_endpoint);
        start_receive();
        return;
    }

    if (bytes_transferred > DiscoveryMessage::max_datagram_size)
    {
        complete(DiscoveryResult::failure(DiscoveryOutcome::malformed_response,
                                          "discovery response exceeds " + std::to_string(DiscoveryMessage::max_datagram_size) + " bytes"));
        return;
    }

    std::string response(_recv_buffer.data(), bytes_transferred);
    CAPDISC_LOG_TRACE("Discovery response from " << _sender_endpoint << ": " << response);

    auto packet = DiscoveryMessage::parse(response);
    if (!packet)
    {
        complete(DiscoveryResult::failure(DiscoveryOutcome::malformed_response, "unparseable discovery response"));
        return;
    }

    if (packet->id != _pending_id || packet->peer != _pending_peer || packet->type == DiscoveryPacketType::request)
    {
        CAPDISC_LOG_DEBUG("Ignoring stale or unrelated discovery packet " << packet->id << " for " << packet->peer);
        start_receive();
        return;
    }

    if (packet->type == DiscoveryPacketType::error)
    {
        complete(DiscoveryResult::failure(DiscoveryOutcome::rejected, "responder returned error: " + packet->error_reason));
        return;
    }

    complete(DiscoveryResult::success(std::move(packet->features)));
}

void UdpDiscoveryTransport::handle_timeout(const boost::system::error_code& error_code)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_flag(TransportRequestState::timer_running);
    if (error_code)
    {
        if (error_code != boost::asio::error::operation_aborted)
        {
            complete(DiscoveryResult::failure(DiscoveryOutcome::transport_error, "timer error: " + error_code.message()));
        }
        return;
    }

    complete(DiscoveryResult::failure(DiscoveryOutcome::timeout,
                                      "no reply within " + std::to_string(_reply_timeout.count()) + " ms"));
}

void UdpDiscoveryTransport::complete(DiscoveryResult result)
{
    if (_result)
    {
        return;
    }
    _result = std::move(result);

    // Release outstanding operations so that run() returns
    boost::system::error_code error_code;
    if (_flags.get_flag(TransportRequestState::timer_running))
    {
        _timer.cancel();
    }
    if (!_flags.none_of(TransportRequestState::receiving_async, TransportRequestState::sending_async))
    {
        _socket.cancel(error_code);
        if (error_code)
        {
            CAPDISC_LOG_ERROR("Failed to cancel discovery socket: " << error_code.message());
        }
    }
}

} // namespace capdisc
