#include "capdisc/net/capability_responder.hpp"

#include "boost/asio/post.hpp"
#include "capdisc/logging/capdisc_logging.hpp"

#include <future>
#include <memory>

namespace capdisc
{

CapabilityResponder::CapabilityResponder(boost::asio::io_context& io_context, unsigned short port)
    : _io_context(io_context), _socket(io_context, boost::asio::ip::udp::endpoint(boost::asio::ip::udp::v4(), port)), _recv_buffer()
{
}

CapabilityResponder::~CapabilityResponder()
{
    stop();
}

bool CapabilityResponder::async_start()
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_flags.get_flag(ResponderState::running) || _flags.get_flag(ResponderState::stopping))
        {
            return false;
        }

        _flags.set_flag(ResponderState::running);
    }

    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> my_lock(_mutex);
                          if (!_flags.get_flag(ResponderState::stopping))
                          {
                              CAPDISC_LOG_INFO("Capability responder listening on port " << local_port());
                              start_receive();
                          }
                          else
                          {
                              resolve_on_stopped();
                          }
                      });

    return true;
}

bool CapabilityResponder::async_stop(std::function<void()> on_stopped)
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_flags.get_flag(ResponderState::stopping))
        {
            return false;
        }

        _flags.set_flag(ResponderState::stopping);
        _on_stopped = std::move(on_stopped);
    }

    boost::asio::post(_io_context,
                      [this]()
                      {
                          std::unique_lock<std::mutex> my_lock(_mutex);
                          boost::system::error_code error_code;
                          _socket.cancel(error_code);
                          resolve_on_stopped();
                      });

    return true;
}

void CapabilityResponder::stop()
{
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (!_flags.get_flag(ResponderState::running))
        {
            return;
        }
    }

    if (_io_context.get_executor().running_in_this_thread())
    {
        CAPDISC_LOG_WARNING("Stop called on io context. This isn't allowed! ");
        return;
    }

    // Nothing would run the stop handlers
    if (_io_context.stopped())
    {
        CAPDISC_LOG_WARNING("Responder stopped after its io context; pending operations are abandoned.");
        std::unique_lock<std::mutex> lock(_mutex);
        _flags.set_flag(ResponderState::stopping);
        return;
    }

    auto stopped = std::make_shared<std::promise<void>>();
    if (async_stop([stopped]() { stopped->set_value(); }))
    {
        stopped->get_future().wait();
    }
}

void CapabilityResponder::reset()
{
    std::unique_lock<std::mutex> lock(_mutex);
    _flags.clear_all();
}

void CapabilityResponder::add_peer(const std::string& peer, const CapabilitySet& features)
{
    std::lock_guard<std::mutex> lock(_peers_mutex);
    _silent_peers.erase(peer);
    _peers[peer] = features;
}

void CapabilityResponder::add_silent_peer(const std::string& peer)
{
    std::lock_guard<std::mutex> lock(_peers_mutex);
    _peers.erase(peer);
    _silent_peers.insert(peer);
}

void CapabilityResponder::remove_peer(const std::string& peer)
{
    std::lock_guard<std::mutex> lock(_peers_mutex);
    _peers.erase(peer);
    _silent_peers.erase(peer);
}

unsigned short CapabilityResponder::local_port() const
{
    boost::system::error_code error_code;
    auto endpoint = _socket.local_endpoint(error_code);
    return error_code ? 0 : endpoint.port();
}

void CapabilityResponder::start_receive()
{
    _flags.set_flag(ResponderState::receiving_async);
    _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _remote_endpoint,
                               [this](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                               { handle_receive(error_code, bytes_transferred); });
}

std::string CapabilityResponder::build_reply(const DiscoveryPacket& request)
{
    std::lock_guard<std::mutex> lock(_peers_mutex);
    if (_silent_peers.count(request.peer) != 0U)
    {
        CAPDISC_LOG_TRACE("Not answering discovery for silent peer " << request.peer);
        return std::string();
    }

    auto iter = _peers.find(request.peer);
    if (iter == _peers.end())
    {
        CAPDISC_LOG_DEBUG("Discovery request for unknown peer " << request.peer);
        return DiscoveryMessage::construct_error(request.id, request.peer, "item-not-found");
    }
    std::string reply = DiscoveryMessage::construct_result(request.id, request.peer, iter->second);
    if (reply.size() > DiscoveryMessage::max_datagram_size)
    {
        CAPDISC_LOG_ERROR("Features of " << request.peer << " do not fit in one datagram (" << reply.size() << " bytes)");
        return DiscoveryMessage::construct_error(request.id, request.peer, "payload-too-large");
    }
    return reply;
}

void CapabilityResponder::handle_receive(const boost::system::error_code& error_code, std::size_t bytes_transferred)
{
    std::unique_lock<std::mutex> lock(_mutex);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            CAPDISC_LOG_DEBUG("Capability responder receive operation aborted.");
        }
        else
        {
            CAPDISC_LOG_ERROR("UDP receive error: " << error_code.message());
        }
    }
    else if (bytes_transferred > 0)
    {
        auto request = DiscoveryMessage::parse(std::string(_recv_buffer.data(), bytes_transferred));
        if (!request || request->type != DiscoveryPacketType::request)
        {
            CAPDISC_LOG_DEBUG("Dropping datagram from " << _remote_endpoint << " that is not a discovery request");
        }
        else
        {
            std::string reply = build_reply(*request);
            if (!reply.empty())
            {
                auto send_buffer = std::make_shared<std::string>(std::move(reply));
                _flags.set_flag(ResponderState::sending_async);
                _socket.async_send_to(boost::asio::buffer(*send_buffer), _remote_endpoint,
                                      [this, send_buffer](const boost::system::error_code& error_code, std::size_t bytes_transferred)
                                      { handle_send(error_code, bytes_transferred); });
            }
        }
    }

    if (!_flags.get_flag(ResponderState::stopping))
    {
        _socket.async_receive_from(boost::asio::buffer(_recv_buffer), _remote_endpoint,
                                   [this](const boost::system::error_code& error, std::size_t bytes_transferred)
                                   { handle_receive(error, bytes_transferred); });
        return;
    }

    _flags.clear_flag(ResponderState::receiving_async);
    resolve_on_stopped();
}

void CapabilityResponder::handle_send(const boost::system::error_code& error_code, std::size_t /*bytes_transferred*/)
{
    std::unique_lock<std::mutex> lock(_mutex);

    if (error_code)
    {
        if (error_code == boost::asio::error::operation_aborted)
        {
            CAPDISC_LOG_DEBUG("Capability responder send operation aborted.");
        }
        else
        {
            CAPDISC_LOG_ERROR("UDP send error: " << error_code.message());
        }
    }

    _flags.clear_flag(ResponderState::sending_async);
    resolve_on_stopped();
}

void CapabilityResponder::resolve_on_stopped()
{
    if (_flags.get_flag(ResponderState::stopping) && _flags.none_of(ResponderState::receiving_async, ResponderState::sending_async))
    {
        if (_on_stopped)
        {
            boost::asio::post(_io_context, std::move(_on_stopped));
            _on_stopped = nullptr;
        }
    }
}

} // namespace capdisc
