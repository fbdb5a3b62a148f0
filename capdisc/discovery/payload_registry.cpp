#include "capdisc/discovery/payload_registry.hpp"

#include "capdisc/logging/capdisc_logging.hpp"
#include "capdisc/net/transport_config.hpp"

#include <chrono>

namespace capdisc
{

PayloadRegistry& PayloadRegistry::instance()
{
    static PayloadRegistry registry;
    return registry;
}

bool PayloadRegistry::add_parser(const std::string& keyword, PayloadParser parser)
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _parsers.emplace(keyword, std::move(parser)).second;
}

PayloadParser PayloadRegistry::find_parser(const std::string& keyword) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto iter = _parsers.find(keyword);
    if (iter == _parsers.end())
    {
        return PayloadParser();
    }
    return iter->second;
}

bool PayloadRegistry::has_parser(const std::string& keyword) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _parsers.count(keyword) != 0U;
}

namespace
{

std::optional<DiscoveryPacket> parse_request(const std::string& arguments, const std::vector<std::string>& body)
{
    DiscoveryPacket packet;
    packet.type = DiscoveryPacketType::request;
    if (!DiscoveryMessage::split_header_arguments(arguments, packet.id, packet.peer, nullptr))
    {
        CAPDISC_LOG_ERROR("Invalid discovery request header: " << arguments);
        return std::nullopt;
    }
    if (!body.empty())
    {
        CAPDISC_LOG_ERROR("Discovery request for " << packet.peer << " carries an unexpected body");
        return std::nullopt;
    }
    return packet;
}

std::optional<DiscoveryPacket> parse_result(const std::string& arguments, const std::vector<std::string>& body)
{
    DiscoveryPacket packet;
    packet.type = DiscoveryPacketType::result;
    if (!DiscoveryMessage::split_header_arguments(arguments, packet.id, packet.peer, nullptr))
    {
        CAPDISC_LOG_ERROR("Invalid discovery result header: " << arguments);
        return std::nullopt;
    }

    for (const auto& line : body)
    {
        // Blank lines carry no feature entry
        if (line.empty())
        {
            continue;
        }
        if (!DiscoveryMessage::is_valid_peer(line))
        {
            CAPDISC_LOG_ERROR("Invalid feature entry '" << line << "' in result for " << packet.peer);
            return std::nullopt;
        }
        packet.features.push_back(line);
    }
    return packet;
}

std::optional<DiscoveryPacket> parse_error(const std::string& arguments, const std::vector<std::string>& body)
{
    DiscoveryPacket packet;
    packet.type = DiscoveryPacketType::error;
    if (!DiscoveryMessage::split_header_arguments(arguments, packet.id, packet.peer, &packet.error_reason) || !body.empty())
    {
        CAPDISC_LOG_ERROR("Invalid discovery error: " << arguments);
        return std::nullopt;
    }
    if (packet.error_reason.empty())
    {
        packet.error_reason = "unknown";
    }
    return packet;
}

} // namespace

void initialize_protocol()
{
    static std::once_flag initialized;
    std::call_once(initialized,
                   []()
                   {
                       auto& registry = PayloadRegistry::instance();
                       registry.add_parser(DiscoveryMessage::request_keyword, parse_request);
                       registry.add_parser(DiscoveryMessage::result_keyword, parse_result);
                       registry.add_parser(DiscoveryMessage::error_keyword, parse_error);

                       set_default_reply_timeout(std::chrono::milliseconds(15000));
                       CAPDISC_LOG_DEBUG("Discovery payload parsers registered");
                   });
}

} // namespace capdisc
