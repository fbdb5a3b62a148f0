#include "capdisc/discovery/discovery_message.hpp"

#include "capdisc/discovery/payload_registry.hpp"
#include "capdisc/logging/capdisc_logging.hpp"

#include <algorithm>
#include <cctype>

namespace capdisc
{

namespace
{
bool has_whitespace(const std::string& text)
{
    return std::any_of(text.begin(), text.end(), [](unsigned char character) { return std::isspace(character) != 0; });
}
} // namespace

std::string DiscoveryMessage::construct_request(std::uint64_t id, const std::string& peer)
{
    return std::string(request_keyword) + " " + std::to_string(id) + " " + peer;
}

std::string DiscoveryMessage::construct_result(std::uint64_t id, const std::string& peer, const CapabilitySet& features)
{
    std::string datagram = std::string(result_keyword) + " " + std::to_string(id) + " " + peer;
    for (const auto& feature : features)
    {
        datagram += "\n" + feature;
    }
    return datagram;
}

std::string DiscoveryMessage::construct_error(std::uint64_t id, const std::string& peer, const std::string& reason)
{
    return std::string(error_keyword) + " " + std::to_string(id) + " " + peer + " " + reason;
}

std::optional<DiscoveryPacket> DiscoveryMessage::parse(const std::string& datagram)
{
    if (datagram.empty() || datagram.size() > max_datagram_size)
    {
        CAPDISC_LOG_ERROR("Invalid discovery datagram size: " << datagram.size());
        return std::nullopt;
    }

    std::vector<std::string> lines;
    std::size_t line_start = 0;
    while (line_start <= datagram.size())
    {
        std::size_t line_end = datagram.find('\n', line_start);
        if (line_end == std::string::npos)
        {
            line_end = datagram.size();
        }
        lines.push_back(datagram.substr(line_start, line_end - line_start));
        line_start = line_end + 1;
    }

    const std::string& header = lines.front();
    std::size_t keyword_end   = header.find(' ');
    if (keyword_end == std::string::npos)
    {
        CAPDISC_LOG_ERROR("Invalid discovery datagram (no header arguments): " << header);
        return std::nullopt;
    }

    std::string keyword = header.substr(0, keyword_end);
    auto parser         = PayloadRegistry::instance().find_parser(keyword);
    if (!parser)
    {
        CAPDISC_LOG_ERROR("No payload parser registered for '" << keyword << "'");
        return std::nullopt;
    }

    std::vector<std::string> body(lines.begin() + 1, lines.end());
    return parser(header.substr(keyword_end + 1), body);
}

bool DiscoveryMessage::is_valid_peer(const std::string& peer)
{
    return !peer.empty() && !has_whitespace(peer);
}

bool DiscoveryMessage::split_header_arguments(const std::string& arguments, std::uint64_t& id, std::string& peer, std::string* rest)
{
    std::size_t id_end = arguments.find(' ');
    if (id_end == std::string::npos || id_end == 0)
    {
        return false;
    }

    std::string id_str = arguments.substr(0, id_end);
    if (!std::all_of(id_str.begin(), id_str.end(), [](unsigned char character) { return std::isdigit(character) != 0; }))
    {
        return false;
    }

    try
    {
        id = std::stoull(id_str);
    }
    catch (const std::exception& e)
    {
        CAPDISC_LOG_DEBUG("Invalid request id '" << id_str << "': " << e.what());
        return false;
    }

    std::size_t peer_end = arguments.find(' ', id_end + 1);
    peer                 = arguments.substr(id_end + 1, peer_end == std::string::npos ? std::string::npos : peer_end - id_end - 1);
    if (!is_valid_peer(peer))
    {
        return false;
    }

    if (peer_end != std::string::npos)
    {
        if (rest == nullptr)
        {
            return false;
        }
        *rest = arguments.substr(peer_end + 1);
    }
    else if (rest != nullptr)
    {
        rest->clear();
    }
    return true;
}

} // namespace capdisc
