#pragma once

#include "capdisc/discovery/capability.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace capdisc
{

enum class DiscoveryPacketType
{
    request,
    result,
    error
};

/**
 * @brief One decoded discovery datagram
 */
struct DiscoveryPacket
{
    DiscoveryPacketType type = DiscoveryPacketType::request;
    std::uint64_t id         = 0; ///< Request id, echoed by the responder
    std::string peer;             ///< Address of the peer being queried
    CapabilitySet features;       ///< Declared features (result only)
    std::string error_reason;     ///< Failure reason (error only)
};

/**
 * @brief Creation and parsing of discovery datagrams.
 *
 * Wire format, lines separated by '\n':
 *   request: "DISCO-INFO <id> <peer>"
 *   result:  "DISCO-RESULT <id> <peer>" followed by one feature token per line
 *   error:   "DISCO-ERROR <id> <peer> <reason>"
 *
 * Parsing dispatches on the header keyword through the PayloadRegistry, so
 * initialize_protocol() must have run before anything is parsed.
 */
class DiscoveryMessage
{
public:
    static constexpr const char* request_keyword = "DISCO-INFO";
    static constexpr const char* result_keyword  = "DISCO-RESULT";
    static constexpr const char* error_keyword   = "DISCO-ERROR";

    /// Largest datagram either side sends or accepts.
    static constexpr std::size_t max_datagram_size = 8192;

    static std::string construct_request(std::uint64_t id, const std::string& peer);
    static std::string construct_result(std::uint64_t id, const std::string& peer, const CapabilitySet& features);
    static std::string construct_error(std::uint64_t id, const std::string& peer, const std::string& reason);

    /**
     * @brief Parses any discovery datagram
     * @return Parsed packet on success, std::nullopt if the datagram is malformed or its keyword has no registered parser
     */
    static std::optional<DiscoveryPacket> parse(const std::string& datagram);

    /// Returns true if the peer address can be carried in a header (non-empty, no whitespace).
    static bool is_valid_peer(const std::string& peer);

    /// Splits "<id> <peer>[ <rest>]". rest is left empty when absent.
    static bool split_header_arguments(const std::string& arguments, std::uint64_t& id, std::string& peer, std::string* rest);
};

} // namespace capdisc
