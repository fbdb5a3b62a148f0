#pragma once

#include "capdisc/discovery/discovery_message.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace capdisc
{

/// Parses the header arguments (everything after the keyword) and body lines of one datagram.
using PayloadParser = std::function<std::optional<DiscoveryPacket>(const std::string& arguments, const std::vector<std::string>& body)>;

/**
 * @brief Process-wide table of datagram parsers keyed by header keyword.
 *
 * Populated once by initialize_protocol(); read by DiscoveryMessage::parse.
 */
class PayloadRegistry
{
public:
    static PayloadRegistry& instance();

    PayloadRegistry(const PayloadRegistry&)            = delete;
    PayloadRegistry& operator=(const PayloadRegistry&) = delete;

    /// Registers a parser. Returns false if the keyword already has one.
    bool add_parser(const std::string& keyword, PayloadParser parser);

    /// Returns the parser for the keyword, or an empty function.
    PayloadParser find_parser(const std::string& keyword) const;

    bool has_parser(const std::string& keyword) const;

private:
    PayloadRegistry() = default;

    mutable std::mutex _mutex;
    std::unordered_map<std::string, PayloadParser> _parsers;
};

/**
 * Registers the discovery payload parsers and sets the default reply timeout to 15 seconds.
 * Safe to call any number of times from any thread; only the first call has an effect.
 */
void initialize_protocol();

} // namespace capdisc
