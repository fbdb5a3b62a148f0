#pragma once

#include "capdisc/discovery/capability.hpp"

#include <string>

namespace capdisc
{

enum class DiscoveryOutcome
{
    success,
    timeout,
    transport_error,
    malformed_response,
    rejected,
    cancelled,
};

const char* to_string(DiscoveryOutcome outcome) noexcept;

/**
 * @brief Outcome of one discovery round-trip as reported by a transport.
 *
 * On success, features holds the tokens in the order the responder declared them.
 * Otherwise reason carries a human readable failure detail.
 */
struct DiscoveryResult
{
    DiscoveryOutcome outcome = DiscoveryOutcome::transport_error;
    CapabilitySet features;
    std::string reason;

    bool ok() const { return outcome == DiscoveryOutcome::success; }

    static DiscoveryResult success(CapabilitySet features);
    static DiscoveryResult failure(DiscoveryOutcome outcome, std::string reason);
};

} // namespace capdisc
