#include "capdisc/discovery/discovery_result.hpp"

#include <utility>

namespace capdisc
{

const char* to_string(DiscoveryOutcome outcome) noexcept
{
    switch (outcome)
    {
    case DiscoveryOutcome::success:
        return "success";

    case DiscoveryOutcome::timeout:
        return "timeout";

    case DiscoveryOutcome::transport_error:
        return "transport_error";

    case DiscoveryOutcome::malformed_response:
        return "malformed_response";

    case DiscoveryOutcome::rejected:
        return "rejected";

    case DiscoveryOutcome::cancelled:
        return "cancelled";
    }

    return "unknown";
}

DiscoveryResult DiscoveryResult::success(CapabilitySet features)
{
    DiscoveryResult result;
    result.outcome  = DiscoveryOutcome::success;
    result.features = std::move(features);
    return result;
}

DiscoveryResult DiscoveryResult::failure(DiscoveryOutcome outcome, std::string reason)
{
    DiscoveryResult result;
    result.outcome = outcome;
    result.reason  = std::move(reason);
    return result;
}

} // namespace capdisc
