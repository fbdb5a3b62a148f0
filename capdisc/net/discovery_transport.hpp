#pragma once

#include "capdisc/discovery/discovery_result.hpp"

#include <string>

namespace capdisc
{

/**
 * @brief Request/response channel used by DiscoveryClient.
 *
 * Implementations bound the wait for a reply themselves and report every
 * failure through the returned DiscoveryResult.
 */
class DiscoveryTransport
{
public:
    virtual ~DiscoveryTransport() = default;

    /// False if no discovery request can be sent over this transport.
    virtual bool supports_discovery() const = 0;

    /// Queries the peer's capabilities. Blocks the caller until a reply, the reply timeout, or cancel().
    virtual DiscoveryResult discover_info(const std::string& peer) = 0;

    /// Abandons the outstanding request, if any. Callable from any thread.
    virtual void cancel() = 0;
};

} // namespace capdisc
