#include "capdisc/discovery/discovery_client.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace capdisc
{

namespace
{
bool contains_all(const CapabilitySet& haystack, const CapabilitySet& needles)
{
    return std::all_of(needles.begin(), needles.end(), [&haystack](const std::string& needle) { return has_feature(haystack, needle); });
}

std::string join(const CapabilitySet& features)
{
    std::string joined;
    for (const auto& feature : features)
    {
        if (!joined.empty())
        {
            joined += ", ";
        }
        joined += feature;
    }
    return joined;
}
} // namespace

DiscoveryClient::DiscoveryClient(logging::LogLevel verbosity) : _verbosity(verbosity)
{
}

CapabilitySet DiscoveryClient::discover(DiscoveryTransport* transport, const std::string& peer) const
{
    if (transport == nullptr)
    {
        CAPDISC_LOG_ERROR("No transport to discover features of " << peer);
        return default_capability_set();
    }
    if (!transport->supports_discovery())
    {
        CAPDISC_LOG_ERROR("Service discovery not supported by the transport for " << peer);
        return default_capability_set();
    }

    auto start = std::chrono::steady_clock::now();
    CAPDISC_LOG_INFO("Doing feature discovery for " << peer);

    DiscoveryResult result;
    try
    {
        result = transport->discover_info(peer);
    }
    catch (const std::exception& e)
    {
        result = DiscoveryResult::failure(DiscoveryOutcome::transport_error, e.what());
    }
    catch (...)
    {
        result = DiscoveryResult::failure(DiscoveryOutcome::transport_error, "unknown exception");
    }

    if (result.outcome == DiscoveryOutcome::cancelled)
    {
        CAPDISC_LOG_INFO("Feature discovery for " << peer << " cancelled, assuming default feature set.");
        return default_capability_set();
    }
    if (!result.ok())
    {
        CAPDISC_LOG_WARNING("Failed to discover features for " << peer << " (" << to_string(result.outcome) << "): " << result.reason
                                                               << ", assuming default feature set.");
        return default_capability_set();
    }

    auto took_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

    // The detailed event replaces the summary only when it will actually be written
    if (static_cast<int>(_verbosity) >= static_cast<int>(logging::LogLevel::Debug) && logging::should_log(logging::LogLevel::Debug))
    {
        CAPDISC_LOG_DEBUG(peer << ", features: " << join(result.features) << ", in: " << took_ms << " ms");
    }
    else
    {
        CAPDISC_LOG_INFO("Successfully discovered features for " << peer << " in " << took_ms << " ms");
    }

    return std::move(result.features);
}

const CapabilitySet& DiscoveryClient::default_capability_set()
{
    static const CapabilitySet defaults {feature::audio, feature::video,    feature::ice,       feature::sctp,
                                         feature::dtls,  feature::rtcp_mux, feature::rtp_bundle};
    return defaults;
}

bool DiscoveryClient::sets_equal(const CapabilitySet& first, const CapabilitySet& second)
{
    return first.size() == second.size() && contains_all(second, first) && contains_all(first, second);
}

} // namespace capdisc
