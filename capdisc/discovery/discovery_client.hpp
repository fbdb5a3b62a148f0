#pragma once

#include "capdisc/discovery/capability.hpp"
#include "capdisc/logging/capdisc_logging.hpp"
#include "capdisc/net/discovery_transport.hpp"

#include <string>

namespace capdisc
{

/**
 * @brief Discovers the capabilities a peer advertises.
 *
 * discover() never fails: when the peer cannot be queried, or does not answer
 * properly, the default capability set is returned instead.
 */
class DiscoveryClient
{
public:
    /**
     * @param verbosity Debug or Trace logs the full feature list of each successful discovery,
     *                  coarser levels only the peer and the elapsed time. The full list is only
     *                  chosen while the global log level lets DEBUG lines through.
     */
    explicit DiscoveryClient(logging::LogLevel verbosity = logging::current_log_level);

    /**
     * @brief Runs one discovery round-trip.
     * @param transport Transport to send the request over; may be null
     * @param peer Full address of the peer to query
     * @return The features the peer declared, or default_capability_set() on any failure
     */
    CapabilitySet discover(DiscoveryTransport* transport, const std::string& peer) const;

    /// The fallback set: audio, video, ICE, SCTP, DTLS, RTCP mux and RTP bundle. Built once.
    static const CapabilitySet& default_capability_set();

    /**
     * Same size and each list contains every element of the other. Order is ignored;
     * duplicates are not counted, so {A, A, B} equals {A, B, B}.
     */
    static bool sets_equal(const CapabilitySet& first, const CapabilitySet& second);

private:
    logging::LogLevel _verbosity;
};

} // namespace capdisc
