#pragma once

namespace capdisc
{

/// States of one outstanding request on a UdpDiscoveryTransport.
enum class TransportRequestState
{
    in_flight,
    cancel_requested,
    timer_running,
    sending_async,
    receiving_async,
};

/// States of a CapabilityResponder.
enum class ResponderState
{
    running,
    stopping,
    sending_async,
    receiving_async,
};

} // namespace capdisc
