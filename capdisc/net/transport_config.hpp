#pragma once

#include <chrono>

namespace capdisc
{

/// Reply timeout used by transports that were not given one explicitly. Initially 5 seconds.
std::chrono::milliseconds default_reply_timeout();

void set_default_reply_timeout(std::chrono::milliseconds timeout);

} // namespace capdisc
