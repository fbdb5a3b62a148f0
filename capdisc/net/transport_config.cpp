#include "capdisc/net/transport_config.hpp"

#include <atomic>

namespace capdisc
{

namespace
{
std::atomic<std::chrono::milliseconds::rep> reply_timeout_ms {5000};
}

std::chrono::milliseconds default_reply_timeout()
{
    return std::chrono::milliseconds(reply_timeout_ms.load());
}

void set_default_reply_timeout(std::chrono::milliseconds timeout)
{
    reply_timeout_ms.store(timeout.count());
}

} // namespace capdisc
