#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "capdisc/logging/capdisc_logging.hpp"

namespace capdisc
{

enum class ProbeMode
{
    probe,
    respond
};

struct ProbeConfig
{
    ProbeMode mode = ProbeMode::probe;
    std::string peer;
    std::string host    = "127.0.0.1";
    unsigned short port = 5347;
    std::vector<std::string> features;
    std::optional<std::chrono::milliseconds> reply_timeout;
    logging::LogLevel log_level = logging::LogLevel::Info;
};

} // namespace capdisc
