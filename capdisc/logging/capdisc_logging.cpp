#include "capdisc/logging/capdisc_logging.hpp"

#include <mutex>

namespace capdisc
{
namespace logging
{

LogLevel current_log_level = LogLevel::Info;

namespace
{
std::mutex sink_mutex;
LogSink installed_sink;
} // namespace

void set_log_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(sink_mutex);
    installed_sink = std::move(sink);
}

void write_log_line(LogLevel level, const std::string& line)
{
    std::lock_guard<std::mutex> lock(sink_mutex);
    if (installed_sink)
    {
        installed_sink(level, line);
        return;
    }
    std::cout << line + "\n";
}

} // namespace logging
} // namespace capdisc
