#pragma once

#include <functional>
#include <iostream>
#include <sstream>
#include <string>

namespace capdisc
{
namespace logging
{

enum class LogLevel
{
    Error   = 0,
    Warning = 1,
    Info    = 2,
    Debug   = 3,
    Trace   = 4
};

// Global log level variable
extern LogLevel current_log_level;

using LogSink = std::function<void(LogLevel level, const std::string& line)>;

/// Replace the output of all log macros. An empty sink restores std::cout.
void set_log_sink(LogSink sink);

/// Write a formatted line to the installed sink.
void write_log_line(LogLevel level, const std::string& line);

// Helper function to check if a log level should be printed
inline bool should_log(LogLevel level)
{
    return static_cast<int>(level) <= static_cast<int>(current_log_level);
}

// Helper function to get log level name
inline const char* get_log_level_name(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Trace:
        return "TRACE";
    default:
        return "UNKNOWN";
    }
}

} // namespace logging
} // namespace capdisc

// Macro to set the log level
#define CAPDISC_SET_LOG_LEVEL(level) capdisc::logging::current_log_level = capdisc::logging::LogLevel::level

#define CAPDISC_LOG_AT(level, message)                                                                             \
    do                                                                                                             \
    {                                                                                                              \
        if (capdisc::logging::should_log(level))                                                                   \
        {                                                                                                          \
            std::ostringstream oss;                                                                                \
            oss << "[" << capdisc::logging::get_log_level_name(level) << "] " << __func__ << ": " << message;    \
            capdisc::logging::write_log_line(level, oss.str());                                                    \
        }                                                                                                          \
    } while (0)

// Logging macros that accept stream expressions
#define CAPDISC_LOG_ERROR(message)   CAPDISC_LOG_AT(capdisc::logging::LogLevel::Error, message)
#define CAPDISC_LOG_WARNING(message) CAPDISC_LOG_AT(capdisc::logging::LogLevel::Warning, message)
#define CAPDISC_LOG_INFO(message)    CAPDISC_LOG_AT(capdisc::logging::LogLevel::Info, message)
#define CAPDISC_LOG_DEBUG(message)   CAPDISC_LOG_AT(capdisc::logging::LogLevel::Debug, message)
#define CAPDISC_LOG_TRACE(message)   CAPDISC_LOG_AT(capdisc::logging::LogLevel::Trace, message)
