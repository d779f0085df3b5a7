#include "mcplink/logging.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>

namespace mcplink::log
{

namespace
{
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_mutex;
Sink g_sink;
} // namespace

LogLevel level_from_string(const std::string& s)
{
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

void set_level(LogLevel level)
{
    g_level.store(static_cast<int>(level));
}

LogLevel level()
{
    return static_cast<LogLevel>(g_level.load());
}

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = std::move(sink);
}

void write(LogLevel level, const std::string& component, const std::string& message)
{
    if (static_cast<int>(level) < g_level.load())
        return;

    std::string line = "[mcplink] " + to_string(level) + " " + component + ": " + message;

    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_sink)
    {
        g_sink(level, line);
        return;
    }
    std::cerr << line << std::endl;
}

} // namespace mcplink::log
