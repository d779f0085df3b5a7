#pragma once
#include <functional>
#include <string>

namespace mcplink::log
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

/// Parses "DEBUG", "INFO", "WARNING"/"WARN", "ERROR" (case-insensitive); unknown -> Info
LogLevel level_from_string(const std::string& s);
std::string to_string(LogLevel level);

void set_level(LogLevel level);
LogLevel level();

/// Replace the default stderr sink. Passing nullptr restores it.
using Sink = std::function<void(LogLevel, const std::string&)>;
void set_sink(Sink sink);

void write(LogLevel level, const std::string& component, const std::string& message);

inline void debug(const std::string& component, const std::string& message)
{
    write(LogLevel::Debug, component, message);
}
inline void info(const std::string& component, const std::string& message)
{
    write(LogLevel::Info, component, message);
}
inline void warning(const std::string& component, const std::string& message)
{
    write(LogLevel::Warning, component, message);
}
inline void error(const std::string& component, const std::string& message)
{
    write(LogLevel::Error, component, message);
}

} // namespace mcplink::log
