#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace mcplink
{

using Json = nlohmann::json;

constexpr const char* LIBRARY_NAME = "mcplink";
constexpr const char* LIBRARY_VERSION = "1.0.0";

/// MCP protocol revision announced in the initialize handshake
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

/// How a managed server is reached
enum class TransportKind
{
    Stdio,
    Http
};

inline std::string to_string(TransportKind kind)
{
    switch (kind)
    {
    case TransportKind::Stdio:
        return "stdio";
    case TransportKind::Http:
        return "http";
    }
    return "stdio";
}

inline TransportKind transport_kind_from_string(const std::string& s)
{
    if (s == "http")
        return TransportKind::Http;
    return TransportKind::Stdio;
}

/// Lifecycle of one server connection
enum class ConnectionState
{
    Disconnected,
    Connecting,
    Ready,
    Failed
};

inline std::string to_string(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Disconnected:
        return "disconnected";
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Ready:
        return "ready";
    case ConnectionState::Failed:
        return "failed";
    }
    return "disconnected";
}

} // namespace mcplink
