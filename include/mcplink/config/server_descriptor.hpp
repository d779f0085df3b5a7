#pragma once
#include "mcplink/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcplink::config
{

/// One configured MCP server. `name` is the unique key.
struct ServerDescriptor
{
    std::string name;
    TransportKind kind{TransportKind::Stdio};
    std::string command; ///< May carry embedded arguments ("server-fs /tmp")
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string http_url;    ///< Explicit endpoint for http servers (optional)
    std::optional<int> port; ///< Assigned port for supervised http servers
    bool enabled{true};
    std::string description;
};

/// Executable followed by its arguments: the whitespace-split command, then `args`
std::vector<std::string> command_line(const ServerDescriptor& d);

/// Endpoint an http client should POST to
std::string endpoint_url(const ServerDescriptor& d);

void to_json(Json& j, const ServerDescriptor& d);
void from_json(const Json& j, ServerDescriptor& d);

} // namespace mcplink::config
