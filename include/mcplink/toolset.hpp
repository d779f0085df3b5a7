#pragma once
#include "mcplink/manager/manager.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcplink
{

/// Function-tool definition handed to the agent's model
struct FunctionTool
{
    std::string name;
    std::string description;
    Json parameters;
};

/// {"type":"function","function":{name, description, parameters}}
void to_json(Json& j, const FunctionTool& tool);

/// What the agent layer shows for one tool execution
struct ToolOutcome
{
    bool success{false};
    std::string output;
    std::string error;
};

/// Exposes every Ready server's tools to the agent as `mcp_<server>_<tool>`
/// and routes executions back through the Manager.
class McpToolset
{
  public:
    explicit McpToolset(manager::Manager& manager) : manager_(manager) {}

    static constexpr const char* kPrefix = "mcp_";

    static std::string qualified_name(const std::string& server, const std::string& tool);
    static bool is_mcp_tool(const std::string& name);

    std::vector<FunctionTool> tools() const;

    /// Split a qualified name into (server, tool). Server names may contain '_';
    /// the longest connected server name that matches wins.
    std::optional<std::pair<std::string, std::string>> resolve(const std::string& qualified) const;

    ToolOutcome execute(const std::string& qualified, const Json& arguments);

    /// Dispatch by bare tool name, whichever server has it
    ToolOutcome call_by_tool_name(const std::string& tool, const Json& arguments);

    std::string list_servers_text() const;
    std::string list_tools_text() const;

    static ToolOutcome render(const client::CallToolResult& result);

  private:
    manager::Manager& manager_;
};

} // namespace mcplink
