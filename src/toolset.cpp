#include "mcplink/toolset.hpp"

#include <algorithm>
#include <map>
#include <sstream>

namespace mcplink
{

void to_json(Json& j, const FunctionTool& tool)
{
    j = Json{{"type", "function"},
             {"function",
              {{"name", tool.name}, {"description", tool.description}, {"parameters", tool.parameters}}}};
}

std::string McpToolset::qualified_name(const std::string& server, const std::string& tool)
{
    return kPrefix + server + "_" + tool;
}

bool McpToolset::is_mcp_tool(const std::string& name)
{
    return name.rfind(kPrefix, 0) == 0;
}

std::vector<FunctionTool> McpToolset::tools() const
{
    std::vector<FunctionTool> out;
    for (const auto& tool : manager_.get_all_tools())
    {
        FunctionTool f;
        f.name = qualified_name(tool.serverName, tool.name);
        f.description = "[MCP: " + tool.serverName + "] " +
                        (tool.description && !tool.description->empty() ? *tool.description
                                                                         : tool.name);
        if (tool.inputSchema.is_object() && !tool.inputSchema.empty())
            f.parameters = tool.inputSchema;
        else
            f.parameters = Json{{"type", "object"},
                                {"properties", Json::object()},
                                {"required", Json::array()}};
        out.push_back(std::move(f));
    }
    return out;
}

std::optional<std::pair<std::string, std::string>>
McpToolset::resolve(const std::string& qualified) const
{
    if (!is_mcp_tool(qualified))
        return std::nullopt;
    const std::string rest = qualified.substr(std::string(kPrefix).size());

    auto servers = manager_.connected_servers();
    std::sort(servers.begin(), servers.end(),
              [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    for (const auto& server : servers)
    {
        if (rest.size() > server.size() + 1 && rest.compare(0, server.size(), server) == 0 &&
            rest[server.size()] == '_')
            return std::make_pair(server, rest.substr(server.size() + 1));
    }
    return std::nullopt;
}

ToolOutcome McpToolset::execute(const std::string& qualified, const Json& arguments)
{
    auto target = resolve(qualified);
    if (!target)
    {
        ToolOutcome outcome;
        outcome.error = "Unknown MCP tool '" + qualified + "'";
        return outcome;
    }
    return render(manager_.call_tool(target->first, target->second, arguments));
}

ToolOutcome McpToolset::call_by_tool_name(const std::string& tool, const Json& arguments)
{
    auto found = manager_.find_tool_by_name(tool);
    if (!found)
    {
        std::string names;
        for (const auto& t : manager_.get_all_tools())
            names += (names.empty() ? "" : ", ") + t.name;
        ToolOutcome outcome;
        outcome.error = "MCP tool '" + tool + "' not found. Available tools: " + names;
        return outcome;
    }
    return render(manager_.call_tool(found->serverName, tool, arguments));
}

ToolOutcome McpToolset::render(const client::CallToolResult& result)
{
    ToolOutcome outcome;
    if (result.isError)
    {
        std::string message = result.text();
        outcome.error = "MCP tool error: " + (message.empty() ? std::string("Unknown error") : message);
        return outcome;
    }

    std::string output;
    for (const auto& item : result.content)
    {
        if (item.type == "text" && item.text)
            output += *item.text + "\n";
        else if (item.type == "resource" && item.data)
            output += "[Resource: " + item.mimeType.value_or("unknown") + "]\n" + *item.data + "\n";
    }

    auto first = output.find_first_not_of(" \t\r\n");
    auto last = output.find_last_not_of(" \t\r\n");
    output = first == std::string::npos ? "" : output.substr(first, last - first + 1);

    outcome.success = true;
    outcome.output = output.empty() ? "Tool executed successfully (no output)" : output;
    return outcome;
}

std::string McpToolset::list_servers_text() const
{
    auto servers = manager_.connected_servers();
    if (servers.empty())
        return "No MCP servers are currently connected.";

    std::ostringstream out;
    out << "Connected MCP Servers:\n\n";
    for (const auto& server : servers)
    {
        auto info = manager_.server_info(server);
        auto tools = manager_.get_tools_by_server(server);
        out << "- " << server << "\n";
        if (info)
            out << "   Version: " << info->version << "\n";
        out << "   Tools: " << tools.size() << "\n";
        for (const auto& tool : tools)
        {
            out << "     * " << tool.name;
            if (tool.description && !tool.description->empty())
                out << " - " << *tool.description;
            out << "\n";
        }
        out << "\n";
    }
    return out.str();
}

std::string McpToolset::list_tools_text() const
{
    auto tools = manager_.get_all_tools();
    if (tools.empty())
        return "No MCP tools are currently available.";

    std::map<std::string, std::vector<client::ToolDescriptor>> by_server;
    for (auto& tool : tools)
        by_server[tool.serverName].push_back(std::move(tool));

    std::ostringstream out;
    out << "Available MCP Tools:\n\n";
    for (const auto& [server, server_tools] : by_server)
    {
        out << server << ":\n";
        for (const auto& tool : server_tools)
        {
            out << "   " << tool.name;
            if (tool.description && !tool.description->empty())
                out << " - " << *tool.description;
            out << "\n";
        }
        out << "\n";
    }
    return out.str();
}

} // namespace mcplink
