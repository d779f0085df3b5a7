#pragma once
// Shared request handling for the example MCP servers. Both servers also act
// as fault-injection fixtures for the test suite.

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcplink::fixture
{

using Json = nlohmann::json;

struct Options
{
    std::string name{"fixture"};
    std::string root;              ///< First positional argument; read_file resolves against it
    bool garbage{false};           ///< Print non JSON-RPC lines around replies (stdio)
    bool no_resources{false};      ///< resources/list answers METHOD_NOT_FOUND
    bool paginate{false};          ///< tools/list returns one tool per page
    bool sse{false};               ///< Reply as text/event-stream (http)
    bool never_ready{false};       ///< ping answers 503 (http)
    bool ignore_sigterm{false};
    int crash_times{0};            ///< Exit this many starts in a row, counted in state_file
    std::string state_file;
    int crash_after_ms{-1};        ///< When crashing: exit after this long instead of at once
    int startup_delay_ms{0};       ///< Sleep before serving (http: before listening)
    int port{0};
};

inline Options parse_options(int argc, char** argv)
{
    Options o;
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& a = args[i];
        auto next = [&]() -> std::string { return i + 1 < args.size() ? args[++i] : ""; };
        if (a == "--name")
            o.name = next();
        else if (a == "--garbage")
            o.garbage = true;
        else if (a == "--no-resources")
            o.no_resources = true;
        else if (a == "--paginate")
            o.paginate = true;
        else if (a == "--sse")
            o.sse = true;
        else if (a == "--never-ready")
            o.never_ready = true;
        else if (a == "--ignore-sigterm")
            o.ignore_sigterm = true;
        else if (a == "--crash-times")
            o.crash_times = std::atoi(next().c_str());
        else if (a == "--state-file")
            o.state_file = next();
        else if (a == "--crash-after-ms")
            o.crash_after_ms = std::atoi(next().c_str());
        else if (a == "--startup-delay-ms")
            o.startup_delay_ms = std::atoi(next().c_str());
        else if (a == "--port")
            o.port = std::atoi(next().c_str());
        else if (o.root.empty() && !a.empty() && a[0] != '-')
            o.root = a;
    }

    if (o.port == 0)
    {
        if (const char* p = std::getenv("MCP_PORT"))
            o.port = std::atoi(p);
        else if (const char* p2 = std::getenv("PORT"))
            o.port = std::atoi(p2);
    }
    return o;
}

/// True when this start should crash. Bumps the counter in state_file.
inline bool should_crash(const Options& o)
{
    if (o.crash_times <= 0 || o.state_file.empty())
        return false;
    int count = 0;
    {
        std::ifstream in(o.state_file);
        if (in)
            in >> count;
    }
    if (count >= o.crash_times)
        return false;
    std::ofstream out(o.state_file, std::ios::trunc);
    out << (count + 1);
    return true;
}

inline Json text_result(const std::string& text, bool is_error = false)
{
    return Json{{"content", Json::array({Json{{"type", "text"}, {"text", text}}})},
                {"isError", is_error}};
}

inline Json tool_list()
{
    return Json::array(
        {Json{{"name", "read_file"},
              {"description", "Read a text file"},
              {"inputSchema",
               {{"type", "object"},
                {"properties", {{"path", {{"type", "string"}}}}},
                {"required", Json::array({"path"})}}}},
         Json{{"name", "echo"},
              {"description", "Echo the message back"},
              {"inputSchema",
               {{"type", "object"}, {"properties", {{"message", {{"type", "string"}}}}}}}},
         Json{{"name", "add"},
              {"description", "Add two numbers"},
              {"inputSchema",
               {{"type", "object"},
                {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}}}}},
         Json{{"name", "sleep"},
              {"description", "Reply after `ms` milliseconds"},
              {"inputSchema", {{"type", "object"}, {"properties", {{"ms", {{"type", "integer"}}}}}}}},
         Json{{"name", "fail"}, {"description", "Always answers with a JSON-RPC error"}},
         Json{{"name", "crash"}, {"description", "Exit the server process"}}});
}

inline Json error_reply(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

/// Reply to one request; std::nullopt for notifications. "crash" exits the process.
inline std::optional<Json> handle(const Json& msg, const Options& o)
{
    if (!msg.is_object() || !msg.contains("method"))
        return std::nullopt;
    if (!msg.contains("id"))
        return std::nullopt;

    const Json id = msg["id"];
    const std::string method = msg.value("method", "");
    const Json params = msg.value("params", Json::object());
    auto ok = [&](Json result) { return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}; };

    if (method == "initialize")
        return ok({{"protocolVersion", "2024-11-05"},
                   {"capabilities", {{"tools", Json::object()}}},
                   {"serverInfo", {{"name", o.name}, {"version", "0.3.1"}}}});

    if (method == "ping")
        return ok(Json::object());

    if (method == "tools/list")
    {
        Json tools = tool_list();
        if (!o.paginate)
            return ok({{"tools", tools}});
        size_t page = 0;
        if (params.contains("cursor") && params["cursor"].is_string())
            page = static_cast<size_t>(std::atoi(params["cursor"].get<std::string>().c_str()));
        Json result = {{"tools", Json::array({tools.at(page)})}};
        if (page + 1 < tools.size())
            result["nextCursor"] = std::to_string(page + 1);
        return ok(result);
    }

    if (method == "resources/list")
    {
        if (o.no_resources)
            return error_reply(id, -32601, "Method not found: resources/list");
        return ok({{"resources", Json::array({Json{{"uri", "file:///readme"},
                                                    {"name", "readme"},
                                                    {"mimeType", "text/plain"}}})}});
    }

    if (method == "tools/call")
    {
        const std::string tool = params.value("name", "");
        const Json args = params.value("arguments", Json::object());

        if (tool == "read_file")
        {
            std::string path = args.value("path", "");
            if (!path.empty() && path[0] != '/' && !o.root.empty())
                path = o.root + "/" + path;
            std::ifstream in(path);
            if (!in)
                return ok(text_result("No such file: " + path, true));
            std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            return ok(text_result(content));
        }
        if (tool == "echo")
            return ok(text_result(args.value("message", "")));
        if (tool == "add")
            return ok(text_result(std::to_string(args.value("a", 0) + args.value("b", 0))));
        if (tool == "sleep")
        {
            int ms = args.value("ms", 0);
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            return ok(text_result("slept " + std::to_string(ms)));
        }
        if (tool == "fail")
            return error_reply(id, -32603, "tool exploded");
        if (tool == "crash")
            std::_Exit(7);
        return error_reply(id, -32602, "Unknown tool: " + tool);
    }

    return error_reply(id, -32601, "Method not found: " + method);
}

} // namespace mcplink::fixture
