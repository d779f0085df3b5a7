#include "mcplink.hpp"
#include "mcplink/util/json.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "mcplink " << mcplink::LIBRARY_VERSION << "\n";
    std::cout << "Usage:\n";
    std::cout << "  mcplink --help\n";
    std::cout << "  mcplink --config <file> servers\n";
    std::cout << "  mcplink --config <file> tools\n";
    std::cout << "  mcplink --config <file> call <server> <tool> [json-arguments]\n";
    std::cout << "  mcplink --config <file> enable <name>\n";
    std::cout << "  mcplink --config <file> disable <name>\n";
    std::cout << "  mcplink --config <file> health\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  MCPLINK_LOG_LEVEL            DEBUG, INFO, WARNING or ERROR\n";
    std::cout << "  MCPLINK_REQUEST_TIMEOUT_MS   Per-request reply deadline\n";
    std::cout << "  MCPLINK_STARTUP_TIMEOUT_MS   Readiness deadline for supervised servers\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static void print_status(mcplink::manager::Manager& manager)
{
    for (const auto& row : manager.server_status())
    {
        std::cout << row.name << "  " << mcplink::to_string(row.kind) << "  "
                  << (row.enabled ? "enabled" : "disabled") << "  "
                  << mcplink::to_string(row.state);
        if (!row.description.empty())
            std::cout << "  " << row.description;
        std::cout << "\n";
    }
}

static int run(std::vector<std::string> args)
{
    auto config_path = consume_flag_value(args, "--config");
    if (!config_path || args.empty())
        return usage();

    auto settings = mcplink::Settings::from_env();
    mcplink::log::set_level(mcplink::log::level_from_string(settings.log_level));

    mcplink::config::JsonFileServerRegistry registry(*config_path);
    mcplink::supervisor::ProcessSupervisor supervisor(
        registry, mcplink::supervisor::SupervisorOptions::from_settings(settings));
    mcplink::manager::Manager manager(registry, supervisor,
                                      mcplink::client::ClientOptions::from_settings(settings));
    mcplink::McpToolset toolset(manager);

    const std::string cmd = args[0];
    if (cmd == "servers")
    {
        manager.initialize_all_servers();
        print_status(manager);
        std::cout << "\n" << toolset.list_servers_text() << "\n";
        return 0;
    }

    if (cmd == "tools")
    {
        manager.initialize_all_servers();
        std::cout << toolset.list_tools_text() << "\n";
        return 0;
    }

    if (cmd == "call")
    {
        if (args.size() < 3)
            return usage();
        mcplink::Json arguments = mcplink::Json::object();
        if (args.size() >= 4)
        {
            arguments = mcplink::Json::parse(args[3], nullptr, false);
            if (arguments.is_discarded() || !arguments.is_object())
            {
                std::cerr << "Arguments must be a JSON object\n";
                return 1;
            }
        }
        auto descriptor = registry.find_server(args[1]);
        if (!descriptor)
        {
            std::cerr << "Unknown MCP server: " << args[1] << "\n";
            return 1;
        }
        manager.connect_to_server(*descriptor);
        auto result = manager.call_tool(args[1], args[2], arguments);
        std::cout << mcplink::util::json::dump_pretty(mcplink::Json(result)) << "\n";
        return result.isError ? 1 : 0;
    }

    if (cmd == "enable" || cmd == "disable")
    {
        if (args.size() < 2)
            return usage();
        bool ok = manager.set_server_enabled(args[1], cmd == "enable");
        print_status(manager);
        return ok ? 0 : 1;
    }

    if (cmd == "health")
    {
        manager.initialize_all_servers();
        bool all_ok = true;
        for (const auto& [name, healthy] : supervisor.health_check())
        {
            std::cout << name << "  " << (healthy ? "healthy" : "unhealthy") << "\n";
            all_ok = all_ok && healthy;
        }
        for (const auto& d : manager.enabled_servers())
        {
            if (d.kind != mcplink::TransportKind::Stdio)
                continue;
            bool connected = manager.is_server_connected(d.name);
            std::cout << d.name << "  " << (connected ? "connected" : "disconnected") << "\n";
            all_ok = all_ok && connected;
        }
        return all_ok ? 0 : 1;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return usage();
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty())
        return usage();
    if (args[0] == "--help" || args[0] == "-h")
        return usage(0);

    try
    {
        return run(std::move(args));
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
