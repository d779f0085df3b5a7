// Connect every enabled server from a config file, list tools, call one.
//
//   mcplink_example_quick_start servers.json fs read_file '{"path":"/etc/hostname"}'

#include <iostream>
#include <mcplink.hpp>

int main(int argc, char** argv)
{
    using namespace mcplink;

    if (argc < 2)
    {
        std::cerr << "usage: " << argv[0] << " <servers.json> [server tool [json-args]]\n";
        return 2;
    }

    try
    {
        auto settings = Settings::from_env();
        log::set_level(log::level_from_string(settings.log_level));

        config::JsonFileServerRegistry registry(argv[1]);
        supervisor::ProcessSupervisor supervisor(registry,
                                                 supervisor::SupervisorOptions::from_settings(settings));
        manager::Manager manager(registry, supervisor,
                                 client::ClientOptions::from_settings(settings));

        size_t ready = manager.initialize_all_servers();
        std::cout << ready << " server(s) ready\n";

        McpToolset toolset(manager);
        std::cout << toolset.list_tools_text();

        if (argc >= 4)
        {
            Json args = argc >= 5 ? Json::parse(argv[4]) : Json::object();
            auto outcome = toolset.render(manager.call_tool(argv[2], argv[3], args));
            std::cout << (outcome.success ? outcome.output : outcome.error) << "\n";
            return outcome.success ? 0 : 1;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
