// Manager over a mix of stdio and supervised http fixture servers

#include "mcplink/config/registry.hpp"
#include "mcplink/exceptions.hpp"
#include "mcplink/manager/manager.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#ifndef MCPLINK_STDIO_FIXTURE
#error "MCPLINK_STDIO_FIXTURE must point at the stdio fixture server"
#endif
#ifndef MCPLINK_HTTP_FIXTURE
#error "MCPLINK_HTTP_FIXTURE must point at the http fixture server"
#endif

using namespace std::chrono_literals;
using mcplink::ConnectionState;
using mcplink::Json;
using mcplink::TransportKind;
using mcplink::config::InMemoryServerRegistry;
using mcplink::config::ServerDescriptor;
using mcplink::manager::Manager;
using mcplink::manager::StatusEvent;
using mcplink::supervisor::ProcessSupervisor;
using mcplink::supervisor::SupervisorOptions;

namespace fs = std::filesystem;

namespace
{

ServerDescriptor stdio_fixture(const std::string& name, const std::string& extra = "")
{
    ServerDescriptor d;
    d.name = name;
    d.command = std::string(MCPLINK_STDIO_FIXTURE) + " --name " + name;
    if (!extra.empty())
        d.command += " " + extra;
    d.description = "stdio fixture " + name;
    return d;
}

ServerDescriptor http_fixture(const std::string& name, const std::string& extra = "")
{
    ServerDescriptor d;
    d.name = name;
    d.kind = TransportKind::Http;
    d.command = std::string(MCPLINK_HTTP_FIXTURE) + " --name " + name;
    if (!extra.empty())
        d.command += " " + extra;
    return d;
}

SupervisorOptions fast_options()
{
    SupervisorOptions opts;
    opts.startup_timeout = 5000ms;
    opts.probe_interval = 50ms;
    opts.shutdown_grace = 1000ms;
    opts.monitor_interval = 20ms;
    opts.backoff.base = 100ms;
    opts.port_range_start = 3501;
    opts.port_range_end = 3599;
    return opts;
}

size_t count_for(const std::vector<mcplink::client::ToolDescriptor>& tools, const std::string& server)
{
    size_t n = 0;
    for (const auto& t : tools)
        if (t.serverName == server)
            ++n;
    return n;
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(20ms);
    }
    return pred();
}

} // namespace

int main()
{
    std::cout << "Test: aggregate catalog over healthy and broken servers...\n";
    {
        ServerDescriptor broken;
        broken.name = "broken";
        broken.command = "/nonexistent/mcp-server";
        auto off = stdio_fixture("off");
        off.enabled = false;

        InMemoryServerRegistry registry(
            {stdio_fixture("fs"), stdio_fixture("notes"), broken, off, http_fixture("web")});
        ProcessSupervisor supervisor(registry, fast_options());
        Manager manager(registry, supervisor);

        std::mutex events_mutex;
        std::vector<StatusEvent> events;
        manager.set_status_listener(
            [&](const StatusEvent& e)
            {
                std::lock_guard<std::mutex> lock(events_mutex);
                events.push_back(e);
            });

        assert(manager.initialize_all_servers() == 3);
        assert(manager.is_server_connected("fs"));
        assert(manager.is_server_connected("notes"));
        assert(manager.is_server_connected("web"));
        assert(!manager.is_server_connected("broken"));
        assert(!manager.is_server_connected("off"));
        assert(manager.connection_state("broken") == ConnectionState::Failed);
        assert(manager.connection_state("off") == ConnectionState::Disconnected);
        assert(manager.connected_servers().size() == 3);
        std::cout << "  [PASS] one bad server does not block the batch\n";

        auto tools = manager.get_all_tools();
        assert(tools.size() == 18);
        assert(count_for(tools, "fs") == 6);
        assert(count_for(tools, "web") == 6);
        assert(manager.get_tools_by_server("notes").size() == 6);
        assert(manager.get_tools_by_server("broken").empty());
        assert(manager.server_info("web")->name == "web");
        assert(!manager.server_info("broken"));

        auto found = manager.find_tool_by_name("read_file");
        assert(found);
        assert(!found->serverName.empty());
        assert(!manager.find_tool_by_name("no_such_tool"));
        std::cout << "  [PASS] catalog and lookup\n";

        auto r = manager.call_tool("notes", "echo", Json{{"message", "routed"}});
        assert(!r.isError && r.text() == "routed");
        r = manager.call_tool("web", "add", Json{{"a", 1}, {"b", 2}});
        assert(r.text() == "3");
        r = manager.call_tool("ghost", "echo", Json::object());
        assert(r.isError);
        assert(r.text() == "MCP server 'ghost' not found or not connected");
        r = manager.call_tool("fs", "fail", Json::object());
        assert(r.isError);
        assert(r.text().find("tool exploded") != std::string::npos);
        std::cout << "  [PASS] call routing\n";

        auto rows = manager.server_status();
        assert(rows.size() == 5);
        for (const auto& row : rows)
        {
            if (row.name == "fs")
            {
                assert(row.connected && row.enabled);
                assert(row.description == "stdio fixture fs");
            }
            if (row.name == "broken")
                assert(row.state == ConnectionState::Failed && !row.connected);
            if (row.name == "off")
                assert(!row.enabled && row.state == ConnectionState::Disconnected);
            if (row.name == "web")
                assert(row.kind == TransportKind::Http);
        }
        std::cout << "  [PASS] server_status\n";

        // A dying server drops out of the catalog at once and never throws at the caller
        r = manager.call_tool("fs", "crash", Json::object());
        assert(r.isError);
        assert(r.text().find("Error calling tool") == 0);
        assert(manager.connection_state("fs") == ConnectionState::Disconnected);
        assert(count_for(manager.get_all_tools(), "fs") == 0);
        assert(manager.get_all_tools().size() == 12);
        r = manager.call_tool("fs", "echo", Json::object());
        assert(r.isError);
        assert(r.text() == "MCP server 'fs' is not connected");
        std::cout << "  [PASS] crashed server removed from the catalog\n";

        manager.refresh_connections();
        assert(manager.is_server_connected("fs"));
        assert(manager.get_all_tools().size() == 18);
        std::cout << "  [PASS] refresh reconnects\n";

        assert(manager.set_server_enabled("notes", false));
        assert(!manager.is_server_connected("notes"));
        assert(!registry.find_server("notes")->enabled);
        assert(manager.get_all_tools().size() == 12);
        assert(manager.set_server_enabled("notes", true));
        assert(manager.is_server_connected("notes"));
        assert(manager.get_all_tools().size() == 18);
        assert(!manager.set_server_enabled("nobody", true));
        std::cout << "  [PASS] disable and enable\n";

        assert(manager.set_server_enabled("web", false));
        assert(!supervisor.is_server_running("web"));
        assert(manager.get_all_tools().size() == 12);
        assert(manager.set_server_enabled("web", true));
        assert(supervisor.is_server_running("web"));
        std::cout << "  [PASS] disabling an http server stops its process\n";

        // disabled in the registry behind the manager's back
        registry.set_server_enabled("notes", false);
        manager.refresh_connections();
        assert(!manager.is_server_connected("notes"));
        std::cout << "  [PASS] refresh drops disabled servers\n";

        {
            std::lock_guard<std::mutex> lock(events_mutex);
            bool saw_failed = false;
            bool saw_ready = false;
            for (const auto& e : events)
            {
                if (e.server == "broken" && e.state == ConnectionState::Failed)
                    saw_failed = true;
                if (e.server == "fs" && e.state == ConnectionState::Ready)
                    saw_ready = true;
            }
            assert(saw_failed && saw_ready);
        }
        std::cout << "  [PASS] status events\n";

        manager.disconnect_all();
        assert(manager.connected_servers().empty());
        assert(supervisor.running_servers().empty());
        std::cout << "  [PASS] disconnect_all\n";
    }

    std::cout << "Test: concurrent connects share one attempt...\n";
    {
        InMemoryServerRegistry registry({stdio_fixture("shared")});
        ProcessSupervisor supervisor(registry, fast_options());
        Manager manager(registry, supervisor);
        auto d = *registry.find_server("shared");

        auto a = std::async(std::launch::async, [&] { return manager.connect_to_server(d); });
        auto b = std::async(std::launch::async, [&] { return manager.connect_to_server(d); });
        auto ca = a.get();
        auto cb = b.get();
        assert(ca == cb);
        assert(manager.connect_to_server(d) == ca);
        std::cout << "  [PASS] same client returned\n";
    }

    std::cout << "Test: supervised restart flows back into the catalog...\n";
    {
        auto state = (fs::temp_directory_path() /
                      ("mcplink_manager_restart_" + std::to_string(::getpid())))
                         .string();
        fs::remove(state);

        InMemoryServerRegistry registry(
            {http_fixture("phoenix", "--crash-times 1 --crash-after-ms 700 --state-file " + state)});
        ProcessSupervisor supervisor(registry, fast_options());
        Manager manager(registry, supervisor);

        std::atomic<int> restarts{0};
        manager.set_status_listener(
            [&](const StatusEvent& e)
            {
                if (e.server == "phoenix" && e.message == "restarted")
                    ++restarts;
            });

        auto first = manager.connect_to_server(*registry.find_server("phoenix"));
        assert(first->is_connected());
        assert(manager.get_all_tools().size() == 6);

        assert(eventually([&] { return !first->is_connected(); }, 5s));
        assert(eventually([&] { return restarts.load() == 1; }, 5s));
        assert(manager.is_server_connected("phoenix"));
        assert(manager.get_all_tools().size() == 6);
        auto r = manager.call_tool("phoenix", "echo", Json{{"message", "back"}});
        assert(r.text() == "back");
        fs::remove(state);
        std::cout << "  [PASS] replacement client registered\n";
    }

    std::cout << "Test: disabling a server while it is still connecting...\n";
    {
        InMemoryServerRegistry registry({stdio_fixture("lagging", "--startup-delay-ms 800"),
                                         http_fixture("lagging-web", "--startup-delay-ms 800")});
        ProcessSupervisor supervisor(registry, fast_options());
        Manager manager(registry, supervisor);

        for (const std::string name : {"lagging", "lagging-web"})
        {
            auto d = *registry.find_server(name);
            auto attempt = std::async(std::launch::async, [&] { return manager.connect_to_server(d); });
            assert(eventually([&] { return manager.connection_state(name) == ConnectionState::Connecting; },
                              2s));
            std::this_thread::sleep_for(200ms);

            assert(manager.set_server_enabled(name, false));
            bool threw = false;
            try
            {
                attempt.get();
            }
            catch (const mcplink::TransportError&)
            {
                threw = true;
            }
            assert(threw);

            assert(!manager.is_server_connected(name));
            assert(manager.connection_state(name) == ConnectionState::Disconnected);
            assert(count_for(manager.get_all_tools(), name) == 0);
            assert(!supervisor.is_server_running(name));

            // stays down: nothing late brings it back
            std::this_thread::sleep_for(1000ms);
            assert(!manager.is_server_connected(name));
            assert(manager.get_all_tools().empty());
        }
        std::cout << "  [PASS] stdio and http connects discarded\n";

        assert(manager.set_server_enabled("lagging", true));
        assert(manager.is_server_connected("lagging"));
        assert(count_for(manager.get_all_tools(), "lagging") == 6);
        std::cout << "  [PASS] re-enabling connects normally\n";
    }

    std::cout << "Test: destroying the manager while a server crash-loops...\n";
    {
        auto state = (fs::temp_directory_path() /
                      ("mcplink_manager_loop_" + std::to_string(::getpid())))
                         .string();
        fs::remove(state);

        InMemoryServerRegistry registry(
            {http_fixture("looper", "--crash-times 100000 --state-file " + state)});
        auto opts = fast_options();
        opts.backoff.base = 10ms;
        opts.backoff.max = 20ms;
        ProcessSupervisor supervisor(registry, opts);

        std::atomic<int> notifications{0};
        for (int round = 0; round < 5; ++round)
        {
            {
                Manager manager(registry, supervisor);
                manager.set_status_listener(
                    [&](const StatusEvent&)
                    {
                        // widens the window in which a callback is running
                        std::this_thread::sleep_for(5ms);
                        ++notifications;
                    });

                bool threw = false;
                try
                {
                    manager.connect_to_server(*registry.find_server("looper"));
                }
                catch (const mcplink::ProcessCrashed&)
                {
                    threw = true;
                }
                assert(threw);
                std::this_thread::sleep_for(std::chrono::milliseconds(50 + 40 * round));
            }

            // nothing reaches a manager that is gone
            int after = notifications.load();
            std::this_thread::sleep_for(150ms);
            assert(notifications.load() == after);
            assert(!supervisor.restart_pending("looper"));
        }
        assert(notifications.load() > 0);
        assert(supervisor.running_servers().empty());
        fs::remove(state);
        std::cout << "  [PASS] no callbacks after destruction\n";
    }

    std::cout << "\n=== All manager tests passed ===\n";
    return 0;
}
