// Spawning, probing and restarting the http fixture server

#include "mcplink/config/registry.hpp"
#include "mcplink/exceptions.hpp"
#include "mcplink/supervisor/process_supervisor.hpp"

#include <cassert>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#ifndef MCPLINK_HTTP_FIXTURE
#error "MCPLINK_HTTP_FIXTURE must point at the http fixture server"
#endif

using namespace std::chrono_literals;
using mcplink::Json;
using mcplink::TransportKind;
using mcplink::config::InMemoryServerRegistry;
using mcplink::config::ServerDescriptor;
using mcplink::supervisor::ProcessSupervisor;
using mcplink::supervisor::SupervisorEvent;
using mcplink::supervisor::SupervisorEventKind;
using mcplink::supervisor::SupervisorOptions;

namespace fs = std::filesystem;

namespace
{

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

std::string state_file(const std::string& tag)
{
    auto p = fs::temp_directory_path() /
             ("mcplink_supervisor_" + tag + "_" + std::to_string(::getpid()));
    fs::remove(p);
    return p.string();
}

SupervisorOptions fast_options()
{
    SupervisorOptions opts;
    opts.startup_timeout = 5000ms;
    opts.probe_interval = 50ms;
    opts.shutdown_grace = 1000ms;
    opts.monitor_interval = 20ms;
    opts.backoff.base = 100ms;
    opts.backoff.max = 2000ms;
    opts.port_range_start = 3401;
    opts.port_range_end = 3499;
    return opts;
}

/// Thread-safe event log with a blocking wait
class Recorder
{
  public:
    void operator()(const SupervisorEvent& e)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back({e, std::chrono::steady_clock::now()});
        }
        cv_.notify_all();
    }

    bool wait_for(SupervisorEventKind kind, size_t count, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return count_locked(kind) >= count; });
    }

    bool wait_for(SupervisorEventKind kind, const std::string& server,
                  std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout,
                            [&]
                            {
                                for (const auto& e : events_)
                                    if (e.first.kind == kind && e.first.server == server)
                                        return true;
                                return false;
                            });
    }

    /// Time of the first event of that kind for that server
    std::optional<std::chrono::steady_clock::time_point> first(SupervisorEventKind kind,
                                                               const std::string& server)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& e : events_)
            if (e.first.kind == kind && e.first.server == server)
                return e.second;
        return std::nullopt;
    }

    size_t count(SupervisorEventKind kind)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_locked(kind);
    }

    std::vector<std::pair<SupervisorEvent, std::chrono::steady_clock::time_point>> of(
        SupervisorEventKind kind)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::pair<SupervisorEvent, std::chrono::steady_clock::time_point>> out;
        for (const auto& e : events_)
            if (e.first.kind == kind)
                out.push_back(e);
        return out;
    }

  private:
    size_t count_locked(SupervisorEventKind kind) const
    {
        size_t n = 0;
        for (const auto& e : events_)
            if (e.first.kind == kind)
                ++n;
        return n;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::pair<SupervisorEvent, std::chrono::steady_clock::time_point>> events_;
};

} // namespace

int main()
{
    std::cout << "Test: two servers get distinct ports...\n";
    {
        InMemoryServerRegistry registry({http_fixture("alpha"), http_fixture("beta")});
        ProcessSupervisor supervisor(registry, fast_options());
        Recorder recorder;
        supervisor.set_listener(std::ref(recorder));

        auto a = supervisor.start_http_server(*registry.find_server("alpha"));
        auto b = supervisor.start_http_server(*registry.find_server("beta"));
        assert(a && a->is_connected());
        assert(b && b->is_connected());
        assert(a->get_server_info()->name == "alpha");
        assert(a->get_tools().size() == 6);

        auto sa = supervisor.server_stats("alpha");
        auto sb = supervisor.server_stats("beta");
        assert(sa && sb);
        assert(sa->port != sb->port);
        assert(sa->port >= 3401 && sa->port <= 3499);
        assert(sa->restart_count == 0);
        assert(sa->connected);

        // the assignment is written back to the registry
        assert(registry.find_server("alpha")->port == sa->port);
        assert(registry.find_server("beta")->port == sb->port);

        // starting again hands back the same client
        assert(supervisor.start_http_server(*registry.find_server("alpha")) == a);
        assert(recorder.count(SupervisorEventKind::Started) == 2);

        auto health = supervisor.health_check();
        assert(health.size() == 2);
        assert(health["alpha"] && health["beta"]);

        assert(a->call_tool("echo", Json{{"message", "hi"}}).text() == "hi");
        std::cout << "  [PASS] alpha/beta on separate ports\n";

        supervisor.stop_http_server("alpha");
        assert(!supervisor.is_server_running("alpha"));
        assert(!a->is_connected());
        assert(supervisor.is_server_running("beta"));
        assert(recorder.count(SupervisorEventKind::Stopped) == 1);
        assert(supervisor.running_servers() == std::vector<std::string>{"beta"});
        std::cout << "  [PASS] stop one leaves the other\n";
    }

    std::cout << "Test: crash three times, then come up...\n";
    {
        auto state = state_file("crash3");
        InMemoryServerRegistry registry(
            {http_fixture("flaky", "--crash-times 3 --state-file " + state)});
        ProcessSupervisor supervisor(registry, fast_options());
        Recorder recorder;
        supervisor.set_listener(std::ref(recorder));

        bool threw = false;
        try
        {
            supervisor.start_http_server(*registry.find_server("flaky"));
        }
        catch (const mcplink::ProcessCrashed& e)
        {
            threw = true;
            assert(e.exit_code() == 3);
        }
        assert(threw);

        assert(recorder.wait_for(SupervisorEventKind::Restarted, 1, 10s));
        auto scheduled = recorder.of(SupervisorEventKind::RestartScheduled);
        assert(scheduled.size() == 3);
        assert(scheduled[0].first.delay == 100ms);
        assert(scheduled[1].first.delay == 200ms);
        assert(scheduled[2].first.delay == 400ms);
        assert(scheduled[0].first.restart_count == 1);
        assert(scheduled[2].first.restart_count == 3);

        // the delays were actually waited out
        auto restarted = recorder.of(SupervisorEventKind::Restarted);
        assert(restarted.size() == 1);
        assert(restarted[0].second - scheduled[2].second >= 350ms);
        assert(restarted[0].first.client && restarted[0].first.client->is_connected());

        assert(supervisor.restart_count("flaky") == 0);
        assert(!supervisor.restart_pending("flaky"));
        assert(supervisor.get_http_client("flaky") == restarted[0].first.client);
        fs::remove(state);
        std::cout << "  [PASS] delays 100/200/400ms, counter reset\n";
    }

    std::cout << "Test: crash after ready is restarted...\n";
    {
        auto state = state_file("late");
        InMemoryServerRegistry registry(
            {http_fixture("late", "--crash-times 1 --crash-after-ms 800 --state-file " + state)});
        ProcessSupervisor supervisor(registry, fast_options());
        Recorder recorder;
        supervisor.set_listener(std::ref(recorder));

        auto first = supervisor.start_http_server(*registry.find_server("late"));
        assert(first->is_connected());

        assert(recorder.wait_for(SupervisorEventKind::Crashed, 1, 5s));
        assert(!first->is_connected());
        auto crashed = recorder.of(SupervisorEventKind::Crashed);
        assert(crashed[0].first.exit_code == 3);

        assert(recorder.wait_for(SupervisorEventKind::Restarted, 1, 5s));
        auto replacement = supervisor.get_http_client("late");
        assert(replacement && replacement != first);
        assert(replacement->is_connected());
        assert(supervisor.restart_count("late") == 0);
        fs::remove(state);
        std::cout << "  [PASS] replacement client handed out\n";
    }

    std::cout << "Test: manual stop cancels a scheduled restart...\n";
    {
        auto state = state_file("stop");
        auto opts = fast_options();
        opts.backoff.base = 600ms;
        InMemoryServerRegistry registry(
            {http_fixture("doomed", "--crash-times 5 --state-file " + state)});
        ProcessSupervisor supervisor(registry, opts);
        Recorder recorder;
        supervisor.set_listener(std::ref(recorder));

        bool threw = false;
        try
        {
            supervisor.start_http_server(*registry.find_server("doomed"));
        }
        catch (const mcplink::ProcessCrashed&)
        {
            threw = true;
        }
        assert(threw);
        assert(supervisor.restart_pending("doomed"));

        supervisor.stop_http_server("doomed");
        assert(!supervisor.restart_pending("doomed"));
        std::this_thread::sleep_for(1200ms);
        assert(recorder.count(SupervisorEventKind::RestartScheduled) == 1);
        assert(recorder.count(SupervisorEventKind::Restarted) == 0);
        assert(!supervisor.is_server_running("doomed"));
        fs::remove(state);
        std::cout << "  [PASS] no restart after stop\n";
    }

    std::cout << "Test: disabled servers are not restarted...\n";
    {
        auto state = state_file("disabled");
        InMemoryServerRegistry registry(
            {http_fixture("sleepy", "--crash-times 1 --crash-after-ms 600 --state-file " + state)});
        ProcessSupervisor supervisor(registry, fast_options());
        Recorder recorder;
        supervisor.set_listener(std::ref(recorder));

        supervisor.start_http_server(*registry.find_server("sleepy"));
        registry.set_server_enabled("sleepy", false);
        assert(recorder.wait_for(SupervisorEventKind::Crashed, 1, 5s));
        std::this_thread::sleep_for(400ms);
        assert(recorder.count(SupervisorEventKind::RestartScheduled) == 0);
        assert(!supervisor.restart_pending("sleepy"));
        fs::remove(state);
        std::cout << "  [PASS] crash while disabled stays down\n";
    }

    std::cout << "Test: server that never becomes ready...\n";
    {
        auto opts = fast_options();
        opts.startup_timeout = 600ms;
        InMemoryServerRegistry registry({http_fixture("mute", "--never-ready")});
        ProcessSupervisor supervisor(registry, opts);

        auto start = std::chrono::steady_clock::now();
        bool threw = false;
        try
        {
            supervisor.start_http_server(*registry.find_server("mute"));
        }
        catch (const mcplink::ProcessCrashed&)
        {
            assert(false && "never-ready server must time out, not crash");
        }
        catch (const mcplink::TransportStartError&)
        {
            threw = true;
        }
        assert(threw);
        assert(std::chrono::steady_clock::now() - start < 4s);
        assert(!supervisor.is_server_running("mute"));
        assert(!supervisor.restart_pending("mute"));
        std::cout << "  [PASS] startup timeout\n";
    }

    std::cout << "Test: start_all_http_servers isolates failures...\n";
    {
        auto state = state_file("all");
        auto bad = http_fixture("bad", "--crash-times 99 --state-file " + state);
        auto stdio = ServerDescriptor{};
        stdio.name = "not-http";
        stdio.command = "cat";
        auto off = http_fixture("off");
        off.enabled = false;

        InMemoryServerRegistry registry({http_fixture("good"), bad, stdio, off});
        auto opts = fast_options();
        opts.backoff.base = 5000ms;
        ProcessSupervisor supervisor(registry, opts);
        supervisor.start_all_http_servers();

        assert(supervisor.is_server_running("good"));
        assert(!supervisor.is_server_running("bad"));
        assert(!supervisor.is_server_running("not-http"));
        assert(!supervisor.is_server_running("off"));

        supervisor.stop_all_http_servers();
        assert(supervisor.running_servers().empty());
        assert(!supervisor.restart_pending("bad"));
        fs::remove(state);
        std::cout << "  [PASS] one failure does not block the rest\n";
    }

    std::cout << "Test: a slow restart does not hold up another server's restart...\n";
    {
        auto stall_state = state_file("stall");
        auto blip_state = state_file("blip");
        // stall: first start dies at once, the restart then takes 3s to listen
        InMemoryServerRegistry registry(
            {http_fixture("stall", "--crash-times 1 --startup-delay-ms 3000 --state-file " +
                                       stall_state),
             http_fixture("blip", "--crash-times 1 --crash-after-ms 400 --state-file " +
                                      blip_state)});
        ProcessSupervisor supervisor(registry, fast_options());
        Recorder recorder;
        supervisor.set_listener(std::ref(recorder));

        supervisor.start_http_server(*registry.find_server("blip"));
        bool threw = false;
        try
        {
            supervisor.start_http_server(*registry.find_server("stall"));
        }
        catch (const mcplink::ProcessCrashed&)
        {
            threw = true;
        }
        assert(threw);

        // blip crashes while stall's restart is still waiting for its server to listen
        assert(recorder.wait_for(SupervisorEventKind::Restarted, "blip", 2500ms));
        auto scheduled = recorder.first(SupervisorEventKind::RestartScheduled, "blip");
        auto restarted = recorder.first(SupervisorEventKind::Restarted, "blip");
        assert(scheduled && restarted);
        assert(*restarted - *scheduled < 1500ms);
        assert(!recorder.first(SupervisorEventKind::Restarted, "stall"));
        std::cout << "  [PASS] blip restarted on schedule\n";

        assert(recorder.wait_for(SupervisorEventKind::Restarted, "stall", 8s));
        assert(supervisor.is_server_running("stall"));
        assert(supervisor.is_server_running("blip"));
        fs::remove(stall_state);
        fs::remove(blip_state);
        std::cout << "  [PASS] stall came up afterwards\n";
    }

    std::cout << "Test: stop while a restart attempt is starting the server...\n";
    {
        auto state = state_file("abort");
        InMemoryServerRegistry registry(
            {http_fixture("slowpoke", "--crash-times 1 --startup-delay-ms 3000 --state-file " +
                                          state)});
        ProcessSupervisor supervisor(registry, fast_options());
        Recorder recorder;
        supervisor.set_listener(std::ref(recorder));

        bool threw = false;
        try
        {
            supervisor.start_http_server(*registry.find_server("slowpoke"));
        }
        catch (const mcplink::ProcessCrashed&)
        {
            threw = true;
        }
        assert(threw);

        // the 100ms timer has fired and the attempt is probing
        std::this_thread::sleep_for(500ms);
        assert(!supervisor.restart_pending("slowpoke"));

        auto before = std::chrono::steady_clock::now();
        supervisor.stop_http_server("slowpoke");
        assert(std::chrono::steady_clock::now() - before < 2500ms);
        assert(!supervisor.is_server_running("slowpoke"));

        std::this_thread::sleep_for(3500ms);
        assert(recorder.count(SupervisorEventKind::Restarted) == 0);
        assert(!supervisor.is_server_running("slowpoke"));
        fs::remove(state);
        std::cout << "  [PASS] attempt abandoned, nothing left running\n";
    }

    std::cout << "\n=== All process supervisor tests passed ===\n";
    return 0;
}
