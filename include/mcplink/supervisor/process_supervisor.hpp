#pragma once
/// @file supervisor/process_supervisor.hpp
/// @brief Makes http-transport servers reachable and keeps them alive
/// @details For a descriptor with a command the supervisor picks a port, spawns
///          the server with PORT/MCP_PORT set, pings `/mcp` until it answers and
///          hands back a connected HttpClient. A monitor thread notices
///          unexpected exits and schedules restarts with capped exponential
///          backoff for as long as the descriptor stays enabled.

#include "mcplink/client/http_client.hpp"
#include "mcplink/config/registry.hpp"
#include "mcplink/settings.hpp"
#include "mcplink/supervisor/port_allocator.hpp"
#include "mcplink/util/timer_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace mcplink::supervisor
{

/// Restart delay: min(max, base * 2^crashes)
struct BackoffPolicy
{
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds max{30000};

    /// @param crashes consecutive crashes before the current one
    std::chrono::milliseconds delay_for(int crashes) const;
};

struct SupervisorOptions
{
    std::chrono::milliseconds startup_timeout{10000};
    std::chrono::milliseconds probe_interval{500};
    std::chrono::milliseconds shutdown_grace{5000};
    /// How often running processes are polled for exit
    std::chrono::milliseconds monitor_interval{100};
    BackoffPolicy backoff;
    int port_range_start{3001};
    int port_range_end{3999};
    client::ClientOptions client;

    static SupervisorOptions from_settings(const Settings& settings);
};

enum class SupervisorEventKind
{
    Started,
    Crashed,
    RestartScheduled,
    Restarted,
    Stopped
};

std::string to_string(SupervisorEventKind kind);

struct SupervisorEvent
{
    SupervisorEventKind kind;
    std::string server;
    int port{0};
    /// Consecutive crashes so far
    int restart_count{0};
    /// Set for RestartScheduled
    std::chrono::milliseconds delay{0};
    /// Set for Crashed
    std::optional<int> exit_code;
    /// Set for Started and Restarted
    std::shared_ptr<client::HttpClient> client;
};

using SupervisorListener = std::function<void(const SupervisorEvent&)>;

struct ServerStats
{
    std::string name;
    int port{0};
    std::chrono::system_clock::time_point start_time;
    std::chrono::milliseconds uptime{0};
    int restart_count{0};
    bool connected{false};
};

class ProcessSupervisor
{
  public:
    explicit ProcessSupervisor(config::ServerRegistry& registry, SupervisorOptions options = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /// Returns the existing client when the server is already running and connected.
    /// @throws PortUnavailable, TransportStartError, ProcessCrashed, HandshakeError
    std::shared_ptr<client::HttpClient> start_http_server(const config::ServerDescriptor& descriptor);

    /// Disconnect, SIGTERM, SIGKILL after the grace period. Cancels a pending restart.
    void stop_http_server(const std::string& name);

    /// Start every enabled http descriptor concurrently; failures are logged
    void start_all_http_servers();
    void stop_all_http_servers();

    std::vector<std::string> running_servers() const;
    std::shared_ptr<client::HttpClient> get_http_client(const std::string& name) const;
    bool is_server_running(const std::string& name) const;

    /// Ping every running server
    std::map<std::string, bool> health_check() const;

    std::optional<ServerStats> server_stats(const std::string& name) const;

    /// Consecutive crashes since the last successful start
    int restart_count(const std::string& name) const;

    /// True while a restart is scheduled but has not fired
    bool restart_pending(const std::string& name) const;

    void set_listener(SupervisorListener listener);

    const SupervisorOptions& options() const
    {
        return options_;
    }

  private:
    struct RunningProcess;

    /// `restart_epoch` is set when a scheduled restart fires; a stop since then aborts it
    std::shared_ptr<client::HttpClient> start_internal(const config::ServerDescriptor& descriptor,
                                                       std::optional<std::uint64_t> restart_epoch);
    int allocate_port(const std::string& name);
    void schedule_restart(const std::string& name, std::uint64_t epoch);
    /// Timer callback: hands the attempt to its own thread
    void launch_restart(const std::string& name, std::uint64_t epoch);
    void restart(const std::string& name, std::uint64_t epoch);
    bool superseded(const std::string& name, std::uint64_t epoch) const;
    void teardown(RunningProcess& record);
    void monitor_loop();
    void emit(const SupervisorEvent& event);
    std::shared_ptr<std::mutex> start_mutex(const std::string& name);

    config::ServerRegistry& registry_;
    SupervisorOptions options_;
    PortAllocator ports_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<RunningProcess>> running_;
    std::map<std::string, int> restart_counts_;
    std::map<std::string, std::uint64_t> epochs_;
    std::map<std::string, util::TimerQueue::TimerId> restart_timers_;
    std::map<std::string, std::shared_ptr<std::mutex>> start_mutexes_;
    /// Restart attempt in flight per server
    std::map<std::string, std::future<void>> restarts_;
    /// Superseded attempts, reaped once finished
    std::vector<std::future<void>> retired_;
    SupervisorListener listener_;
    std::multiset<std::thread::id> emitting_;
    std::condition_variable emit_idle_;

    std::mutex port_mutex_;
    std::map<std::string, int> assigned_ports_;

    util::TimerQueue timers_;
    std::atomic<bool> stopping_{false};
    std::thread monitor_;
};

} // namespace mcplink::supervisor
