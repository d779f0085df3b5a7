#include "mcplink/supervisor/process_supervisor.hpp"

#include "../internal/process.hpp"
#include "mcplink/exceptions.hpp"
#include "mcplink/logging.hpp"

#include <algorithm>
#include <future>
#include <set>

namespace mcplink::supervisor
{

namespace
{
constexpr const char* kLog = "supervisor";

/// Set on threads that run a restart attempt
thread_local const ProcessSupervisor* restart_worker_of = nullptr;

void terminate_process(process::Process& proc, std::chrono::milliseconds grace,
                       const std::string& name)
{
    try
    {
        if (proc.shutdown(grace))
            log::warning(kLog, name + ": still alive after grace period, killed");
    }
    catch (const process::ProcessError& e)
    {
        log::warning(kLog, name + ": " + e.what());
    }
}

std::string local_endpoint(int port)
{
    return "http://127.0.0.1:" + std::to_string(port) + "/mcp";
}
} // namespace

struct ProcessSupervisor::RunningProcess
{
    config::ServerDescriptor descriptor;
    std::unique_ptr<process::Process> process; ///< null for externally managed servers
    std::shared_ptr<client::HttpClient> client;
    int port{0};
    std::chrono::system_clock::time_point start_time;
    std::chrono::steady_clock::time_point started_at;
};

std::chrono::milliseconds BackoffPolicy::delay_for(int crashes) const
{
    auto delay = base;
    for (int i = 0; i < crashes && delay < max; ++i)
        delay *= 2;
    return std::min(delay, max);
}

SupervisorOptions SupervisorOptions::from_settings(const Settings& settings)
{
    SupervisorOptions opts;
    opts.startup_timeout = settings.startup_timeout;
    opts.probe_interval = settings.probe_interval;
    opts.shutdown_grace = settings.shutdown_grace;
    opts.backoff.base = settings.restart_base_delay;
    opts.backoff.max = settings.restart_max_delay;
    opts.port_range_start = settings.port_range_start;
    opts.port_range_end = settings.port_range_end;
    opts.client = client::ClientOptions::from_settings(settings);
    return opts;
}

std::string to_string(SupervisorEventKind kind)
{
    switch (kind)
    {
    case SupervisorEventKind::Started:
        return "started";
    case SupervisorEventKind::Crashed:
        return "crashed";
    case SupervisorEventKind::RestartScheduled:
        return "restart-scheduled";
    case SupervisorEventKind::Restarted:
        return "restarted";
    case SupervisorEventKind::Stopped:
        return "stopped";
    }
    return "unknown";
}

ProcessSupervisor::ProcessSupervisor(config::ServerRegistry& registry, SupervisorOptions options)
    : registry_(registry), options_(std::move(options)),
      ports_(options_.port_range_start, options_.port_range_end)
{
    monitor_ = std::thread([this]() { monitor_loop(); });
}

ProcessSupervisor::~ProcessSupervisor()
{
    stopping_ = true;
    if (monitor_.joinable())
        monitor_.join();
    // No restart attempt is launched after this
    timers_.shutdown();

    std::vector<std::future<void>> attempts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, attempt] : restarts_)
            attempts.push_back(std::move(attempt));
        restarts_.clear();
        for (auto& attempt : retired_)
            attempts.push_back(std::move(attempt));
        retired_.clear();
    }
    // Attempts see stopping_ and give up; whatever got registered is stopped below
    for (auto& attempt : attempts)
        if (attempt.valid())
            attempt.wait();

    stop_all_http_servers();
}

std::shared_ptr<client::HttpClient>
ProcessSupervisor::start_http_server(const config::ServerDescriptor& descriptor)
{
    return start_internal(descriptor, std::nullopt);
}

std::shared_ptr<client::HttpClient>
ProcessSupervisor::start_internal(const config::ServerDescriptor& descriptor,
                                  std::optional<std::uint64_t> restart_epoch)
{
    const std::string& name = descriptor.name;
    if (descriptor.kind != TransportKind::Http)
        throw ValidationError("MCP server " + name + " does not use the http transport");

    auto serial_mutex = start_mutex(name);
    std::lock_guard<std::mutex> serial(*serial_mutex);

    std::unique_ptr<RunningProcess> stale;
    std::uint64_t epoch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        epoch = epochs_[name];
        if (restart_epoch && *restart_epoch != epoch)
            throw TransportStartError("Restart of " + name + " cancelled");

        auto it = running_.find(name);
        if (it != running_.end())
        {
            if (it->second->client && it->second->client->is_connected())
                return it->second->client;
            stale = std::move(it->second);
            running_.erase(it);
        }

        // An explicit start supersedes a scheduled restart
        auto timer = restart_timers_.find(name);
        if (timer != restart_timers_.end())
        {
            timers_.cancel(timer->second);
            restart_timers_.erase(timer);
        }
    }
    if (stale)
        teardown(*stale);

    auto record = std::make_unique<RunningProcess>();
    record->descriptor = descriptor;

    std::string endpoint;
    if (descriptor.command.empty())
    {
        if (descriptor.http_url.empty())
            throw TransportStartError("MCP server " + name + " has neither a command nor an httpUrl");
        endpoint = descriptor.http_url;
        record->port = descriptor.port.value_or(0);
        log::info(kLog, name + ": using externally managed endpoint " + endpoint);
    }
    else
    {
        int port = descriptor.port ? *descriptor.port : allocate_port(name);
        endpoint = local_endpoint(port);
        record->port = port;

        auto argv = config::command_line(descriptor);
        process::SpawnOptions opts;
        opts.environment = descriptor.env;
        opts.environment["PORT"] = std::to_string(port);
        opts.environment["MCP_PORT"] = std::to_string(port);
        opts.capture_stdout = false;
        if (options_.client.stderr_log)
            opts.stderr_path = options_.client.stderr_log->string();

        record->process = std::make_unique<process::Process>();
        try
        {
            record->process->spawn(argv.front(),
                                   std::vector<std::string>(argv.begin() + 1, argv.end()), opts);
        }
        catch (const process::ProcessError& e)
        {
            throw TransportStartError("Failed to spawn MCP server " + name + ": " + e.what());
        }
        log::info(kLog, name + ": spawned pid " + std::to_string(record->process->pid()) +
                            " on port " + std::to_string(port));

        auto crashed_during_startup = [&](int exit_code)
        {
            log::warning(kLog, name + ": exited during startup with code " +
                                   std::to_string(exit_code));
            schedule_restart(name, epoch);
            return ProcessCrashed("MCP server " + name + " exited during startup (code " +
                                      std::to_string(exit_code) + ")",
                                  exit_code);
        };

        // Ping until it answers, it dies, or time runs out
        auto probe_timeout = std::max(options_.probe_interval, std::chrono::milliseconds(1000));
        auto deadline = std::chrono::steady_clock::now() + options_.startup_timeout;
        while (true)
        {
            std::optional<int> exited;
            try
            {
                exited = record->process->try_wait();
            }
            catch (const process::ProcessError&)
            {
                exited = -1;
            }
            if (exited)
                throw crashed_during_startup(*exited);

            if (stopping_ || superseded(name, epoch))
            {
                terminate_process(*record->process, options_.shutdown_grace, name);
                throw TransportStartError("MCP server " + name + " was stopped during startup");
            }

            if (client::HttpClient::probe(endpoint, probe_timeout))
                break;

            if (std::chrono::steady_clock::now() >= deadline)
            {
                terminate_process(*record->process, options_.shutdown_grace, name);
                throw TransportStartError("MCP server " + name + " did not become ready within " +
                                          std::to_string(options_.startup_timeout.count()) + "ms");
            }
            std::this_thread::sleep_for(options_.probe_interval);
        }

        // Connect below may still lose the race with a dying process
        record->client = std::make_shared<client::HttpClient>(name, endpoint, options_.client);
        try
        {
            record->client->connect();
        }
        catch (const TransportError&)
        {
            std::optional<int> exited;
            try
            {
                exited = record->process->try_wait();
            }
            catch (const process::ProcessError&)
            {
                exited = -1;
            }
            if (exited)
                throw crashed_during_startup(*exited);
            terminate_process(*record->process, options_.shutdown_grace, name);
            throw;
        }
    }

    if (!record->client)
    {
        record->client = std::make_shared<client::HttpClient>(name, endpoint, options_.client);
        record->client->connect();
    }

    record->start_time = std::chrono::system_clock::now();
    record->started_at = std::chrono::steady_clock::now();

    auto client = record->client;
    int port = record->port;
    bool stopped_meanwhile = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (epochs_[name] != epoch)
        {
            stopped_meanwhile = true;
        }
        else
        {
            restart_counts_[name] = 0;
            running_[name] = std::move(record);
        }
    }
    if (stopped_meanwhile)
    {
        teardown(*record);
        throw TransportStartError("MCP server " + name + " was stopped during startup");
    }

    log::info(kLog, name + ": ready at " + endpoint);

    SupervisorEvent event;
    event.kind = restart_epoch ? SupervisorEventKind::Restarted : SupervisorEventKind::Started;
    event.server = name;
    event.port = port;
    event.client = client;
    emit(event);
    return client;
}

int ProcessSupervisor::allocate_port(const std::string& name)
{
    std::lock_guard<std::mutex> lock(port_mutex_);

    std::set<int> taken;
    for (const auto& d : registry_.list_all_servers())
        if (d.port && d.name != name)
            taken.insert(*d.port);
    for (const auto& [other, port] : assigned_ports_)
        if (other != name)
            taken.insert(port);
    {
        std::lock_guard<std::mutex> running_lock(mutex_);
        for (const auto& [other, record] : running_)
            if (record->port > 0)
                taken.insert(record->port);
    }

    int port = ports_.allocate(taken);
    assigned_ports_[name] = port;
    try
    {
        registry_.assign_port(name, port);
    }
    catch (const NotFoundError&)
    {
        log::debug(kLog, name + ": not in the registry, port " + std::to_string(port) +
                             " kept in memory only");
    }
    return port;
}

void ProcessSupervisor::schedule_restart(const std::string& name, std::uint64_t epoch)
{
    auto descriptor = registry_.find_server(name);
    if (!descriptor || !descriptor->enabled)
    {
        log::info(kLog, name + ": disabled, not restarting");
        return;
    }

    int crashes;
    std::chrono::milliseconds delay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || epochs_[name] != epoch)
            return;

        crashes = restart_counts_[name];
        delay = options_.backoff.delay_for(crashes);
        restart_counts_[name] = crashes + 1;

        auto timer = restart_timers_.find(name);
        if (timer != restart_timers_.end())
            timers_.cancel(timer->second);
        restart_timers_[name] =
            timers_.schedule(delay, [this, name, epoch]() { launch_restart(name, epoch); });
    }

    log::warning(kLog, name + ": restarting in " + std::to_string(delay.count()) + "ms (attempt " +
                           std::to_string(crashes + 1) + ")");

    SupervisorEvent event;
    event.kind = SupervisorEventKind::RestartScheduled;
    event.server = name;
    event.restart_count = crashes + 1;
    event.delay = delay;
    emit(event);
}

void ProcessSupervisor::launch_restart(const std::string& name, std::uint64_t epoch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    restart_timers_.erase(name);
    if (stopping_ || epochs_[name] != epoch)
        return;

    auto finished = [](const std::future<void>& attempt)
    { return attempt.wait_for(std::chrono::seconds(0)) == std::future_status::ready; };
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(), finished), retired_.end());

    // The attempt runs on its own thread so other servers' timers keep firing
    auto& slot = restarts_[name];
    if (slot.valid())
        retired_.push_back(std::move(slot));
    slot = std::async(std::launch::async,
                      [this, name, epoch]()
                      {
                          restart_worker_of = this;
                          restart(name, epoch);
                      });
}

void ProcessSupervisor::restart(const std::string& name, std::uint64_t epoch)
{
    if (stopping_ || superseded(name, epoch))
        return;

    auto descriptor = registry_.find_server(name);
    if (!descriptor || !descriptor->enabled || descriptor->kind != TransportKind::Http)
        return;

    try
    {
        start_internal(*descriptor, epoch);
    }
    catch (const ProcessCrashed& e)
    {
        // The next attempt is already scheduled
        log::warning(kLog, std::string("restart failed: ") + e.what());
    }
    catch (const std::exception& e)
    {
        // Keeps retrying at the capped interval; a stop bumps the epoch and ends this
        log::error(kLog, name + ": restart failed: " + e.what());
        schedule_restart(name, epoch);
    }
}

void ProcessSupervisor::stop_http_server(const std::string& name)
{
    std::unique_ptr<RunningProcess> record;
    std::future<void> attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++epochs_[name];
        auto timer = restart_timers_.find(name);
        if (timer != restart_timers_.end())
        {
            timers_.cancel(timer->second);
            restart_timers_.erase(timer);
        }
        restart_counts_[name] = 0;

        auto it = running_.find(name);
        if (it != running_.end())
        {
            record = std::move(it->second);
            running_.erase(it);
        }

        auto in_flight = restarts_.find(name);
        if (in_flight != restarts_.end())
        {
            attempt = std::move(in_flight->second);
            restarts_.erase(in_flight);
        }
    }

    // A restart past its timer sees the new epoch and gives up
    if (attempt.valid())
    {
        if (restart_worker_of == this)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            retired_.push_back(std::move(attempt));
        }
        else
        {
            attempt.wait();
        }
    }

    if (!record)
        return;

    teardown(*record);
    log::info(kLog, name + ": stopped");

    SupervisorEvent event;
    event.kind = SupervisorEventKind::Stopped;
    event.server = name;
    event.port = record->port;
    emit(event);
}

void ProcessSupervisor::teardown(RunningProcess& record)
{
    if (record.client)
        record.client->disconnect();
    if (record.process)
        terminate_process(*record.process, options_.shutdown_grace, record.descriptor.name);
}

void ProcessSupervisor::start_all_http_servers()
{
    std::vector<std::pair<std::string, std::future<void>>> tasks;
    for (const auto& d : registry_.list_enabled_servers())
    {
        if (d.kind != TransportKind::Http)
            continue;
        tasks.emplace_back(d.name, std::async(std::launch::async,
                                              [this, d]() { start_http_server(d); }));
    }

    for (auto& [name, task] : tasks)
    {
        try
        {
            task.get();
        }
        catch (const std::exception& e)
        {
            log::error(kLog, name + ": failed to start: " + e.what());
        }
    }
}

void ProcessSupervisor::stop_all_http_servers()
{
    std::set<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, record] : running_)
            names.insert(name);
        for (const auto& [name, timer] : restart_timers_)
            names.insert(name);
        for (const auto& [name, attempt] : restarts_)
            names.insert(name);
    }
    for (const auto& name : names)
        stop_http_server(name);
}

std::vector<std::string> ProcessSupervisor::running_servers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, record] : running_)
        names.push_back(name);
    return names;
}

std::shared_ptr<client::HttpClient> ProcessSupervisor::get_http_client(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(name);
    return it == running_.end() ? nullptr : it->second->client;
}

bool ProcessSupervisor::is_server_running(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.count(name) > 0;
}

std::map<std::string, bool> ProcessSupervisor::health_check() const
{
    std::vector<std::pair<std::string, std::shared_ptr<client::HttpClient>>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, record] : running_)
            clients.emplace_back(name, record->client);
    }

    std::map<std::string, bool> health;
    for (const auto& [name, client] : clients)
        health[name] = client && client->health_check();
    return health;
}

std::optional<ServerStats> ProcessSupervisor::server_stats(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(name);
    if (it == running_.end())
        return std::nullopt;

    const auto& record = *it->second;
    ServerStats stats;
    stats.name = name;
    stats.port = record.port;
    stats.start_time = record.start_time;
    stats.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - record.started_at);
    auto count = restart_counts_.find(name);
    stats.restart_count = count == restart_counts_.end() ? 0 : count->second;
    stats.connected = record.client && record.client->is_connected();
    return stats;
}

int ProcessSupervisor::restart_count(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = restart_counts_.find(name);
    return it == restart_counts_.end() ? 0 : it->second;
}

bool ProcessSupervisor::restart_pending(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return restart_timers_.count(name) > 0;
}

void ProcessSupervisor::set_listener(SupervisorListener listener)
{
    std::unique_lock<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
    // Calls into the old listener from other threads finish before this returns
    const auto self = std::this_thread::get_id();
    emit_idle_.wait(lock, [&]() { return emitting_.size() == emitting_.count(self); });
}

void ProcessSupervisor::emit(const SupervisorEvent& event)
{
    const auto self = std::this_thread::get_id();
    SupervisorListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!listener_)
            return;
        listener = listener_;
        emitting_.insert(self);
    }

    try
    {
        listener(event);
    }
    catch (const std::exception& e)
    {
        log::error(kLog, "listener failed on " + to_string(event.kind) + ": " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        emitting_.erase(emitting_.find(self));
    }
    emit_idle_.notify_all();
}

bool ProcessSupervisor::superseded(const std::string& name, std::uint64_t epoch) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = epochs_.find(name);
    return (it == epochs_.end() ? 0 : it->second) != epoch;
}

std::shared_ptr<std::mutex> ProcessSupervisor::start_mutex(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& m = start_mutexes_[name];
    if (!m)
        m = std::make_shared<std::mutex>();
    return m;
}

void ProcessSupervisor::monitor_loop()
{
    struct Exit
    {
        std::unique_ptr<RunningProcess> record;
        int exit_code;
        std::uint64_t epoch;
    };

    while (!stopping_)
    {
        std::this_thread::sleep_for(options_.monitor_interval);

        std::vector<Exit> exits;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = running_.begin(); it != running_.end();)
            {
                auto& record = it->second;
                if (!record->process)
                {
                    ++it;
                    continue;
                }
                std::optional<int> code;
                try
                {
                    code = record->process->try_wait();
                }
                catch (const process::ProcessError&)
                {
                    code = -1;
                }
                if (!code)
                {
                    ++it;
                    continue;
                }
                exits.push_back(Exit{std::move(record), *code, epochs_[it->first]});
                it = running_.erase(it);
            }
        }

        for (auto& exit : exits)
        {
            const std::string name = exit.record->descriptor.name;
            log::warning(kLog, name + ": exited unexpectedly with code " +
                                   std::to_string(exit.exit_code));
            // Drops its tools from every aggregate view right away
            exit.record->client->disconnect();

            SupervisorEvent event;
            event.kind = SupervisorEventKind::Crashed;
            event.server = name;
            event.port = exit.record->port;
            event.exit_code = exit.exit_code;
            event.restart_count = restart_count(name);
            emit(event);

            schedule_restart(name, exit.epoch);
        }
    }
}

} // namespace mcplink::supervisor
