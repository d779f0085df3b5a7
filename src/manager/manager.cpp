#include "mcplink/manager/manager.hpp"

#include "mcplink/client/stdio_client.hpp"
#include "mcplink/exceptions.hpp"
#include "mcplink/logging.hpp"

#include <utility>

namespace mcplink::manager
{

namespace
{
constexpr const char* kLog = "manager";
}

Manager::Manager(config::ServerRegistry& registry, supervisor::ProcessSupervisor& supervisor,
                 client::ClientOptions client_options)
    : registry_(registry), supervisor_(supervisor), client_options_(std::move(client_options))
{
    supervisor_.set_listener([this](const supervisor::SupervisorEvent& event)
                             { on_supervisor_event(event); });
}

Manager::~Manager()
{
    supervisor_.set_listener(nullptr);
    disconnect_all();
}

std::shared_ptr<client::TransportClient>
Manager::connect_to_server(const config::ServerDescriptor& descriptor)
{
    const std::string& name = descriptor.name;

    std::promise<ClientPtr> promise;
    std::shared_future<ClientPtr> in_progress;
    ClientPtr stale;
    std::uint64_t epoch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        epoch = epochs_[name];
        auto it = clients_.find(name);
        if (it != clients_.end() && it->second->is_connected())
            return it->second;

        auto pending = connecting_.find(name);
        if (pending != connecting_.end())
        {
            in_progress = pending->second;
        }
        else
        {
            connecting_[name] = promise.get_future().share();
            failed_.erase(name);
            if (it != clients_.end())
            {
                stale = std::move(it->second);
                clients_.erase(it);
            }
        }
    }

    // Someone else is already connecting this server; share their outcome
    if (in_progress.valid())
        return in_progress.get();

    if (stale)
    {
        stale->set_state_listener(nullptr);
        if (stale->kind() == TransportKind::Stdio)
            stale->disconnect();
    }

    notify(name, ConnectionState::Connecting, "connecting");
    try
    {
        auto client = open_client(descriptor);
        if (!register_client(name, client, epoch))
        {
            // Disconnected or disabled while the attempt was running
            client->set_state_listener(nullptr);
            client->disconnect();
            throw TransportStartError("MCP server " + name + " was disconnected while connecting");
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connecting_.erase(name);
        }
        promise.set_value(client);
        log::info(kLog, name + ": connected via " + to_string(descriptor.kind));
        notify(name, ConnectionState::Ready, "connected");
        return client;
    }
    catch (const std::exception& e)
    {
        bool cancelled;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connecting_.erase(name);
            cancelled = epochs_[name] != epoch;
            if (!cancelled)
                failed_.insert(name);
        }
        promise.set_exception(std::current_exception());
        if (cancelled)
        {
            log::info(kLog, name + ": connect abandoned: " + e.what());
            notify(name, ConnectionState::Disconnected, "disconnected");
        }
        else
        {
            log::error(kLog, name + ": failed to connect: " + e.what());
            notify(name, ConnectionState::Failed, e.what());
        }
        throw;
    }
}

Manager::ClientPtr Manager::open_client(const config::ServerDescriptor& descriptor)
{
    if (descriptor.kind == TransportKind::Http)
        return supervisor_.start_http_server(descriptor);

    auto client = std::make_shared<client::StdioClient>(descriptor, client_options_);
    client->connect();
    return client;
}

bool Manager::register_client(const std::string& name, const ClientPtr& client,
                              std::optional<std::uint64_t> epoch)
{
    client->set_state_listener(
        [this](const std::string& server, ConnectionState /*from*/, ConnectionState to)
        { notify(server, to, to_string(to)); });

    ClientPtr previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (epoch && epochs_[name] != *epoch)
            return false;
        auto& slot = clients_[name];
        if (slot != client)
            previous = std::exchange(slot, client);
        failed_.erase(name);
    }
    if (previous)
        previous->set_state_listener(nullptr);
    return true;
}

size_t Manager::initialize_all_servers()
{
    auto servers = registry_.list_enabled_servers();
    log::info(kLog, "connecting " + std::to_string(servers.size()) + " enabled MCP server(s)");

    std::vector<std::pair<std::string, std::future<ClientPtr>>> tasks;
    for (const auto& d : servers)
        tasks.emplace_back(d.name, std::async(std::launch::async,
                                              [this, d]() { return connect_to_server(d); }));

    size_t ready = 0;
    for (auto& [name, task] : tasks)
    {
        try
        {
            if (task.get()->is_connected())
                ++ready;
        }
        catch (const std::exception& e)
        {
            // Already logged by connect_to_server; the batch carries on
            log::debug(kLog, name + ": skipped: " + e.what());
        }
    }
    log::info(kLog, std::to_string(ready) + "/" + std::to_string(servers.size()) +
                        " MCP server(s) ready");
    return ready;
}

void Manager::refresh_connections()
{
    auto enabled = registry_.list_enabled_servers();
    std::set<std::string> enabled_names;
    for (const auto& d : enabled)
        enabled_names.insert(d.name);

    // Snapshot first; disconnect_from_server mutates the map
    std::vector<std::string> known;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, client] : clients_)
            known.push_back(name);
    }
    for (const auto& name : supervisor_.running_servers())
        known.push_back(name);

    for (const auto& name : known)
        if (!enabled_names.count(name))
            disconnect_from_server(name);

    std::vector<std::pair<std::string, std::future<ClientPtr>>> tasks;
    for (const auto& d : enabled)
    {
        if (is_server_connected(d.name))
            continue;
        tasks.emplace_back(d.name, std::async(std::launch::async,
                                              [this, d]() { return connect_to_server(d); }));
    }
    for (auto& [name, task] : tasks)
    {
        try
        {
            task.get();
        }
        catch (const std::exception& e)
        {
            log::debug(kLog, name + ": refresh left it disconnected: " + e.what());
        }
    }
}

std::vector<client::ToolDescriptor> Manager::get_all_tools() const
{
    std::vector<ClientPtr> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, client] : clients_)
            clients.push_back(client);
    }

    std::vector<client::ToolDescriptor> tools;
    for (const auto& client : clients)
    {
        if (client->state() != ConnectionState::Ready)
            continue;
        for (auto& tool : client->get_tools())
            tools.push_back(std::move(tool));
    }
    return tools;
}

std::vector<client::ToolDescriptor> Manager::get_tools_by_server(const std::string& server) const
{
    auto client = find_client(server);
    if (!client || !client->is_connected())
        return {};
    return client->get_tools();
}

client::CallToolResult Manager::call_tool(const std::string& server, const std::string& tool,
                                          const Json& arguments)
{
    auto client = find_client(server);
    if (!client)
        return client::make_error_result("MCP server '" + server + "' not found or not connected");
    if (!client->is_connected())
        return client::make_error_result("MCP server '" + server + "' is not connected");

    try
    {
        return client->call_tool(tool, arguments);
    }
    catch (const std::exception& e)
    {
        log::warning(kLog, server + "/" + tool + ": " + e.what());
        return client::make_error_result(std::string("Error calling tool: ") + e.what());
    }
}

std::optional<client::ToolDescriptor> Manager::find_tool_by_name(const std::string& tool) const
{
    for (auto& t : get_all_tools())
        if (t.name == tool)
            return t;
    return std::nullopt;
}

bool Manager::set_server_enabled(const std::string& name, bool enabled)
{
    if (!registry_.set_server_enabled(name, enabled))
    {
        log::warning(kLog, "unknown MCP server: " + name);
        return false;
    }

    if (!enabled)
    {
        disconnect_from_server(name);
        return true;
    }

    auto descriptor = registry_.find_server(name);
    if (!descriptor)
        return false;
    try
    {
        return connect_to_server(*descriptor)->is_connected();
    }
    catch (const std::exception& e)
    {
        log::error(kLog, name + ": enabled but not connected: " + e.what());
        return false;
    }
}

void Manager::disconnect_from_server(const std::string& name)
{
    // A connect still in flight sees the new epoch and discards its client
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++epochs_[name];
    }
    // Stop first so a pending auto-restart cannot bring it back
    supervisor_.stop_http_server(name);

    ClientPtr client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(name);
        if (it != clients_.end())
        {
            client = std::move(it->second);
            clients_.erase(it);
        }
        failed_.erase(name);
    }

    if (client)
    {
        client->set_state_listener(nullptr);
        client->disconnect();
        log::info(kLog, name + ": disconnected");
    }
    notify(name, ConnectionState::Disconnected, "disconnected");
}

void Manager::disconnect_all()
{
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, client] : clients_)
            names.push_back(name);
    }
    for (const auto& name : names)
        disconnect_from_server(name);
    supervisor_.stop_all_http_servers();
}

std::vector<std::string> Manager::connected_servers() const
{
    std::vector<std::pair<std::string, ClientPtr>> clients;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clients.assign(clients_.begin(), clients_.end());
    }
    std::vector<std::string> names;
    for (const auto& [name, client] : clients)
        if (client->is_connected())
            names.push_back(name);
    return names;
}

std::optional<client::ServerInfo> Manager::server_info(const std::string& name) const
{
    auto client = find_client(name);
    if (!client || !client->is_connected())
        return std::nullopt;
    return client->get_server_info();
}

bool Manager::is_server_connected(const std::string& name) const
{
    auto client = find_client(name);
    return client && client->is_connected();
}

std::vector<config::ServerDescriptor> Manager::enabled_servers() const
{
    return registry_.list_enabled_servers();
}

std::vector<ServerStatus> Manager::server_status() const
{
    std::vector<ServerStatus> rows;
    for (const auto& d : registry_.list_all_servers())
    {
        ServerStatus row;
        row.name = d.name;
        row.enabled = d.enabled;
        row.kind = d.kind;
        row.description = d.description;
        row.state = connection_state(d.name);
        row.connected = row.state == ConnectionState::Ready;
        rows.push_back(std::move(row));
    }
    return rows;
}

ConnectionState Manager::connection_state(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (connecting_.count(name))
        return ConnectionState::Connecting;
    auto it = clients_.find(name);
    if (it != clients_.end())
        return it->second->state();
    if (failed_.count(name))
        return ConnectionState::Failed;
    return ConnectionState::Disconnected;
}

void Manager::set_status_listener(StatusListener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

Manager::ClientPtr Manager::find_client(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(name);
    return it == clients_.end() ? nullptr : it->second;
}

void Manager::on_supervisor_event(const supervisor::SupervisorEvent& event)
{
    using Kind = supervisor::SupervisorEventKind;
    switch (event.kind)
    {
    case Kind::Restarted:
    {
        auto descriptor = registry_.find_server(event.server);
        if (!descriptor || !descriptor->enabled || !event.client)
            return;
        register_client(event.server, event.client, std::nullopt);
        notify(event.server, ConnectionState::Ready, "restarted");
        break;
    }
    case Kind::Crashed:
        notify(event.server, ConnectionState::Disconnected,
               "process exited with code " + std::to_string(event.exit_code.value_or(-1)));
        break;
    case Kind::RestartScheduled:
        notify(event.server, connection_state(event.server),
               "restarting in " + std::to_string(event.delay.count()) + "ms");
        break;
    case Kind::Started:
    case Kind::Stopped:
        log::debug(kLog, event.server + ": supervisor " + supervisor::to_string(event.kind));
        break;
    }
}

void Manager::notify(const std::string& server, ConnectionState state, const std::string& message)
{
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (!listener)
        return;
    try
    {
        listener(StatusEvent{server, state, message});
    }
    catch (const std::exception& e)
    {
        log::warning(kLog, std::string("status listener failed: ") + e.what());
    }
}

} // namespace mcplink::manager
