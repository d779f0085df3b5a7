#pragma once
/// @file manager/manager.hpp
/// @brief Multiplexes many MCP server connections into one tool catalog
/// @details The manager owns at most one live client per server name. Stdio
///          servers are connected directly; http servers go through the
///          ProcessSupervisor. One server failing never affects another: batch
///          operations log and continue, and call paths return error results
///          instead of throwing.

#include "mcplink/client/transport_client.hpp"
#include "mcplink/config/registry.hpp"
#include "mcplink/supervisor/process_supervisor.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mcplink::manager
{

/// One row of server_status()
struct ServerStatus
{
    std::string name;
    bool enabled{false};
    bool connected{false};
    TransportKind kind{TransportKind::Stdio};
    ConnectionState state{ConnectionState::Disconnected};
    std::string description;
};

/// Status notification delivered to the registered listener
struct StatusEvent
{
    std::string server;
    ConnectionState state{ConnectionState::Disconnected};
    std::string message;
};

using StatusListener = std::function<void(const StatusEvent&)>;

class Manager
{
  public:
    Manager(config::ServerRegistry& registry, supervisor::ProcessSupervisor& supervisor,
            client::ClientOptions client_options = {});
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    /// Existing Ready client, or a newly connected one. Concurrent calls for the
    /// same name share one connection attempt.
    /// @throws TransportError (or a subclass) when the connection fails
    std::shared_ptr<client::TransportClient> connect_to_server(const config::ServerDescriptor& descriptor);

    /// Connect every enabled server concurrently. Returns how many ended up Ready.
    size_t initialize_all_servers();

    /// Connect newly enabled servers, tear down disabled ones, leave the rest alone
    void refresh_connections();

    /// Tools of Ready servers only, each tagged with its server name
    std::vector<client::ToolDescriptor> get_all_tools() const;
    std::vector<client::ToolDescriptor> get_tools_by_server(const std::string& server) const;

    /// Never throws; failures come back as isError results
    client::CallToolResult call_tool(const std::string& server, const std::string& tool,
                                     const Json& arguments);

    /// First tool with that name across all Ready servers
    std::optional<client::ToolDescriptor> find_tool_by_name(const std::string& tool) const;

    /// Persist the flag, then connect or disconnect accordingly.
    /// @return false if the server is unknown or connecting it failed
    bool set_server_enabled(const std::string& name, bool enabled);

    void disconnect_from_server(const std::string& name);

    /// Tear down every client and stop every supervised process
    void disconnect_all();

    std::vector<std::string> connected_servers() const;
    std::optional<client::ServerInfo> server_info(const std::string& name) const;
    bool is_server_connected(const std::string& name) const;
    std::vector<config::ServerDescriptor> enabled_servers() const;
    std::vector<ServerStatus> server_status() const;
    ConnectionState connection_state(const std::string& name) const;

    void set_status_listener(StatusListener listener);

  private:
    using ClientPtr = std::shared_ptr<client::TransportClient>;

    ClientPtr find_client(const std::string& name) const;
    ClientPtr open_client(const config::ServerDescriptor& descriptor);
    /// False when `epoch` is set and a disconnect happened since it was read
    bool register_client(const std::string& name, const ClientPtr& client,
                         std::optional<std::uint64_t> epoch);
    void on_supervisor_event(const supervisor::SupervisorEvent& event);
    void notify(const std::string& server, ConnectionState state, const std::string& message);

    config::ServerRegistry& registry_;
    supervisor::ProcessSupervisor& supervisor_;
    client::ClientOptions client_options_;

    mutable std::mutex mutex_;
    std::map<std::string, ClientPtr> clients_;
    std::map<std::string, std::shared_future<ClientPtr>> connecting_;
    std::set<std::string> failed_;
    /// Bumped by every disconnect; a connect started under an older value is dropped
    std::map<std::string, std::uint64_t> epochs_;
    StatusListener listener_;
};

} // namespace mcplink::manager
