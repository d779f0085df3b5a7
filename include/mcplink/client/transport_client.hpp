#pragma once
/// @file client/transport_client.hpp
/// @brief One MCP server connection: handshake, correlation, teardown
/// @details The stdio and http clients differ only in how a serialized message
///          reaches the server and how replies come back. Everything else (the
///          handshake, the correlation table, the cached catalog and the state
///          machine) lives here.

#include "mcplink/client/pending_requests.hpp"
#include "mcplink/client/types.hpp"
#include "mcplink/settings.hpp"
#include "mcplink/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace mcplink::client
{

struct ClientOptions
{
    std::chrono::milliseconds request_timeout{30000};
    /// Time a stdio child gets between SIGTERM and SIGKILL
    std::chrono::milliseconds shutdown_grace{5000};
    /// Append stdio server stderr here; unset discards it
    std::optional<std::filesystem::path> stderr_log;
    std::string client_name{LIBRARY_NAME};
    std::string client_version{LIBRARY_VERSION};

    static ClientOptions from_settings(const Settings& settings);
};

/// Observer of state transitions: (server name, from, to)
using StateListener =
    std::function<void(const std::string&, ConnectionState, ConnectionState)>;

/**
 * Base class of the stdio and http transport clients.
 *
 * State machine:
 *   Disconnected --connect--> Connecting --handshake ok--> Ready
 *   Connecting --handshake failure--> Failed
 *   Ready --disconnect or transport death--> Disconnected
 *
 * A client may be connected again after Failed or Disconnected.
 */
class TransportClient
{
  public:
    TransportClient(std::string server_name, ClientOptions options);
    virtual ~TransportClient() = default;

    TransportClient(const TransportClient&) = delete;
    TransportClient& operator=(const TransportClient&) = delete;

    virtual TransportKind kind() const = 0;

    /// Open the transport and run the handshake. No-op when already Ready.
    /// @throws TransportStartError if the transport cannot be opened
    /// @throws HandshakeError if initialize or tools/list fails
    void connect();

    /// Call a tool. A JSON-RPC error from the server comes back as an isError result.
    /// @throws RequestTimeout if no reply arrives within the request timeout
    /// @throws TransportError if the connection is not usable
    CallToolResult call_tool(const std::string& name, const Json& arguments);

    /// Send a request and wait for its result payload
    /// @throws ProtocolError if the server answers with an error object
    Json request(const std::string& method, const Json& params = Json::object());

    /// Idempotent. Rejects every pending request before the transport is closed.
    void disconnect();

    std::vector<ToolDescriptor> get_tools() const;
    std::vector<ResourceDescriptor> get_resources() const;
    std::optional<ServerInfo> get_server_info() const;
    bool is_connected() const;
    ConnectionState state() const;

    const std::string& server_name() const
    {
        return server_name_;
    }

    const ClientOptions& options() const
    {
        return options_;
    }

    void set_state_listener(StateListener listener);

    /// Number of requests still waiting for a reply
    size_t pending_count() const
    {
        return pending_->size();
    }

  protected:
    /// Start the transport. Called without internal locks held.
    virtual void open_transport() = 0;

    /// Deliver one serialized message. `id` is set for requests, unset for notifications.
    virtual void send_message(const Json& message, std::optional<std::int64_t> id) = 0;

    /// Release transport resources. Must tolerate being called more than once.
    virtual void close_transport() = 0;

    /// Route one validated message from the server
    void dispatch(const protocol::Message& message);

    /// Called by a transport when its channel died underneath the client
    void on_transport_closed(const std::string& reason);

    std::shared_ptr<PendingRequestTable> pending() const
    {
        return pending_;
    }

  private:
    void handshake();
    std::vector<Json> list_paginated(const std::string& method, const std::string& key);
    void set_state(ConnectionState next);
    void clear_cache();
    /// Copy of the listener, with this thread marked as inside it. Needs mutex_.
    StateListener enter_listener();
    /// Runs a listener from enter_listener() and clears the mark
    void deliver(const StateListener& listener, ConnectionState from, ConnectionState to);

    std::string server_name_;
    ClientOptions options_;
    std::shared_ptr<PendingRequestTable> pending_;

    mutable std::mutex mutex_;
    ConnectionState state_{ConnectionState::Disconnected};
    bool transport_alive_{false};
    std::optional<ServerInfo> server_info_;
    StateListener listener_;
    std::multiset<std::thread::id> notifying_;
    std::condition_variable listener_idle_;
    std::mutex connect_mutex_;
};

} // namespace mcplink::client
