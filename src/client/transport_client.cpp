#include "mcplink/client/transport_client.hpp"

#include "mcplink/exceptions.hpp"
#include "mcplink/logging.hpp"

#include <future>
#include <thread>

namespace mcplink::client
{

namespace
{
constexpr int kMaxListPages = 100;

std::string string_field(const Json& obj, const char* key, const std::string& fallback)
{
    if (obj.is_object() && obj.contains(key) && obj[key].is_string())
    {
        auto s = obj[key].get<std::string>();
        if (!s.empty())
            return s;
    }
    return fallback;
}
} // namespace

ClientOptions ClientOptions::from_settings(const Settings& settings)
{
    ClientOptions opts;
    opts.request_timeout = settings.request_timeout;
    opts.shutdown_grace = settings.shutdown_grace;
    return opts;
}

TransportClient::TransportClient(std::string server_name, ClientOptions options)
    : server_name_(std::move(server_name)), options_(std::move(options)),
      pending_(std::make_shared<PendingRequestTable>())
{
}

void TransportClient::connect()
{
    std::lock_guard<std::mutex> serial(connect_mutex_);
    if (state() == ConnectionState::Ready)
        return;

    set_state(ConnectionState::Connecting);

    auto fail = [this]()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            transport_alive_ = false;
        }
        pending_->reject_all("Connection to " + server_name_ + " failed");
        try
        {
            close_transport();
        }
        catch (const std::exception& e)
        {
            log::warning("client", server_name_ + ": close after failed connect: " + e.what());
        }
        clear_cache();

        ConnectionState previous;
        StateListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = state_;
            // A disconnect() during the attempt already settled the state
            if (state_ == ConnectionState::Connecting)
            {
                state_ = ConnectionState::Failed;
                listener = enter_listener();
            }
        }
        deliver(listener, previous, ConnectionState::Failed);
    };

    // Set before the reader starts so an early EOF is not lost
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Connecting)
            throw TransportStartError("Connection to " + server_name_ + " was cancelled");
        transport_alive_ = true;
    }

    try
    {
        open_transport();
    }
    catch (const TransportStartError&)
    {
        fail();
        throw;
    }
    catch (const std::exception& e)
    {
        fail();
        throw TransportStartError("Failed to start " + server_name_ + ": " + e.what());
    }

    try
    {
        handshake();
    }
    catch (const HandshakeError&)
    {
        fail();
        throw;
    }
    catch (const std::exception& e)
    {
        fail();
        throw HandshakeError("Handshake with " + server_name_ + " failed: " + e.what());
    }

    // The transport may have died after the last handshake reply
    bool alive = false;
    ConnectionState previous = ConnectionState::Connecting;
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        alive = transport_alive_ && state_ == ConnectionState::Connecting;
        if (alive)
        {
            previous = state_;
            state_ = ConnectionState::Ready;
            listener = enter_listener();
        }
    }
    if (!alive)
    {
        fail();
        throw HandshakeError("Connection to " + server_name_ + " closed during handshake");
    }
    deliver(listener, previous, ConnectionState::Ready);

    auto info = get_server_info();
    log::info("client", server_name_ + ": connected (" + std::to_string(info ? info->tools.size() : 0) +
                            " tools)");
}

void TransportClient::handshake()
{
    Json init_params = {{"protocolVersion", PROTOCOL_VERSION},
                        {"capabilities", {{"tools", Json::object()}}},
                        {"clientInfo",
                         {{"name", options_.client_name}, {"version", options_.client_version}}}};

    Json init;
    try
    {
        init = request("initialize", init_params);
    }
    catch (const TransportError& e)
    {
        throw HandshakeError("initialize failed for " + server_name_ + ": " + e.what());
    }

    ServerInfo info;
    Json server_info = init.is_object() && init.contains("serverInfo") ? init["serverInfo"] : Json();
    info.name = string_field(server_info, "name", server_name_);
    info.version = string_field(server_info, "version", "1.0.0");

    // Not every server implements it
    try
    {
        send_message(protocol::make_notification("initialized", Json::object()), std::nullopt);
    }
    catch (const std::exception& e)
    {
        log::debug("client", server_name_ + ": initialized notification failed: " + e.what());
    }

    try
    {
        for (const auto& item : list_paginated("tools/list", "tools"))
        {
            try
            {
                auto tool = item.get<ToolDescriptor>();
                tool.serverName = server_name_;
                info.tools.push_back(std::move(tool));
            }
            catch (const Json::exception& e)
            {
                log::warning("client", server_name_ + ": skipping malformed tool: " + e.what());
            }
        }
    }
    catch (const TransportError& e)
    {
        throw HandshakeError("tools/list failed for " + server_name_ + ": " + e.what());
    }

    try
    {
        for (const auto& item : list_paginated("resources/list", "resources"))
        {
            try
            {
                auto resource = item.get<ResourceDescriptor>();
                resource.serverName = server_name_;
                info.resources.push_back(std::move(resource));
            }
            catch (const Json::exception& e)
            {
                log::debug("client", server_name_ + ": skipping malformed resource: " + e.what());
            }
        }
    }
    catch (const TransportError& e)
    {
        info.resources.clear();
        log::debug("client", server_name_ + ": resources/list unavailable: " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    server_info_ = std::move(info);
}

std::vector<Json> TransportClient::list_paginated(const std::string& method, const std::string& key)
{
    std::vector<Json> items;
    Json params = Json::object();
    for (int page = 0; page < kMaxListPages; ++page)
    {
        Json result = request(method, params);
        if (!result.is_object())
            break;
        if (result.contains(key) && result[key].is_array())
            for (const auto& item : result[key])
                items.push_back(item);

        std::string cursor = string_field(result, "nextCursor", "");
        if (cursor.empty())
            break;
        params = Json{{"cursor", cursor}};
    }
    return items;
}

Json TransportClient::request(const std::string& method, const Json& params)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!transport_alive_)
            throw TransportError("Not connected to MCP server " + server_name_);
    }

    auto id = pending_->next_id();
    auto deadline = PendingRequestTable::Clock::now() + options_.request_timeout;
    auto future = pending_->add(id, method, deadline);

    try
    {
        send_message(protocol::make_request(id, method, params), id);
    }
    catch (const std::exception& e)
    {
        pending_->erase(id);
        throw TransportError("Failed to send " + method + " to " + server_name_ + ": " + e.what());
    }

    if (future.wait_until(deadline) == std::future_status::timeout)
        pending_->time_out(id);

    // Throws RequestTimeout / TransportError when the entry was rejected
    protocol::Response response = future.get();
    return protocol::unwrap(response);
}

CallToolResult TransportClient::call_tool(const std::string& name, const Json& arguments)
{
    Json params = {{"name", name},
                   {"arguments", arguments.is_null() ? Json::object() : arguments}};
    try
    {
        return request("tools/call", params).get<CallToolResult>();
    }
    catch (const ProtocolError& e)
    {
        return make_error_result(std::string("Error calling tool: ") + e.what());
    }
    catch (const Json::exception& e)
    {
        return make_error_result(std::string("Error calling tool: malformed result: ") + e.what());
    }
}

void TransportClient::disconnect()
{
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transport_alive_ = false;
        previous = state_;
        state_ = ConnectionState::Disconnected;
        server_info_.reset();
    }

    size_t rejected = pending_->reject_all("Disconnected from MCP server " + server_name_);
    if (rejected > 0)
        log::debug("client", server_name_ + ": rejected " + std::to_string(rejected) +
                                 " pending request(s)");

    try
    {
        close_transport();
    }
    catch (const std::exception& e)
    {
        log::warning("client", server_name_ + ": error while closing transport: " + e.what());
    }

    StateListener listener;
    if (previous != ConnectionState::Disconnected)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = enter_listener();
    }
    deliver(listener, previous, ConnectionState::Disconnected);
}

void TransportClient::dispatch(const protocol::Message& message)
{
    if (const auto* response = std::get_if<protocol::Response>(&message))
    {
        if (!pending_->resolve(*response))
            log::debug("client", server_name_ + ": dropping response with unknown id " +
                                     response->id.dump());
        return;
    }
    if (const auto* note = std::get_if<protocol::Notification>(&message))
        log::debug("client", server_name_ + ": ignoring notification " + note->method);
    else if (const auto* req = std::get_if<protocol::Request>(&message))
        log::debug("client", server_name_ + ": ignoring server request " + req->method);
}

void TransportClient::on_transport_closed(const std::string& reason)
{
    ConnectionState previous;
    bool changed = false;
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!transport_alive_)
            return;
        transport_alive_ = false;
        previous = state_;
        if (state_ == ConnectionState::Ready)
        {
            state_ = ConnectionState::Disconnected;
            server_info_.reset();
            changed = true;
            listener = enter_listener();
        }
    }

    log::warning("client", server_name_ + ": transport closed: " + reason);
    pending_->reject_all("Connection to " + server_name_ + " lost: " + reason);

    if (changed)
        deliver(listener, previous, ConnectionState::Disconnected);
}

std::vector<ToolDescriptor> TransportClient::get_tools() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_ ? server_info_->tools : std::vector<ToolDescriptor>{};
}

std::vector<ResourceDescriptor> TransportClient::get_resources() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_ ? server_info_->resources : std::vector<ResourceDescriptor>{};
}

std::optional<ServerInfo> TransportClient::get_server_info() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_;
}

bool TransportClient::is_connected() const
{
    return state() == ConnectionState::Ready;
}

ConnectionState TransportClient::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void TransportClient::set_state_listener(StateListener listener)
{
    std::unique_lock<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
    // Notifications already running on other threads finish before this returns
    const auto self = std::this_thread::get_id();
    listener_idle_.wait(lock, [&]() { return notifying_.size() == notifying_.count(self); });
}

void TransportClient::set_state(ConnectionState next)
{
    ConnectionState previous;
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        state_ = next;
        if (previous != next)
            listener = enter_listener();
    }
    deliver(listener, previous, next);
}

StateListener TransportClient::enter_listener()
{
    if (listener_)
        notifying_.insert(std::this_thread::get_id());
    return listener_;
}

void TransportClient::deliver(const StateListener& listener, ConnectionState from,
                              ConnectionState to)
{
    if (!listener)
        return;
    try
    {
        listener(server_name_, from, to);
    }
    catch (const std::exception& e)
    {
        log::warning("client", server_name_ + ": state listener failed: " + e.what());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        notifying_.erase(notifying_.find(std::this_thread::get_id()));
    }
    listener_idle_.notify_all();
}

void TransportClient::clear_cache()
{
    std::lock_guard<std::mutex> lock(mutex_);
    server_info_.reset();
}

} // namespace mcplink::client
