#pragma once
#include "mcplink/client/transport_client.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace mcplink::client
{

/// Talks to a server over HTTP: every JSON-RPC message is its own POST to the
/// endpoint (normally `http://host:port/mcp`).
///
/// The reply body is either the JSON-RPC response itself or a
/// `text/event-stream` of `data: <json>` lines, of which the last well-formed
/// response is used. Each POST runs on its own worker thread so concurrent
/// calls do not wait on each other; disconnect() aborts the ones in flight and
/// joins their threads.
class HttpClient : public TransportClient
{
  public:
    HttpClient(std::string server_name, std::string endpoint_url, ClientOptions options = {});
    ~HttpClient() override;

    TransportKind kind() const override
    {
        return TransportKind::Http;
    }

    const std::string& endpoint() const
    {
        return endpoint_;
    }

    /// POST a `ping`; true on any 2xx reply. Never throws.
    bool ping(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) const;

    bool health_check() const
    {
        return ping();
    }

    /// Readiness probe against an endpoint no client is bound to yet
    static bool probe(const std::string& endpoint_url, std::chrono::milliseconds timeout);

  protected:
    void open_transport() override;
    void send_message(const Json& message, std::optional<std::int64_t> id) override;
    void close_transport() override;

  private:
    struct InFlight;

    /// One POST on a worker thread; resolves or rejects `id` when set
    static void post(InFlight& flight, std::int64_t ticket, PendingRequestTable& pending_table,
                     const std::string& base, const std::string& path, const std::string& body,
                     std::optional<std::int64_t> id, std::chrono::milliseconds timeout,
                     const std::string& server);
    /// Abort the POSTs in flight and join every worker
    static void shutdown(const std::shared_ptr<InFlight>& flight);

    std::string endpoint_;
    std::mutex mutex_;
    std::shared_ptr<InFlight> in_flight_;
};

} // namespace mcplink::client
