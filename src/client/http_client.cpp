#include "mcplink/client/http_client.hpp"

#include "mcplink/exceptions.hpp"
#include "mcplink/logging.hpp"
#include "mcplink/protocol/sse.hpp"

#include <httplib.h>
#include <map>
#include <thread>
#include <utility>
#include <vector>

namespace mcplink::client
{

namespace
{
struct ParsedUrl
{
    std::string base; // scheme://host:port
    std::string path; // includes leading '/'
};

ParsedUrl parse_url(const std::string& url)
{
    std::string scheme = "http";
    std::string remaining = url;

    auto scheme_pos = remaining.find("://");
    if (scheme_pos != std::string::npos)
    {
        scheme = remaining.substr(0, scheme_pos);
        remaining = remaining.substr(scheme_pos + 3);
    }

    // Only allow http/https
    if (scheme != "http" && scheme != "https")
        throw TransportStartError("Unsupported URL scheme: " + scheme +
                                  " (only http and https are allowed)");

    ParsedUrl out;
    auto slash_pos = remaining.find('/');
    std::string authority = remaining.substr(0, slash_pos);
    out.path = slash_pos == std::string::npos ? "/mcp" : remaining.substr(slash_pos);
    if (authority.empty())
        throw TransportStartError("Missing host in URL: " + url);

    std::string host = authority;
    int port = scheme == "https" ? 443 : 80;
    auto colon_pos = authority.rfind(':');
    if (colon_pos != std::string::npos)
    {
        host = authority.substr(0, colon_pos);
        const std::string port_str = authority.substr(colon_pos + 1);
        if (port_str.empty() || port_str.find_first_not_of("0123456789") != std::string::npos)
            throw TransportStartError("Invalid port in URL: " + url);
        port = std::stoi(port_str);
    }

    out.base = scheme + "://" + host + ":" + std::to_string(port);
    return out;
}

void apply_timeouts(httplib::Client& cli, std::chrono::milliseconds connect,
                    std::chrono::milliseconds read)
{
    cli.set_connection_timeout(static_cast<time_t>(connect.count() / 1000),
                               static_cast<time_t>((connect.count() % 1000) * 1000));
    cli.set_read_timeout(static_cast<time_t>(read.count() / 1000),
                         static_cast<time_t>((read.count() % 1000) * 1000));
    cli.set_follow_location(false);
}

const httplib::Headers& post_headers()
{
    static const httplib::Headers headers = {{"Accept", "application/json, text/event-stream"}};
    return headers;
}

/// JSON-RPC response carried by a reply body of either encoding
std::optional<protocol::Response> decode_reply(const httplib::Response& res)
{
    if (res.get_header_value("Content-Type").find("text/event-stream") != std::string::npos)
    {
        protocol::SseDecoder decoder;
        decoder.feed(res.body);
        decoder.finish();
        return decoder.last_response();
    }

    auto message = protocol::parse_message(res.body);
    if (!message)
        return std::nullopt;
    if (auto* response = std::get_if<protocol::Response>(&*message))
        return *response;
    return std::nullopt;
}
} // namespace

/// Workers started by one connection; close_transport() stops and joins them all
struct HttpClient::InFlight
{
    std::mutex mutex;
    bool closed = false;
    std::int64_t next_ticket = 0;
    std::map<std::int64_t, httplib::Client*> clients;
    std::map<std::int64_t, std::thread> workers;
    /// Workers that have returned, joined by the next send or by close
    std::vector<std::thread> finished;
};

HttpClient::HttpClient(std::string server_name, std::string endpoint_url, ClientOptions options)
    : TransportClient(std::move(server_name), std::move(options)),
      endpoint_(std::move(endpoint_url))
{
}

HttpClient::~HttpClient()
{
    disconnect();
}

void HttpClient::open_transport()
{
    parse_url(endpoint_);

    auto flight = std::make_shared<InFlight>();
    std::shared_ptr<InFlight> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::exchange(in_flight_, flight);
    }
    shutdown(previous);
}

void HttpClient::send_message(const Json& message, std::optional<std::int64_t> id)
{
    std::shared_ptr<InFlight> flight;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        flight = in_flight_;
    }
    if (!flight)
        throw TransportError("HTTP transport to " + server_name() + " is closed");

    auto url = parse_url(endpoint_);
    auto pending_table = pending();
    auto timeout = options().request_timeout;
    std::string body = message.dump();
    std::string server = server_name();

    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(flight->mutex);
        if (flight->closed)
            throw TransportError("HTTP transport to " + server + " is closed");
        done.swap(flight->finished);

        std::int64_t ticket = flight->next_ticket++;
        flight->workers[ticket] = std::thread(
            [flight, pending_table, url, body, id, timeout, server, ticket]()
            {
                post(*flight, ticket, *pending_table, url.base, url.path, body, id, timeout,
                     server);

                std::lock_guard<std::mutex> lock(flight->mutex);
                auto self = flight->workers.find(ticket);
                if (self != flight->workers.end())
                {
                    flight->finished.push_back(std::move(self->second));
                    flight->workers.erase(self);
                }
            });
    }
    for (auto& worker : done)
        worker.join();
}

void HttpClient::post(InFlight& flight, std::int64_t ticket, PendingRequestTable& pending_table,
                      const std::string& base, const std::string& path, const std::string& body,
                      std::optional<std::int64_t> id, std::chrono::milliseconds timeout,
                      const std::string& server)
{
    auto fail = [&](const std::string& reason)
    {
        if (id)
            pending_table.reject(*id, std::make_exception_ptr(TransportError(reason)));
    };

    httplib::Client cli(base);
    // Read timeout past the request deadline so the caller's timeout decides
    apply_timeouts(cli, std::chrono::milliseconds(5000), timeout + std::chrono::milliseconds(1000));

    {
        std::lock_guard<std::mutex> lock(flight.mutex);
        if (flight.closed)
        {
            fail("HTTP transport to " + server + " is closed");
            return;
        }
        flight.clients[ticket] = &cli;
    }

    auto res = cli.Post(path, post_headers(), body, "application/json");

    {
        std::lock_guard<std::mutex> lock(flight.mutex);
        flight.clients.erase(ticket);
    }

    if (!id)
        return;
    if (!res)
    {
        fail("HTTP request to " + server + " failed: " + httplib::to_string(res.error()));
        return;
    }
    if (res->status < 200 || res->status >= 300)
    {
        fail("HTTP error from " + server + ": " + std::to_string(res->status));
        return;
    }

    auto response = decode_reply(*res);
    if (!response)
    {
        fail("No JSON-RPC response from " + server);
        return;
    }
    // An error reply may carry a null id
    if (response->id.is_null() && response->is_error())
        response->id = *id;
    auto reply_id = protocol::numeric_id(response->id);
    if (!reply_id || *reply_id != *id)
    {
        fail("Mismatched response id from " + server);
        return;
    }
    if (!pending_table.resolve(*response))
        log::debug("http", server + ": late reply for id " + std::to_string(*id));
}

void HttpClient::close_transport()
{
    std::shared_ptr<InFlight> flight;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        flight = std::move(in_flight_);
    }
    shutdown(flight);
}

void HttpClient::shutdown(const std::shared_ptr<InFlight>& flight)
{
    if (!flight)
        return;

    std::map<std::int64_t, std::thread> workers;
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(flight->mutex);
        flight->closed = true;
        for (auto& [ticket, cli] : flight->clients)
            cli->stop();
        workers.swap(flight->workers);
        finished.swap(flight->finished);
    }
    for (auto& [ticket, worker] : workers)
        worker.join();
    for (auto& worker : finished)
        worker.join();
}

bool HttpClient::ping(std::chrono::milliseconds timeout) const
{
    return probe(endpoint_, timeout);
}

bool HttpClient::probe(const std::string& endpoint_url, std::chrono::milliseconds timeout)
{
    try
    {
        auto url = parse_url(endpoint_url);
        httplib::Client cli(url.base);
        apply_timeouts(cli, timeout, timeout);

        Json request = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}, {"params", Json::object()}};
        auto res = cli.Post(url.path, post_headers(), request.dump(), "application/json");
        return res && res->status >= 200 && res->status < 300;
    }
    catch (const std::exception& e)
    {
        log::debug("http", "probe of " + endpoint_url + " failed: " + e.what());
        return false;
    }
}

} // namespace mcplink::client
