// HTTP MCP server on POST /mcp, listening on $MCP_PORT / $PORT (or --port)

#include "fixture/fixture_protocol.hpp"

#include <csignal>
#include <httplib.h>
#include <iostream>
#include <thread>

int main(int argc, char** argv)
{
    using mcplink::fixture::Json;

    auto opts = mcplink::fixture::parse_options(argc, argv);
    if (opts.ignore_sigterm)
        std::signal(SIGTERM, SIG_IGN);

    if (mcplink::fixture::should_crash(opts))
    {
        if (opts.crash_after_ms < 0)
            return 3;
        std::thread(
            [ms = opts.crash_after_ms]()
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(ms));
                std::_Exit(3);
            })
            .detach();
    }

    if (opts.port <= 0)
    {
        std::cerr << "http_mcp_server: set PORT, MCP_PORT or --port\n";
        return 2;
    }

    if (opts.startup_delay_ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(opts.startup_delay_ms));

    httplib::Server svr;
    svr.Post("/mcp",
             [&opts](const httplib::Request& req, httplib::Response& res)
             {
                 Json msg = Json::parse(req.body, nullptr, false);
                 if (msg.is_discarded())
                 {
                     res.status = 400;
                     res.set_content(
                         mcplink::fixture::error_reply(nullptr, -32700, "Parse error").dump(),
                         "application/json");
                     return;
                 }
                 if (opts.never_ready && msg.value("method", "") == "ping")
                 {
                     res.status = 503;
                     return;
                 }

                 auto reply = mcplink::fixture::handle(msg, opts);
                 if (!reply)
                 {
                     res.status = 202;
                     return;
                 }

                 if (opts.sse)
                 {
                     std::string body;
                     body += "event: message\n";
                     body += "data: {\"jsonrpc\":\"2.0\",\"method\":\"notifications/progress\","
                             "\"params\":{}}\n\n";
                     body += "data: {truncated\n\n";
                     body += "data: " + reply->dump() + "\n\n";
                     res.set_content(body, "text/event-stream");
                 }
                 else
                 {
                     res.set_content(reply->dump(), "application/json");
                 }
             });

    if (!svr.listen("127.0.0.1", opts.port))
    {
        std::cerr << "http_mcp_server: cannot listen on port " << opts.port << "\n";
        return 1;
    }
    return 0;
}
