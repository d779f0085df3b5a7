// Line-delimited stdio MCP server: `stdio_mcp_server [root] [fixture flags]`

#include "fixture/fixture_protocol.hpp"

#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

int main(int argc, char** argv)
{
    using mcplink::fixture::Json;

    auto opts = mcplink::fixture::parse_options(argc, argv);
    if (opts.ignore_sigterm)
        std::signal(SIGTERM, SIG_IGN);
    if (mcplink::fixture::should_crash(opts))
        return 3;
    if (opts.startup_delay_ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(opts.startup_delay_ms));

    std::mutex out_mutex;
    auto write_line = [&](const std::string& s)
    {
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << s << "\n" << std::flush;
    };

    if (opts.garbage)
        write_line("fixture server starting up...");

    std::vector<std::thread> workers;
    std::string line;
    while (std::getline(std::cin, line))
    {
        Json msg = Json::parse(line, nullptr, false);
        if (msg.is_discarded())
            continue;

        auto work = [&write_line, &opts, msg]()
        {
            auto reply = mcplink::fixture::handle(msg, opts);
            if (!reply)
                return;
            if (opts.garbage)
                write_line("{not json");
            write_line(reply->dump());
        };

        // Slow calls run concurrently so replies can overtake each other
        const bool slow = msg.value("method", "") == "tools/call" && msg.contains("params") &&
                          msg["params"].value("name", "") == "sleep";
        if (slow)
            workers.emplace_back(work);
        else
            work();
    }

    for (auto& t : workers)
        t.join();

    // Simulates a server that outlives its stdin and ignores SIGTERM
    if (opts.ignore_sigterm)
        while (true)
            std::this_thread::sleep_for(std::chrono::seconds(1));
    return 0;
}
