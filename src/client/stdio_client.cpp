#include "mcplink/client/stdio_client.hpp"

#include "../internal/process.hpp"
#include "mcplink/exceptions.hpp"
#include "mcplink/logging.hpp"

#include <chrono>
#include <csignal>

namespace mcplink::client
{

namespace
{
std::once_flag g_sigpipe_once;

// A child dying mid-write must surface as EPIPE, not kill us
void ignore_sigpipe()
{
    std::call_once(g_sigpipe_once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos)
        return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}
} // namespace

StdioClient::StdioClient(config::ServerDescriptor descriptor, ClientOptions options)
    : TransportClient(descriptor.name, std::move(options)), descriptor_(std::move(descriptor))
{
}

StdioClient::~StdioClient()
{
    disconnect();
}

int StdioClient::pid() const
{
    std::lock_guard<std::mutex> lock(proc_mutex_);
    return process_ ? process_->pid() : 0;
}

void StdioClient::open_transport()
{
    ignore_sigpipe();
    close_transport();

    auto argv = config::command_line(descriptor_);
    if (argv.empty())
        throw TransportStartError("No command configured for MCP server " + descriptor_.name);

    process::SpawnOptions opts;
    opts.environment = descriptor_.env;
    if (options().stderr_log)
        opts.stderr_path = options().stderr_log->string();

    auto proc = std::make_shared<process::Process>();
    try
    {
        proc->spawn(argv.front(), std::vector<std::string>(argv.begin() + 1, argv.end()), opts);
    }
    catch (const process::ProcessError& e)
    {
        throw TransportStartError("Failed to spawn MCP server " + descriptor_.name + ": " +
                                  e.what());
    }

    auto stop = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(proc_mutex_);
        process_ = proc;
        stop_ = stop;
    }

    std::lock_guard<std::mutex> lock(close_mutex_);
    reader_ = std::thread([this, proc, stop]() { reader_loop(proc, stop); });

    log::debug("stdio", descriptor_.name + ": spawned pid " + std::to_string(proc->pid()));
}

void StdioClient::reader_loop(std::shared_ptr<process::Process> proc,
                              std::shared_ptr<std::atomic<bool>> stop)
{
    std::string buffer;
    char chunk[4096];
    std::string reason = "server closed its output";

    try
    {
        auto& out = proc->stdout_pipe();
        while (!stop->load())
        {
            if (!out.readable(100))
                continue;
            size_t n = out.read(chunk, sizeof(chunk));
            if (n == 0)
                break;
            buffer.append(chunk, n);

            size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos)
            {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                handle_line(std::move(line));
            }
        }
    }
    catch (const process::ProcessError& e)
    {
        reason = e.what();
    }

    if (!stop->load())
        on_transport_closed(reason);
}

void StdioClient::handle_line(std::string line)
{
    line = trim(line);
    if (line.empty())
        return;

    auto message = protocol::parse_message(line);
    if (!message)
    {
        log::debug("stdio", descriptor_.name + ": discarding non JSON-RPC line");
        return;
    }
    dispatch(*message);
}

void StdioClient::send_message(const Json& message, std::optional<std::int64_t> /*id*/)
{
    std::shared_ptr<process::Process> proc;
    {
        std::lock_guard<std::mutex> lock(proc_mutex_);
        proc = process_;
    }
    if (!proc)
        throw TransportError("MCP server " + descriptor_.name + " is not running");

    std::string line = message.dump() + "\n";
    std::lock_guard<std::mutex> lock(write_mutex_);
    try
    {
        proc->stdin_pipe().write(line);
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError("Write to " + descriptor_.name + " failed: " + e.what());
    }
}

void StdioClient::close_transport()
{
    std::lock_guard<std::mutex> serial(close_mutex_);

    std::shared_ptr<process::Process> proc;
    std::shared_ptr<std::atomic<bool>> stop;
    {
        std::lock_guard<std::mutex> lock(proc_mutex_);
        proc = std::move(process_);
        stop = std::move(stop_);
    }
    if (stop)
        stop->store(true);

    if (proc)
    {
        // A writer blocked on a full pipe holds the lock; the signal below unblocks it
        {
            std::unique_lock<std::mutex> lock(write_mutex_, std::try_to_lock);
            if (lock.owns_lock())
            {
                try
                {
                    proc->stdin_pipe().close();
                }
                catch (const process::ProcessError&)
                {
                    // stdin already gone
                }
            }
        }

        try
        {
            if (proc->shutdown(options().shutdown_grace))
                log::warning("stdio", descriptor_.name + ": server ignored SIGTERM, killed");
        }
        catch (const process::ProcessError& e)
        {
            log::warning("stdio", descriptor_.name + ": " + e.what());
        }
    }

    if (reader_.joinable())
    {
        if (reader_.get_id() == std::this_thread::get_id())
            reader_.detach();
        else
            reader_.join();
    }
}

} // namespace mcplink::client
