#pragma once
#include "mcplink/client/transport_client.hpp"
#include "mcplink/config/server_descriptor.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace mcplink::process
{
class Process;
}

namespace mcplink::client
{

/// Talks to a server launched as a child process, one JSON document per line
/// over its stdin/stdout.
///
/// The child runs in its own process group with the descriptor's environment
/// merged over ours. A background reader splits stdout on '\n'; lines that are
/// not JSON-RPC are dropped. When the child closes stdout every pending request
/// is rejected and the client goes Disconnected.
class StdioClient : public TransportClient
{
  public:
    explicit StdioClient(config::ServerDescriptor descriptor, ClientOptions options = {});
    ~StdioClient() override;

    TransportKind kind() const override
    {
        return TransportKind::Stdio;
    }

    const config::ServerDescriptor& descriptor() const
    {
        return descriptor_;
    }

    /// Pid of the running server, 0 when none
    int pid() const;

  protected:
    void open_transport() override;
    void send_message(const Json& message, std::optional<std::int64_t> id) override;
    void close_transport() override;

  private:
    void reader_loop(std::shared_ptr<process::Process> proc,
                     std::shared_ptr<std::atomic<bool>> stop);
    void handle_line(std::string line);

    config::ServerDescriptor descriptor_;

    mutable std::mutex proc_mutex_;
    std::shared_ptr<process::Process> process_;
    std::shared_ptr<std::atomic<bool>> stop_;

    std::mutex write_mutex_;
    std::mutex close_mutex_;
    std::thread reader_;
};

} // namespace mcplink::client
