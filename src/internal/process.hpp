// POSIX child processes for the stdio client and the process supervisor

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcplink::process
{

class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// One end of a pipe to a child
class Pipe
{
  public:
    Pipe() = default;
    explicit Pipe(int fd) : fd_(fd) {}
    ~Pipe();

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    /// @return bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Writes everything or throws
    void write(const std::string& data);

    /// Wait up to timeout_ms for data or EOF
    bool readable(int timeout_ms);

    void close();

    bool is_open() const
    {
        return fd_ >= 0;
    }

  private:
    int fd_{-1};
};

struct SpawnOptions
{
    /// Set on top of the inherited environment
    std::map<std::string, std::string> environment;
    /// Pipe stdout back to us; otherwise it goes to /dev/null
    bool capture_stdout{true};
    /// Appended to when set; otherwise stderr goes to /dev/null
    std::string stderr_path;
};

/// A child running in its own process group. stdin is always a pipe.
class Process
{
  public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// `executable` is resolved on PATH unless it contains a slash.
    /// @throws ProcessError when it cannot be found or exec fails
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const SpawnOptions& options = {});

    Pipe& stdin_pipe();
    Pipe& stdout_pipe();

    /// Exit code (128 + signal when killed), or nullopt while running
    std::optional<int> try_wait();
    int wait();

    /// SIGTERM to the group
    void terminate();
    /// SIGKILL to the group
    void kill();

    /// terminate(), then kill() once `grace` has passed.
    /// @return true if SIGKILL was needed
    bool shutdown(std::chrono::milliseconds grace);

    int pid() const
    {
        return pid_;
    }

  private:
    void signal_group(int sig);

    int pid_{0};
    bool running_{false};
    int exit_code_{-1};
    std::unique_ptr<Pipe> stdin_;
    std::unique_ptr<Pipe> stdout_;
};

} // namespace mcplink::process
