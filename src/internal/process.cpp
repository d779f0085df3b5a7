#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern "C" char** environ;

namespace mcplink::process
{

namespace
{

std::string errno_text()
{
    return std::strerror(errno);
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

/// Both ends of a pipe, closed on scope exit unless released
struct PipePair
{
    int fds[2] = {-1, -1};

    ~PipePair()
    {
        reset(0);
        reset(1);
    }

    void open(const char* what)
    {
        // O_CLOEXEC keeps our ends out of siblings spawned concurrently
        if (pipe2(fds, O_CLOEXEC) != 0)
            throw ProcessError(std::string("Failed to create ") + what + " pipe: " + errno_text());
    }

    int release(int end)
    {
        int fd = fds[end];
        fds[end] = -1;
        return fd;
    }

    void reset(int end)
    {
        if (fds[end] >= 0)
            ::close(fds[end]);
        fds[end] = -1;
    }
};

std::optional<std::string> resolve_executable(const std::string& name)
{
    namespace fs = std::filesystem;
    std::error_code ec;

    if (name.empty())
        return std::nullopt;
    if (name.find('/') != std::string::npos)
    {
        if (fs::is_regular_file(name, ec) && access(name.c_str(), X_OK) == 0)
            return fs::absolute(name, ec).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= path.size())
    {
        size_t end = path.find(':', start);
        if (end == std::string::npos)
            end = path.size();
        if (end > start)
        {
            fs::path candidate = fs::path(path.substr(start, end - start)) / name;
            if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0)
                return candidate.string();
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides)
{
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e)
    {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos)
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides)
        env[key] = value;

    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto& [key, value] : env)
        out.push_back(key + "=" + value);
    return out;
}

std::vector<char*> c_strings(std::vector<std::string>& strings)
{
    std::vector<char*> out;
    for (auto& s : strings)
        out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

} // namespace

Pipe::~Pipe()
{
    close();
}

size_t Pipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");
    while (true)
    {
        ssize_t n = ::read(fd_, buffer, size);
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno != EINTR)
            throw ProcessError("Read failed: " + errno_text());
    }
}

void Pipe::write(const std::string& data)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");
    size_t written = 0;
    while (written < data.size())
    {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + errno_text());
        }
        written += static_cast<size_t>(n);
    }
}

bool Pipe::readable(int timeout_ms)
{
    if (!is_open())
        return false;
    pollfd pfd{fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0)
    {
        if (errno == EINTR)
            return false;
        throw ProcessError("poll failed: " + errno_text());
    }
    // POLLHUP: the next read reports EOF
    return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

void Pipe::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

Process::~Process()
{
    stdin_.reset();
    stdout_.reset();
    if (!running_)
        return;
    try
    {
        kill();
        wait();
    }
    catch (const ProcessError&)
    {
        // reaped elsewhere
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const SpawnOptions& options)
{
    if (running_)
        throw ProcessError("Process already running (pid " + std::to_string(pid_) + ")");

    auto resolved = resolve_executable(executable);
    if (!resolved)
        throw ProcessError("Executable not found: '" + executable + "'");

    // Built before fork: the child may only make async-signal-safe calls
    std::vector<std::string> argv_storage{executable};
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    auto argv = c_strings(argv_storage);
    auto env_storage = merged_environment(options.environment);
    auto envp = c_strings(env_storage);
    const char* stderr_target = options.stderr_path.empty() ? "/dev/null" : options.stderr_path.c_str();

    PipePair in, out, exec_error;
    in.open("stdin");
    if (options.capture_stdout)
        out.open("stdout");
    exec_error.open("exec status");

    pid_t pid = fork();
    if (pid < 0)
        throw ProcessError("fork failed: " + errno_text());

    if (pid == 0)
    {
        auto fail = [&]()
        {
            int err = errno;
            (void)::write(exec_error.fds[1], &err, sizeof(err));
            _exit(127);
        };

        if (setpgid(0, 0) != 0)
            fail();
        if (dup2(in.fds[0], STDIN_FILENO) < 0)
            fail();

        int stdout_fd = options.capture_stdout ? out.fds[1] : ::open("/dev/null", O_WRONLY);
        if (stdout_fd < 0 || dup2(stdout_fd, STDOUT_FILENO) < 0)
            fail();

        int stderr_fd = ::open(stderr_target, O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (stderr_fd < 0 || dup2(stderr_fd, STDERR_FILENO) < 0)
            fail();

        execve(resolved->c_str(), argv.data(), envp.data());
        fail();
    }

    // Either this or the child's own setpgid wins; both give the same group
    setpgid(pid, pid);

    exec_error.reset(1);
    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(exec_error.fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0)
    {
        waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to execute '" + executable + "': " + std::strerror(child_errno));
    }

    stdin_ = std::make_unique<Pipe>(in.release(1));
    if (options.capture_stdout)
        stdout_ = std::make_unique<Pipe>(out.release(0));
    pid_ = pid;
    running_ = true;
    exit_code_ = -1;
}

Pipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

Pipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

std::optional<int> Process::try_wait()
{
    if (!running_)
        return exit_code_;

    int status = 0;
    pid_t rc = waitpid(pid_, &status, WNOHANG);
    if (rc == 0)
        return std::nullopt;
    if (rc != pid_)
        throw ProcessError("waitpid failed: " + errno_text());
    exit_code_ = decode_status(status);
    running_ = false;
    return exit_code_;
}

int Process::wait()
{
    if (!running_)
        return exit_code_;

    int status = 0;
    pid_t rc;
    do
    {
        rc = waitpid(pid_, &status, 0);
    } while (rc < 0 && errno == EINTR);
    if (rc != pid_)
        throw ProcessError("waitpid failed: " + errno_text());
    exit_code_ = decode_status(status);
    running_ = false;
    return exit_code_;
}

void Process::signal_group(int sig)
{
    if (!running_ || pid_ <= 0)
        return;
    // The group is gone once its leader is reaped; fall back to the pid
    if (::kill(-pid_, sig) != 0)
        ::kill(pid_, sig);
}

void Process::terminate()
{
    signal_group(SIGTERM);
}

void Process::kill()
{
    signal_group(SIGKILL);
}

bool Process::shutdown(std::chrono::milliseconds grace)
{
    if (try_wait().has_value())
        return false;
    terminate();
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (!try_wait().has_value())
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            kill();
            wait();
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

} // namespace mcplink::process
