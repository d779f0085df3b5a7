#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace mcplink::util
{

/// One background thread running delayed tasks. Tasks run outside the lock,
/// in deadline order; a cancelled task never runs.
class TimerQueue
{
  public:
    using TimerId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> task);

    /// @return false if the task already ran, was cancelled, or never existed
    bool cancel(TimerId id);

    size_t pending() const;

    /// Drop all pending tasks and join the worker. Called by the destructor.
    void shutdown();

  private:
    struct Timer
    {
        Clock::time_point deadline;
        std::function<void()> task;
    };

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_{1};
    bool stopping_{false};
    std::thread worker_;
};

} // namespace mcplink::util
