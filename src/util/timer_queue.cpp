#include "mcplink/util/timer_queue.hpp"

#include "mcplink/logging.hpp"

#include <exception>

namespace mcplink::util
{

TimerQueue::TimerQueue() : worker_([this]() { run(); }) {}

TimerQueue::~TimerQueue()
{
    shutdown();
}

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds delay, std::function<void()> task)
{
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        timers_[id] = Timer{Clock::now() + delay, std::move(task)};
    }
    cv_.notify_all();
    return id;
}

bool TimerQueue::cancel(TimerId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.erase(id) > 0;
}

size_t TimerQueue::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void TimerQueue::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        timers_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        worker_.join();
}

void TimerQueue::run()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_)
    {
        if (timers_.empty())
        {
            cv_.wait(lock);
            continue;
        }

        auto next = timers_.begin();
        for (auto it = timers_.begin(); it != timers_.end(); ++it)
            if (it->second.deadline < next->second.deadline)
                next = it;

        if (next->second.deadline > Clock::now())
        {
            cv_.wait_until(lock, next->second.deadline);
            continue;
        }

        auto task = std::move(next->second.task);
        timers_.erase(next);
        lock.unlock();
        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            log::error("timer", std::string("scheduled task failed: ") + e.what());
        }
        lock.lock();
    }
}

} // namespace mcplink::util
