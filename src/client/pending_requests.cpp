#include "mcplink/client/pending_requests.hpp"

#include "mcplink/exceptions.hpp"

#include <vector>

namespace mcplink::client
{

std::future<protocol::Response> PendingRequestTable::add(std::int64_t id, const std::string& method,
                                                         Clock::time_point deadline)
{
    Entry entry;
    entry.method = method;
    entry.deadline = deadline;
    auto future = entry.promise.get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!entries_.emplace(id, std::move(entry)).second)
        throw ValidationError("Duplicate request id " + std::to_string(id));
    return future;
}

bool PendingRequestTable::resolve(const protocol::Response& response)
{
    auto id = protocol::numeric_id(response.id);
    if (!id)
        return false;

    std::promise<protocol::Response> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(*id);
        if (it == entries_.end())
            return false;
        promise = std::move(it->second.promise);
        entries_.erase(it);
    }
    promise.set_value(response);
    return true;
}

bool PendingRequestTable::reject(std::int64_t id, std::exception_ptr error)
{
    std::promise<protocol::Response> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end())
            return false;
        promise = std::move(it->second.promise);
        entries_.erase(it);
    }
    promise.set_exception(error);
    return true;
}

bool PendingRequestTable::time_out(std::int64_t id)
{
    std::string method;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end())
            return false;
        method = it->second.method;
    }
    return reject(id, std::make_exception_ptr(RequestTimeout("Request timed out: " + method + " (id " +
                                                             std::to_string(id) + ")")));
}

size_t PendingRequestTable::reject_all(const std::string& reason)
{
    std::unordered_map<std::int64_t, Entry> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        taken.swap(entries_);
    }
    for (auto& [id, entry] : taken)
        entry.promise.set_exception(std::make_exception_ptr(TransportError(reason)));
    return taken.size();
}

size_t PendingRequestTable::expire(Clock::time_point now)
{
    std::vector<std::int64_t> overdue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_)
            if (entry.deadline <= now)
                overdue.push_back(id);
    }
    size_t count = 0;
    for (auto id : overdue)
        if (time_out(id))
            ++count;
    return count;
}

bool PendingRequestTable::erase(std::int64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(id) > 0;
}

size_t PendingRequestTable::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace mcplink::client
