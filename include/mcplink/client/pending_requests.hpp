#pragma once
#include "mcplink/protocol/jsonrpc.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mcplink::client
{

/// Correlation table of one transport client: request id -> waiting caller.
///
/// Ids come from a per-table counter starting at 1. Every entry is completed
/// exactly once: by a matching response, by a rejection, or by a timeout.
/// After completion the entry is gone, so a late response for the same id
/// is ignored.
class PendingRequestTable
{
  public:
    using Clock = std::chrono::steady_clock;

    std::int64_t next_id()
    {
        return next_id_.fetch_add(1, std::memory_order_relaxed);
    }

    /// Register `id`; the returned future yields the raw response
    std::future<protocol::Response> add(std::int64_t id, const std::string& method,
                                        Clock::time_point deadline);

    /// Complete the entry matching `response.id`. Returns false for unknown ids.
    bool resolve(const protocol::Response& response);

    bool reject(std::int64_t id, std::exception_ptr error);

    /// Fail the entry with RequestTimeout if it is still waiting
    bool time_out(std::int64_t id);

    /// Fail every entry with TransportError(reason); returns how many were waiting
    size_t reject_all(const std::string& reason);

    /// Fail every entry whose deadline is before `now` with RequestTimeout
    size_t expire(Clock::time_point now);

    /// Drop an entry without completing it
    bool erase(std::int64_t id);

    size_t size() const;

  private:
    struct Entry
    {
        std::promise<protocol::Response> promise;
        std::string method;
        Clock::time_point deadline;
    };

    std::atomic<std::int64_t> next_id_{1};
    mutable std::mutex mutex_;
    std::unordered_map<std::int64_t, Entry> entries_;
};

} // namespace mcplink::client
