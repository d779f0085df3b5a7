#pragma once
#include "mcplink/protocol/jsonrpc.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace mcplink::protocol
{

/// Incremental decoder for `text/event-stream` response bodies.
///
/// Chunks may split lines anywhere. Each complete `data: <json>` line is
/// validated as a JSON-RPC message; the last well-formed response wins.
/// Fragments that do not parse are dropped silently.
class SseDecoder
{
  public:
    void feed(const char* data, size_t len);
    void feed(const std::string& chunk)
    {
        feed(chunk.data(), chunk.size());
    }

    /// Process a trailing line that was not newline-terminated
    void finish();

    const std::optional<Response>& last_response() const
    {
        return last_response_;
    }

    size_t messages_seen() const
    {
        return messages_seen_;
    }

  private:
    void process_line(std::string line);

    std::string buffer_;
    std::optional<Response> last_response_;
    size_t messages_seen_{0};
};

} // namespace mcplink::protocol
