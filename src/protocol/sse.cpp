#include "mcplink/protocol/sse.hpp"

namespace mcplink::protocol
{

void SseDecoder::feed(const char* data, size_t len)
{
    buffer_.append(data, len);

    size_t start = 0;
    while (true)
    {
        size_t nl = buffer_.find('\n', start);
        if (nl == std::string::npos)
            break;
        process_line(buffer_.substr(start, nl - start));
        start = nl + 1;
    }
    if (start > 0)
        buffer_.erase(0, start);
}

void SseDecoder::finish()
{
    if (buffer_.empty())
        return;
    std::string rest;
    rest.swap(buffer_);
    process_line(std::move(rest));
}

void SseDecoder::process_line(std::string line)
{
    // Strip trailing \r for CRLF line endings
    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    if (line.rfind("data:", 0) != 0)
        return;

    std::string data_part = line.substr(5);
    if (!data_part.empty() && data_part[0] == ' ')
        data_part.erase(0, 1);
    if (data_part.empty())
        return;

    auto message = parse_message(data_part);
    if (!message)
        return;

    ++messages_seen_;
    if (auto* response = std::get_if<Response>(&*message))
        last_response_ = std::move(*response);
}

} // namespace mcplink::protocol
