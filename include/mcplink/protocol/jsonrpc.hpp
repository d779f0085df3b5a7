#pragma once
/// @file protocol/jsonrpc.hpp
/// @brief JSON-RPC 2.0 envelope types validated at the transport boundary
/// @details Every message read from a server (stdout line, HTTP body, SSE data
///          line) is turned into a Message before anything else looks at it.
///          Anything that is not a well-formed JSON-RPC 2.0 object is rejected
///          here and never reaches the correlation table.

#include "mcplink/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mcplink::protocol
{

/// Standard JSON-RPC error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

struct Request
{
    Json id;
    std::string method;
    Json params = Json::object();
};

struct Notification
{
    std::string method;
    Json params = Json::object();
};

struct RpcError
{
    int code{INTERNAL_ERROR};
    std::string message;
    std::optional<Json> data;
};

struct Response
{
    Json id;
    std::optional<Json> result;
    std::optional<RpcError> error;

    bool is_error() const
    {
        return error.has_value();
    }
};

using Message = std::variant<Request, Notification, Response>;

Json make_request(std::int64_t id, const std::string& method, const Json& params);
Json make_notification(const std::string& method, const Json& params);

/// Validate a decoded JSON value; std::nullopt if it is not a JSON-RPC 2.0 message
std::optional<Message> parse_message(const Json& j);

/// Decode and validate one serialized message; std::nullopt on bad JSON or bad envelope
std::optional<Message> parse_message(const std::string& text);

/// Correlation id as an integer (accepts numeric strings); std::nullopt otherwise
std::optional<std::int64_t> numeric_id(const Json& id);

/// Result payload of a response. Throws ProtocolError when it carries an error object.
Json unwrap(const Response& response);

Json to_json(const Message& message);

} // namespace mcplink::protocol
