#include "mcplink/protocol/jsonrpc.hpp"

#include "mcplink/exceptions.hpp"

namespace mcplink::protocol
{

namespace
{
bool is_valid_id(const Json& id)
{
    return id.is_number_integer() || id.is_string();
}

RpcError parse_error_object(const Json& j)
{
    RpcError err;
    if (!j.is_object())
    {
        err.message = j.is_string() ? j.get<std::string>() : j.dump();
        return err;
    }
    if (j.contains("code") && j["code"].is_number_integer())
        err.code = j["code"].get<int>();
    if (j.contains("message") && j["message"].is_string())
        err.message = j["message"].get<std::string>();
    if (j.contains("data"))
        err.data = j["data"];
    return err;
}
} // namespace

Json make_request(std::int64_t id, const std::string& method, const Json& params)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

Json make_notification(const std::string& method, const Json& params)
{
    return Json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
}

std::optional<Message> parse_message(const Json& j)
{
    if (!j.is_object())
        return std::nullopt;
    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() || version->get<std::string>() != "2.0")
        return std::nullopt;

    const bool has_id = j.contains("id") && !j["id"].is_null();
    const bool has_method = j.contains("method");

    if (has_method)
    {
        if (!j["method"].is_string())
            return std::nullopt;
        Json params = j.value("params", Json::object());
        if (has_id)
        {
            if (!is_valid_id(j["id"]))
                return std::nullopt;
            return Message{Request{j["id"], j["method"].get<std::string>(), std::move(params)}};
        }
        return Message{Notification{j["method"].get<std::string>(), std::move(params)}};
    }

    const bool has_result = j.contains("result");
    const bool has_error = j.contains("error") && !j["error"].is_null();
    if (has_result == has_error)
        return std::nullopt;

    // Error responses may carry a null id when the server could not read ours
    if (!has_id && !has_error)
        return std::nullopt;
    if (has_id && !is_valid_id(j["id"]))
        return std::nullopt;

    Response response;
    response.id = has_id ? j["id"] : Json();
    if (has_result)
        response.result = j["result"];
    else
        response.error = parse_error_object(j["error"]);
    return Message{std::move(response)};
}

std::optional<Message> parse_message(const std::string& text)
{
    Json j = Json::parse(text, nullptr, false);
    if (j.is_discarded())
        return std::nullopt;
    return parse_message(j);
}

std::optional<std::int64_t> numeric_id(const Json& id)
{
    if (id.is_number_integer())
        return id.get<std::int64_t>();
    if (id.is_string())
    {
        const auto& s = id.get_ref<const std::string&>();
        try
        {
            size_t pos = 0;
            auto v = std::stoll(s, &pos, 10);
            if (pos == s.size())
                return v;
        }
        catch (const std::exception&)
        {
            // not numeric
        }
    }
    return std::nullopt;
}

Json unwrap(const Response& response)
{
    if (response.error)
    {
        std::string message = response.error->message.empty() ? "MCP error"
                                                              : response.error->message;
        throw ProtocolError(message, response.error->code);
    }
    return response.result.value_or(Json::object());
}

Json to_json(const Message& message)
{
    if (auto* req = std::get_if<Request>(&message))
        return Json{{"jsonrpc", "2.0"}, {"id", req->id}, {"method", req->method},
                    {"params", req->params}};
    if (auto* note = std::get_if<Notification>(&message))
        return make_notification(note->method, note->params);

    const auto& resp = std::get<Response>(message);
    Json j{{"jsonrpc", "2.0"}, {"id", resp.id}};
    if (resp.error)
    {
        Json err{{"code", resp.error->code}, {"message", resp.error->message}};
        if (resp.error->data)
            err["data"] = *resp.error->data;
        j["error"] = std::move(err);
    }
    else
    {
        j["result"] = resp.result.value_or(Json::object());
    }
    return j;
}

} // namespace mcplink::protocol
