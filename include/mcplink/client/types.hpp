#pragma once
/// @file client/types.hpp
/// @brief Catalog and result types cached and returned by transport clients
/// @details Field names mirror the MCP wire format so the nlohmann adapters stay
///          one-to-one with what servers send.

#include "mcplink/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mcplink::client
{

/// Tool as returned by tools/list, tagged with the server that owns it
struct ToolDescriptor
{
    std::string name;
    std::optional<std::string> description;
    Json inputSchema = Json::object();
    std::string serverName;
};

/// Resource as returned by resources/list
struct ResourceDescriptor
{
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;
    std::string serverName;
};

/// Identity reported by the server during initialize, plus the cached catalog
struct ServerInfo
{
    std::string name;
    std::string version;
    std::vector<ToolDescriptor> tools;
    std::vector<ResourceDescriptor> resources;
};

/// One block of a tool result: {type, text?, data?, mimeType?}
struct ContentItem
{
    std::string type{"text"};
    std::optional<std::string> text;
    std::optional<std::string> data;
    std::optional<std::string> mimeType;
};

/// Normalized tools/call result. Call paths report failures here instead of throwing.
struct CallToolResult
{
    std::vector<ContentItem> content;
    bool isError{false};
    std::optional<Json> meta;

    /// Text of the first text block, or empty
    std::string text() const
    {
        for (const auto& item : content)
            if (item.type == "text" && item.text)
                return *item.text;
        return "";
    }
};

inline CallToolResult make_error_result(const std::string& message)
{
    CallToolResult r;
    ContentItem item;
    item.text = message;
    r.content.push_back(std::move(item));
    r.isError = true;
    return r;
}

// nlohmann::json adapters

inline void to_json(Json& j, const ToolDescriptor& t)
{
    j = Json{{"name", t.name}, {"inputSchema", t.inputSchema}};
    if (t.description)
        j["description"] = *t.description;
    if (!t.serverName.empty())
        j["serverName"] = t.serverName;
}

inline void from_json(const Json& j, ToolDescriptor& t)
{
    t.name = j.at("name").get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        t.description = j["description"].get<std::string>();
    t.inputSchema = j.value("inputSchema", Json::object());
    t.serverName = j.value("serverName", std::string());
}

inline void to_json(Json& j, const ResourceDescriptor& r)
{
    j = Json{{"uri", r.uri}, {"name", r.name}};
    if (r.description)
        j["description"] = *r.description;
    if (r.mimeType)
        j["mimeType"] = *r.mimeType;
    if (!r.serverName.empty())
        j["serverName"] = r.serverName;
}

inline void from_json(const Json& j, ResourceDescriptor& r)
{
    r.uri = j.at("uri").get<std::string>();
    r.name = j.value("name", r.uri);
    if (j.contains("description") && j["description"].is_string())
        r.description = j["description"].get<std::string>();
    if (j.contains("mimeType") && j["mimeType"].is_string())
        r.mimeType = j["mimeType"].get<std::string>();
    r.serverName = j.value("serverName", std::string());
}

inline void to_json(Json& j, const ContentItem& c)
{
    j = Json{{"type", c.type}};
    if (c.text)
        j["text"] = *c.text;
    if (c.data)
        j["data"] = *c.data;
    if (c.mimeType)
        j["mimeType"] = *c.mimeType;
}

inline void from_json(const Json& j, ContentItem& c)
{
    c.type = j.value("type", "text");
    if (j.contains("text") && j["text"].is_string())
        c.text = j["text"].get<std::string>();
    if (j.contains("data") && j["data"].is_string())
        c.data = j["data"].get<std::string>();
    if (j.contains("mimeType") && j["mimeType"].is_string())
        c.mimeType = j["mimeType"].get<std::string>();
}

inline void to_json(Json& j, const CallToolResult& r)
{
    j = Json{{"content", r.content}, {"isError", r.isError}};
    if (r.meta)
        j["_meta"] = *r.meta;
}

/// Missing content becomes [], missing isError becomes false
inline void from_json(const Json& j, CallToolResult& r)
{
    r.content.clear();
    if (j.contains("content") && j["content"].is_array())
        for (const auto& item : j["content"])
            if (item.is_object())
                r.content.push_back(item.get<ContentItem>());
    r.isError = j.contains("isError") && j["isError"].is_boolean() && j["isError"].get<bool>();
    if (j.contains("_meta"))
        r.meta = j["_meta"];
}

} // namespace mcplink::client
