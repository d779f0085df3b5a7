#include "mcplink/config/server_descriptor.hpp"

#include "mcplink/exceptions.hpp"

#include <sstream>

namespace mcplink::config
{

std::vector<std::string> command_line(const ServerDescriptor& d)
{
    std::vector<std::string> parts;
    std::istringstream in(d.command);
    std::string token;
    while (in >> token)
        parts.push_back(token);
    parts.insert(parts.end(), d.args.begin(), d.args.end());
    return parts;
}

std::string endpoint_url(const ServerDescriptor& d)
{
    if (!d.http_url.empty())
        return d.http_url;
    if (!d.port)
        throw ValidationError("Server '" + d.name + "' has neither an httpUrl nor a port");
    return "http://127.0.0.1:" + std::to_string(*d.port) + "/mcp";
}

void to_json(Json& j, const ServerDescriptor& d)
{
    j = Json{{"name", d.name},       {"type", to_string(d.kind)}, {"command", d.command},
             {"args", d.args},       {"env", d.env},              {"enabled", d.enabled},
             {"description", d.description}};
    if (!d.http_url.empty())
        j["httpUrl"] = d.http_url;
    if (d.port)
        j["port"] = *d.port;
}

void from_json(const Json& j, ServerDescriptor& d)
{
    d.name = j.at("name").get<std::string>();
    if (d.name.empty())
        throw ValidationError("Server descriptor has an empty name");
    d.kind = transport_kind_from_string(j.value("type", std::string("stdio")));
    d.command = j.value("command", std::string());
    d.args = j.value("args", std::vector<std::string>{});
    d.env = j.value("env", std::map<std::string, std::string>{});
    d.http_url = j.value("httpUrl", std::string());
    if (j.contains("port") && j["port"].is_number_integer())
        d.port = j["port"].get<int>();
    else
        d.port.reset();
    d.enabled = j.value("enabled", true);
    d.description = j.value("description", std::string());
}

} // namespace mcplink::config
