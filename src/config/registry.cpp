#include "mcplink/config/registry.hpp"

#include "mcplink/exceptions.hpp"
#include "mcplink/logging.hpp"
#include "mcplink/util/json.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace mcplink::config
{

InMemoryServerRegistry::InMemoryServerRegistry(std::vector<ServerDescriptor> servers)
    : servers_(std::move(servers))
{
}

std::vector<ServerDescriptor> InMemoryServerRegistry::list_all_servers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_;
}

bool InMemoryServerRegistry::set_server_enabled(const std::string& name, bool enabled)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& d : servers_)
    {
        if (d.name == name)
        {
            d.enabled = enabled;
            on_changed(servers_);
            return true;
        }
    }
    return false;
}

void InMemoryServerRegistry::assign_port(const std::string& name, int port)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& d : servers_)
    {
        if (d.name == name)
        {
            d.port = port;
            on_changed(servers_);
            return;
        }
    }
    throw NotFoundError("Unknown MCP server: " + name);
}

void InMemoryServerRegistry::add_server(const ServerDescriptor& descriptor)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(servers_.begin(), servers_.end(),
                           [&](const ServerDescriptor& d) { return d.name == descriptor.name; });
    if (it != servers_.end())
        *it = descriptor;
    else
        servers_.push_back(descriptor);
    on_changed(servers_);
}

bool InMemoryServerRegistry::remove_server(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::remove_if(servers_.begin(), servers_.end(),
                             [&](const ServerDescriptor& d) { return d.name == name; });
    if (it == servers_.end())
        return false;
    servers_.erase(it, servers_.end());
    on_changed(servers_);
    return true;
}

JsonFileServerRegistry::JsonFileServerRegistry(std::filesystem::path path) : path_(std::move(path))
{
    reload();
}

void JsonFileServerRegistry::reload()
{
    std::vector<ServerDescriptor> loaded;
    if (std::filesystem::exists(path_))
    {
        std::ifstream in(path_);
        if (!in)
            throw Error("Cannot open MCP server config: " + path_.string());
        std::stringstream ss;
        ss << in.rdbuf();
        const std::string text = ss.str();
        if (!text.empty())
        {
            Json j;
            try
            {
                j = util::json::parse(text);
            }
            catch (const Json::parse_error& e)
            {
                throw ValidationError("Invalid MCP server config " + path_.string() + ": " +
                                      e.what());
            }
            if (!j.is_array())
                throw ValidationError("MCP server config must be a JSON array: " +
                                      path_.string());
            try
            {
                for (const auto& entry : j)
                    loaded.push_back(entry.get<ServerDescriptor>());
            }
            catch (const Json::exception& e)
            {
                throw ValidationError("Invalid server entry in " + path_.string() + ": " +
                                      e.what());
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    servers_ = std::move(loaded);
}

void JsonFileServerRegistry::on_changed(const std::vector<ServerDescriptor>& servers)
{
    if (path_.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out)
        throw Error("Cannot write MCP server config: " + path_.string());
    out << util::json::dump_pretty(Json(servers)) << "\n";
    log::debug("config", "saved " + std::to_string(servers.size()) + " server(s) to " +
                             path_.string());
}

} // namespace mcplink::config
