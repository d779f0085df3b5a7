#pragma once
#include "mcplink/config/server_descriptor.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcplink::config
{

/// Source of truth for server descriptors. The manager and the supervisor read
/// from it and write back enabled flags and assigned ports.
class ServerRegistry
{
  public:
    virtual ~ServerRegistry() = default;

    virtual std::vector<ServerDescriptor> list_all_servers() const = 0;

    virtual std::vector<ServerDescriptor> list_enabled_servers() const
    {
        std::vector<ServerDescriptor> out;
        for (auto& d : list_all_servers())
            if (d.enabled)
                out.push_back(std::move(d));
        return out;
    }

    virtual std::optional<ServerDescriptor> find_server(const std::string& name) const
    {
        for (auto& d : list_all_servers())
            if (d.name == name)
                return d;
        return std::nullopt;
    }

    /// @return false if no server with that name exists
    virtual bool set_server_enabled(const std::string& name, bool enabled) = 0;

    virtual void assign_port(const std::string& name, int port) = 0;

    /// Insert or replace by name
    virtual void add_server(const ServerDescriptor& descriptor) = 0;

    /// @return false if no server with that name exists
    virtual bool remove_server(const std::string& name) = 0;
};

class InMemoryServerRegistry : public ServerRegistry
{
  public:
    InMemoryServerRegistry() = default;
    explicit InMemoryServerRegistry(std::vector<ServerDescriptor> servers);

    std::vector<ServerDescriptor> list_all_servers() const override;
    bool set_server_enabled(const std::string& name, bool enabled) override;
    void assign_port(const std::string& name, int port) override;
    void add_server(const ServerDescriptor& descriptor) override;
    bool remove_server(const std::string& name) override;

  protected:
    /// Called with the lock held after every successful mutation
    virtual void on_changed(const std::vector<ServerDescriptor>& /*servers*/) {}

    mutable std::mutex mutex_;
    std::vector<ServerDescriptor> servers_;
};

/// Registry persisted as a JSON array; the file is rewritten after every change.
class JsonFileServerRegistry : public InMemoryServerRegistry
{
  public:
    /// Loads `path` if it exists; a missing file is an empty registry
    explicit JsonFileServerRegistry(std::filesystem::path path);

    const std::filesystem::path& path() const
    {
        return path_;
    }

    /// Re-read the file, discarding in-memory state
    void reload();

  protected:
    void on_changed(const std::vector<ServerDescriptor>& servers) override;

  private:
    std::filesystem::path path_;
};

} // namespace mcplink::config
