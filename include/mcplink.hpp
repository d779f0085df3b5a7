#pragma once

/// @file mcplink.hpp
/// @brief Main header for mcplink - includes commonly used components
///
/// Usage:
/// @code
/// #include <mcplink.hpp>
///
/// int main() {
///     mcplink::config::JsonFileServerRegistry registry("mcp-servers.json");
///     mcplink::supervisor::ProcessSupervisor supervisor(registry);
///     mcplink::manager::Manager manager(registry, supervisor);
///
///     manager.initialize_all_servers();
///     for (const auto& tool : manager.get_all_tools())
///         std::cout << tool.serverName << "/" << tool.name << "\n";
///
///     auto result = manager.call_tool("fs", "read_file", {{"path", "/tmp/a.txt"}});
/// }
/// @endcode

// Core types and exceptions
#include "mcplink/exceptions.hpp"
#include "mcplink/logging.hpp"
#include "mcplink/settings.hpp"
#include "mcplink/types.hpp"

// Configuration
#include "mcplink/config/registry.hpp"
#include "mcplink/config/server_descriptor.hpp"

// Clients
#include "mcplink/client/http_client.hpp"
#include "mcplink/client/stdio_client.hpp"
#include "mcplink/client/types.hpp"

// Lifecycle and aggregation
#include "mcplink/manager/manager.hpp"
#include "mcplink/supervisor/process_supervisor.hpp"
#include "mcplink/toolset.hpp"
