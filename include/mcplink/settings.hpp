#pragma once
#include "mcplink/types.hpp"

#include <chrono>
#include <string>

namespace mcplink
{

struct Settings
{
    std::string log_level{"INFO"};

    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds startup_timeout{10000};
    std::chrono::milliseconds probe_interval{500};
    std::chrono::milliseconds shutdown_grace{5000};
    std::chrono::milliseconds restart_base_delay{1000};
    std::chrono::milliseconds restart_max_delay{30000};

    int port_range_start{3001};
    int port_range_end{3999};

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace mcplink
