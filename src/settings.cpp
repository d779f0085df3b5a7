#include "mcplink/settings.hpp"

#include <algorithm>
#include <cstdlib>

namespace mcplink
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static long long getenv_int(const char* key, long long defv)
{
    const char* v = std::getenv(key);
    if (!v)
        return defv;
    try
    {
        size_t pos = 0;
        long long parsed = std::stoll(v, &pos, 10);
        if (pos != std::string(v).size() || parsed < 0)
            return defv;
        return parsed;
    }
    catch (const std::exception&)
    {
        return defv;
    }
}

static std::chrono::milliseconds getenv_ms(const char* key, std::chrono::milliseconds defv)
{
    return std::chrono::milliseconds(getenv_int(key, defv.count()));
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPLINK_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.request_timeout = getenv_ms("MCPLINK_REQUEST_TIMEOUT_MS", s.request_timeout);
    s.startup_timeout = getenv_ms("MCPLINK_STARTUP_TIMEOUT_MS", s.startup_timeout);
    s.probe_interval = getenv_ms("MCPLINK_PROBE_INTERVAL_MS", s.probe_interval);
    s.shutdown_grace = getenv_ms("MCPLINK_SHUTDOWN_GRACE_MS", s.shutdown_grace);
    s.restart_base_delay = getenv_ms("MCPLINK_RESTART_BASE_DELAY_MS", s.restart_base_delay);
    s.restart_max_delay = getenv_ms("MCPLINK_RESTART_MAX_DELAY_MS", s.restart_max_delay);
    s.port_range_start =
        static_cast<int>(getenv_int("MCPLINK_PORT_RANGE_START", s.port_range_start));
    s.port_range_end = static_cast<int>(getenv_int("MCPLINK_PORT_RANGE_END", s.port_range_end));
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("request_timeout_ms"))
        s.request_timeout = std::chrono::milliseconds(j.at("request_timeout_ms").get<long long>());
    if (j.contains("startup_timeout_ms"))
        s.startup_timeout = std::chrono::milliseconds(j.at("startup_timeout_ms").get<long long>());
    if (j.contains("probe_interval_ms"))
        s.probe_interval = std::chrono::milliseconds(j.at("probe_interval_ms").get<long long>());
    if (j.contains("shutdown_grace_ms"))
        s.shutdown_grace = std::chrono::milliseconds(j.at("shutdown_grace_ms").get<long long>());
    if (j.contains("restart_base_delay_ms"))
        s.restart_base_delay =
            std::chrono::milliseconds(j.at("restart_base_delay_ms").get<long long>());
    if (j.contains("restart_max_delay_ms"))
        s.restart_max_delay =
            std::chrono::milliseconds(j.at("restart_max_delay_ms").get<long long>());
    if (j.contains("port_range_start"))
        s.port_range_start = j.at("port_range_start").get<int>();
    if (j.contains("port_range_end"))
        s.port_range_end = j.at("port_range_end").get<int>();
    return s;
}

} // namespace mcplink
