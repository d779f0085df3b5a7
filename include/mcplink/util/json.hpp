#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace mcplink::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
inline std::string dump(const json& j)
{
    return j.dump();
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent);
}

} // namespace mcplink::util::json
