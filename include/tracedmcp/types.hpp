#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace tracedmcp
{

using Json = nlohmann::json;

/// Transport headers as seen by the trace-context codec (header name -> value).
using Carrier = std::unordered_map<std::string, std::string>;

} // namespace tracedmcp
