#pragma once
/// @file jsonrpc.hpp
/// @brief JSON-RPC 2.0 envelope helpers and the error codes the server answers with

#include "tracedmcp/types.hpp"

#include <optional>
#include <string>

namespace tracedmcp::mcp
{

constexpr const char* JSONRPC_VERSION = "2.0";

namespace ErrorCode
{
/// Body is not JSON, or the envelope is structurally invalid
constexpr int ParseError = -32700;
constexpr int MethodNotFound = -32601;
/// Missing tool name/arguments, unknown tool, or arguments rejected by the input schema
constexpr int InvalidParams = -32602;
/// Tool handler failed, or an unexpected exception escaped the dispatcher
constexpr int ExecutionFailed = -32603;
} // namespace ErrorCode

inline Json make_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"result", std::move(result)}};
}

inline Json make_error(const Json& id, int code, const std::string& message,
                       std::optional<Json> data = std::nullopt)
{
    Json error = {{"code", code}, {"message", message}};
    if (data)
        error["data"] = std::move(*data);
    return Json{{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"error", std::move(error)}};
}

inline bool is_error(const Json& response)
{
    return response.is_object() && response.contains("error");
}

} // namespace tracedmcp::mcp
