#pragma once
#include "tracedmcp/tools/tool.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracedmcp::tools
{

enum class ToolErrorKind
{
    NotFound,       ///< No tool registered under the requested name
    InvalidParams,  ///< Arguments rejected by the input schema; handler not run
    ExecutionFailed ///< Handler (or its data source) failed
};

std::string to_string(ToolErrorKind kind);

struct ToolError
{
    ToolErrorKind kind;
    std::string message;
    std::string detail;
};

/// Outcome of ToolManager::invoke: exactly one of value / error is set.
struct InvocationResult
{
    std::optional<Json> value;
    std::optional<ToolError> error;

    bool ok() const
    {
        return !error.has_value();
    }

    static InvocationResult success(Json v)
    {
        InvocationResult r;
        r.value = std::move(v);
        return r;
    }
    static InvocationResult failure(ToolErrorKind kind, std::string message,
                                    std::string detail = "")
    {
        InvocationResult r;
        r.error = ToolError{kind, std::move(message), std::move(detail)};
        return r;
    }
};

/// Name-keyed tool registry. Populated at startup, read-only while serving.
class ToolManager
{
  public:
    /// Throws ValidationError if a tool with the same name is already registered.
    void register_tool(Tool t);

    bool has(const std::string& name) const
    {
        return tools_.count(name) > 0;
    }
    /// Throws NotFoundError for unknown names.
    const Tool& get(const std::string& name) const;

    /// Validate `args` against the tool's input schema, then run the handler.
    /// Never throws: every failure is reported as a ToolError.
    InvocationResult invoke(const std::string& name, const Json& args) const;

    /// Names in registration order.
    const std::vector<std::string>& list_names() const
    {
        return order_;
    }
    /// tools/list entries in registration order.
    Json list_descriptors() const;

    std::size_t size() const
    {
        return tools_.size();
    }

  private:
    std::unordered_map<std::string, Tool> tools_;
    std::vector<std::string> order_;
};

} // namespace tracedmcp::tools
