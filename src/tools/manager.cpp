#include "tracedmcp/tools/manager.hpp"

#include "tracedmcp/exceptions.hpp"
#include "tracedmcp/util/json_schema.hpp"

namespace tracedmcp::tools
{

std::string to_string(ToolErrorKind kind)
{
    switch (kind)
    {
    case ToolErrorKind::NotFound:
        return "NotFound";
    case ToolErrorKind::InvalidParams:
        return "InvalidParams";
    case ToolErrorKind::ExecutionFailed:
        return "ExecutionFailed";
    }
    return "ExecutionFailed";
}

void ToolManager::register_tool(Tool t)
{
    if (t.name().empty())
        throw ValidationError("tool name must not be empty");
    if (tools_.count(t.name()))
        throw ValidationError("tool already registered: " + t.name());
    order_.push_back(t.name());
    auto name = t.name();
    tools_.emplace(std::move(name), std::move(t));
}

const Tool& ToolManager::get(const std::string& name) const
{
    auto it = tools_.find(name);
    if (it == tools_.end())
        throw NotFoundError("tool not found: " + name);
    return it->second;
}

InvocationResult ToolManager::invoke(const std::string& name, const Json& args) const
{
    auto it = tools_.find(name);
    if (it == tools_.end())
        return InvocationResult::failure(ToolErrorKind::NotFound, "Unknown tool: " + name);
    const Tool& tool = it->second;

    if (!tool.input_schema().is_null())
    {
        try
        {
            util::schema::validate(tool.input_schema(), args);
        }
        catch (const ValidationError& e)
        {
            return InvocationResult::failure(ToolErrorKind::InvalidParams,
                                             "Invalid arguments for tool '" + name + "'",
                                             e.what());
        }
    }

    try
    {
        return InvocationResult::success(tool.invoke(args));
    }
    catch (const std::exception& e)
    {
        return InvocationResult::failure(ToolErrorKind::ExecutionFailed,
                                         "Tool '" + name + "' failed", e.what());
    }
    catch (...)
    {
        // Non-standard exception types still must not reach the dispatcher
        return InvocationResult::failure(ToolErrorKind::ExecutionFailed,
                                         "Tool '" + name + "' failed", "unknown exception");
    }
}

Json ToolManager::list_descriptors() const
{
    Json out = Json::array();
    for (const auto& name : order_)
        out.push_back(tools_.at(name).descriptor());
    return out;
}

} // namespace tracedmcp::tools
