#pragma once
/// @file dispatcher.hpp
/// @brief Transport-independent JSON-RPC handling for the tool server
///
/// The Dispatcher validates the request envelope, resolves the caller's trace context,
/// opens the request span and routes to the MCP methods it serves:
/// initialize, ping, notifications/*, tools/list and tools/call.

#include "tracedmcp/server/middleware_pipeline.hpp"
#include "tracedmcp/telemetry/tracer.hpp"
#include "tracedmcp/tools/manager.hpp"
#include "tracedmcp/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tracedmcp::mcp
{

/// Protocol revisions initialize will echo back; anything else gets the oldest.
extern const std::vector<std::string> SUPPORTED_PROTOCOL_VERSIONS;
constexpr const char* DEFAULT_PROTOCOL_VERSION = "2024-11-05";

struct ServerInfo
{
    std::string name;
    std::string version;
    std::optional<std::string> instructions;
};

class Dispatcher
{
  public:
    /// Tools and tracer must outlive the dispatcher. The default chain is
    /// propagation -> tracing -> logging.
    Dispatcher(ServerInfo info, const tools::ToolManager& tools,
               std::shared_ptr<const telemetry::Tracer> tracer);

    /// Append a stage after the built-in ones (closest to the route).
    void add_middleware(std::shared_ptr<server::Middleware> mw);

    /// Handle one decoded HTTP body, a single message or a batch array.
    /// Returns nullopt when nothing should be sent back (notifications only).
    std::optional<Json> handle(const Json& message, const Carrier& headers) const;

    const ServerInfo& info() const
    {
        return info_;
    }

  private:
    std::optional<Json> handle_single(const Json& message, const Carrier& headers) const;
    Json route(const server::MiddlewareContext& ctx) const;

    Json handle_initialize(const server::MiddlewareContext& ctx) const;
    Json handle_tools_call(const server::MiddlewareContext& ctx) const;

    ServerInfo info_;
    const tools::ToolManager& tools_;
    std::shared_ptr<const telemetry::Tracer> tracer_;
    server::MiddlewarePipeline pipeline_;
};

} // namespace tracedmcp::mcp
