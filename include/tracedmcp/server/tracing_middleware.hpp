#pragma once
#include "tracedmcp/server/middleware_pipeline.hpp"
#include "tracedmcp/telemetry/tracer.hpp"
#include "tracedmcp/tools/manager.hpp"

#include <memory>

namespace tracedmcp::server
{

/// Opens one server span per request around the rest of the chain.
///
/// The span is parented on ctx.trace_context and exposed to later stages through ctx.span.
/// tools/call spans are named after the tool; every other request after its method.
/// Notifications, and tools/call requests without an arguments object or naming an
/// unregistered tool, pass through without a span. The span is closed before the response
/// leaves this stage, with Error status when the response carries a JSON-RPC error.
class TracingMiddleware : public Middleware
{
  public:
    TracingMiddleware(std::shared_ptr<const telemetry::Tracer> tracer,
                      const tools::ToolManager& tools);

    Json operator()(const MiddlewareContext& ctx, CallNext call_next) override;

  private:
    std::shared_ptr<const telemetry::Tracer> tracer_;
    const tools::ToolManager& tools_;
};

} // namespace tracedmcp::server
