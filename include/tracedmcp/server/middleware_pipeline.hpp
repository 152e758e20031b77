#pragma once
/// @file middleware_pipeline.hpp
/// @brief Composable request middleware for the JSON-RPC dispatcher
///
/// Each stage receives the current MiddlewareContext and a CallNext capability and returns
/// the JSON-RPC response envelope. The dispatcher builds the chain explicitly:
///   propagation -> tracing -> logging -> route
///
/// Built-in stages:
/// - PropagationMiddleware: extracts the caller's trace context from transport headers
/// - TracingMiddleware:     wraps the request in a server span (see tracing_middleware.hpp)
/// - LoggingMiddleware:     request/response log lines tagged with the trace id

#include "tracedmcp/telemetry/trace_context.hpp"
#include "tracedmcp/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tracedmcp::telemetry
{
class SpanScope;
}

namespace tracedmcp::server
{

/// Context passed through the middleware chain
struct MiddlewareContext
{
    Json message;                                    ///< The JSON-RPC request envelope
    std::string method;                              ///< JSON-RPC method name
    Json params = Json::object();                    ///< Request params (object)
    std::optional<Json> request_id;                  ///< Absent for notifications
    Carrier headers;                                 ///< Transport headers of the request
    telemetry::TraceContext trace_context;           ///< Parent for spans of this request
    telemetry::SpanScope* span{nullptr};             ///< Request span, when one is open
    std::chrono::steady_clock::time_point timestamp; ///< When the request was received

    bool is_notification() const
    {
        return !request_id.has_value();
    }

    /// Create a copy with modified fields
    MiddlewareContext copy() const
    {
        return *this;
    }
};

/// CallNext function type - invokes next middleware or the final route
using CallNext = std::function<Json(const MiddlewareContext&)>;

/// Base middleware class with virtual hooks for each method
class Middleware
{
  public:
    virtual ~Middleware() = default;

    /// Main entry point - wraps call_next with this middleware's logic
    virtual Json operator()(const MiddlewareContext& ctx, CallNext call_next)
    {
        return dispatch(ctx, std::move(call_next));
    }

  protected:
    /// Dispatch to appropriate hook based on method
    virtual Json dispatch(const MiddlewareContext& ctx, CallNext call_next)
    {
        const auto& method = ctx.method;

        if (method == "initialize")
            return on_initialize(ctx, std::move(call_next));
        if (method == "tools/call")
            return on_call_tool(ctx, std::move(call_next));
        if (method == "tools/list")
            return on_list_tools(ctx, std::move(call_next));

        if (ctx.is_notification())
            return on_notification(ctx, std::move(call_next));
        return on_request(ctx, std::move(call_next));
    }

    virtual Json on_request(const MiddlewareContext& ctx, CallNext call_next)
    {
        return call_next(ctx);
    }

    virtual Json on_notification(const MiddlewareContext& ctx, CallNext call_next)
    {
        return call_next(ctx);
    }

    virtual Json on_initialize(const MiddlewareContext& ctx, CallNext call_next)
    {
        return on_request(ctx, std::move(call_next));
    }

    virtual Json on_call_tool(const MiddlewareContext& ctx, CallNext call_next)
    {
        return on_request(ctx, std::move(call_next));
    }

    virtual Json on_list_tools(const MiddlewareContext& ctx, CallNext call_next)
    {
        return on_request(ctx, std::move(call_next));
    }
};

/// Middleware pipeline - chains multiple middleware together
class MiddlewarePipeline
{
  public:
    /// Add middleware to the pipeline (executed in order added)
    void add(std::shared_ptr<Middleware> mw)
    {
        middleware_.push_back(std::move(mw));
    }

    /// Execute the pipeline with a final handler
    Json execute(const MiddlewareContext& ctx, CallNext final_handler) const
    {
        // Build chain in reverse order so first-added executes first
        CallNext chain = std::move(final_handler);

        for (auto it = middleware_.rbegin(); it != middleware_.rend(); ++it)
        {
            auto& mw = *it;
            chain = [mw, next = std::move(chain)](const MiddlewareContext& c)
            { return (*mw)(c, next); };
        }

        return chain(ctx);
    }

    bool empty() const
    {
        return middleware_.empty();
    }
    size_t size() const
    {
        return middleware_.size();
    }

  private:
    std::vector<std::shared_ptr<Middleware>> middleware_;
};

// =============================================================================
// Built-in Middleware Implementations
// =============================================================================

/// Resolves ctx.trace_context from the traceparent/tracestate headers.
/// Absent or malformed headers give a fresh root context.
class PropagationMiddleware : public Middleware
{
  public:
    Json operator()(const MiddlewareContext& ctx, CallNext call_next) override;
};

/// Logging middleware - logs requests and responses
class LoggingMiddleware : public Middleware
{
  public:
    using LogCallback = std::function<void(const std::string&)>;

    /// Default callback writes through util::log at INFO level
    explicit LoggingMiddleware(LogCallback callback = nullptr, bool log_payload = false);

    /// Override operator() to intercept all requests (bypasses dispatch)
    Json operator()(const MiddlewareContext& ctx, CallNext call_next) override;

  private:
    LogCallback callback_;
    bool log_payload_;
};

} // namespace tracedmcp::server
