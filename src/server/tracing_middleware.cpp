#include "tracedmcp/server/tracing_middleware.hpp"

#include "tracedmcp/mcp/jsonrpc.hpp"

namespace tracedmcp::server
{

namespace
{

std::string request_id_string(const Json& id)
{
    return id.is_string() ? id.get<std::string>() : id.dump();
}

void record_outcome(telemetry::SpanScope& span, const Json& response)
{
    if (!mcp::is_error(response))
    {
        span.set_status(telemetry::StatusCode::Ok);
        return;
    }

    const auto& error = response["error"];
    span.set_attribute("rpc.jsonrpc.error_code", error.value("code", 0));
    std::string message = error.value("message", "");
    if (error.contains("data") && error["data"].is_object())
    {
        const auto& data = error["data"];
        if (data.contains("kind") && data["kind"].is_string())
            span.set_attribute("error.type", data["kind"]);
        std::string detail = data.value("detail", "");
        if (!detail.empty())
            message += ": " + detail;
    }
    span.set_status(telemetry::StatusCode::Error, message);
}

} // namespace

TracingMiddleware::TracingMiddleware(std::shared_ptr<const telemetry::Tracer> tracer,
                                     const tools::ToolManager& tools)
    : tracer_(std::move(tracer)), tools_(tools)
{
}

Json TracingMiddleware::operator()(const MiddlewareContext& ctx, CallNext call_next)
{
    if (ctx.is_notification())
        return call_next(ctx);

    std::string span_name = ctx.method;
    std::string tool_name;
    if (ctx.method == "tools/call")
    {
        if (ctx.params.is_object() && ctx.params.contains("name") &&
            ctx.params["name"].is_string())
            tool_name = ctx.params["name"].get<std::string>();
        bool has_arguments = ctx.params.is_object() && ctx.params.contains("arguments") &&
                             ctx.params["arguments"].is_object();
        if (tool_name.empty() || !has_arguments || !tools_.has(tool_name))
            return call_next(ctx);
        span_name = tool_name;
    }

    auto span = tracer_->start_span(ctx.trace_context, span_name, telemetry::SpanKind::Server);
    span.set_attributes({{"rpc.system", "jsonrpc"},
                         {"rpc.method", ctx.method},
                         {"rpc.jsonrpc.request_id", request_id_string(*ctx.request_id)}});
    if (!tool_name.empty())
        span.set_attribute("mcp.tool.name", tool_name);

    auto next_ctx = ctx.copy();
    next_ctx.span = &span;

    Json response;
    try
    {
        response = call_next(next_ctx);
    }
    catch (const std::exception& e)
    {
        span.record_exception(e.what());
        span.end();
        throw;
    }

    record_outcome(span, response);
    span.end();
    return response;
}

} // namespace tracedmcp::server
