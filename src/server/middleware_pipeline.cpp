#include "tracedmcp/server/middleware_pipeline.hpp"

#include "tracedmcp/telemetry/propagation.hpp"
#include "tracedmcp/telemetry/tracer.hpp"
#include "tracedmcp/util/log.hpp"

namespace tracedmcp::server
{

Json PropagationMiddleware::operator()(const MiddlewareContext& ctx, CallNext call_next)
{
    auto next_ctx = ctx.copy();
    next_ctx.trace_context = telemetry::propagation::extract(ctx.headers);
    if (next_ctx.trace_context.remote)
        util::log::debug("traceparent " + telemetry::propagation::format_traceparent(
                                              next_ctx.trace_context) +
                         " for " + ctx.method);
    else
        util::log::debug("no usable traceparent for " + ctx.method + ", starting a new trace");
    return call_next(next_ctx);
}

LoggingMiddleware::LoggingMiddleware(LogCallback callback, bool log_payload)
    : callback_(std::move(callback)), log_payload_(log_payload)
{
    if (!callback_)
        callback_ = [](const std::string& msg) { util::log::info(msg); };
}

Json LoggingMiddleware::operator()(const MiddlewareContext& ctx, CallNext call_next)
{
    auto start = std::chrono::steady_clock::now();

    // Prefer the id of the request span; fall back to the parent trace
    std::string trace_id = ctx.trace_context.trace_id;
    if (ctx.span)
        trace_id = ctx.span->span().trace_id;

    std::string req_msg = "REQUEST " + ctx.method + " trace=" + trace_id;
    if (log_payload_)
        req_msg += " payload=" + ctx.params.dump();
    callback_(req_msg);

    try
    {
        auto result = call_next(ctx);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::string resp_msg =
            "RESPONSE " + ctx.method + " (" + std::to_string(elapsed.count()) + "ms)";
        if (result.is_object() && result.contains("error"))
            resp_msg += " error=" + result["error"].value("message", "");
        else if (log_payload_ && result.is_object() && result.contains("result"))
            resp_msg += " result=" + result["result"].dump();
        callback_(resp_msg);

        return result;
    }
    catch (const std::exception& e)
    {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        callback_("ERROR " + ctx.method + " (" + std::to_string(elapsed.count()) +
                  "ms): " + e.what());
        throw;
    }
}

} // namespace tracedmcp::server
