#include "tracedmcp/mcp/dispatcher.hpp"

#include "tracedmcp/mcp/jsonrpc.hpp"
#include "tracedmcp/server/tracing_middleware.hpp"
#include "tracedmcp/util/log.hpp"

#include <algorithm>
#include <chrono>

namespace tracedmcp::mcp
{

const std::vector<std::string> SUPPORTED_PROTOCOL_VERSIONS = {"2025-06-18", "2025-03-26",
                                                              "2024-11-05"};

namespace
{

enum class RequestState
{
    Received,
    Parsed,
    Authorized,
    Dispatching,
    Completed
};

const char* to_string(RequestState s)
{
    switch (s)
    {
    case RequestState::Received:
        return "received";
    case RequestState::Parsed:
        return "parsed";
    case RequestState::Authorized:
        return "authorized";
    case RequestState::Dispatching:
        return "dispatching";
    case RequestState::Completed:
        return "completed";
    }
    return "unknown";
}

void advance(RequestState& state, RequestState next, const std::string& method)
{
    if (util::log::enabled(util::log::Level::Debug))
        util::log::debug("request " + (method.empty() ? std::string("<?>") : method) + ": " +
                         to_string(state) + " -> " + to_string(next));
    state = next;
}

/// Returns an error message when the envelope is not a usable JSON-RPC 2.0 request.
std::optional<std::string> check_envelope(const Json& message)
{
    if (!message.is_object())
        return "Request must be a JSON object";
    if (!message.contains("jsonrpc") || message["jsonrpc"] != JSONRPC_VERSION)
        return "jsonrpc must be \"2.0\"";
    if (!message.contains("method") || !message["method"].is_string() ||
        message["method"].get<std::string>().empty())
        return "Missing method";
    if (message.contains("id"))
    {
        const auto& id = message["id"];
        if (!id.is_string() && !id.is_number() && !id.is_null())
            return "id must be a string, number or null";
    }
    if (message.contains("params") && !message["params"].is_object() &&
        !message["params"].is_array())
        return "params must be an object or array";
    return std::nullopt;
}

Json envelope_id(const Json& message)
{
    if (message.is_object() && message.contains("id"))
    {
        const auto& id = message["id"];
        if (id.is_string() || id.is_number())
            return id;
    }
    return nullptr;
}

Json tool_error_response(const Json& id, const tools::ToolError& err)
{
    int code = err.kind == tools::ToolErrorKind::ExecutionFailed ? ErrorCode::ExecutionFailed
                                                                 : ErrorCode::InvalidParams;
    Json data = {{"kind", tools::to_string(err.kind)}};
    if (!err.detail.empty())
        data["detail"] = err.detail;
    return make_error(id, code, err.message, std::move(data));
}

} // namespace

Dispatcher::Dispatcher(ServerInfo info, const tools::ToolManager& tools,
                       std::shared_ptr<const telemetry::Tracer> tracer)
    : info_(std::move(info)), tools_(tools), tracer_(std::move(tracer))
{
    pipeline_.add(std::make_shared<server::PropagationMiddleware>());
    pipeline_.add(std::make_shared<server::TracingMiddleware>(tracer_, tools_));
    pipeline_.add(std::make_shared<server::LoggingMiddleware>());
}

void Dispatcher::add_middleware(std::shared_ptr<server::Middleware> mw)
{
    pipeline_.add(std::move(mw));
}

std::optional<Json> Dispatcher::handle(const Json& message, const Carrier& headers) const
{
    if (!message.is_array())
        return handle_single(message, headers);

    if (message.empty())
        return make_error(nullptr, ErrorCode::ParseError, "Empty batch");

    Json responses = Json::array();
    for (const auto& entry : message)
    {
        auto response = handle_single(entry, headers);
        if (response)
            responses.push_back(std::move(*response));
    }
    if (responses.empty())
        return std::nullopt;
    return responses;
}

std::optional<Json> Dispatcher::handle_single(const Json& message, const Carrier& headers) const
{
    RequestState state = RequestState::Received;

    if (auto problem = check_envelope(message))
    {
        util::log::warn("rejecting request: " + *problem);
        return make_error(envelope_id(message), ErrorCode::ParseError, *problem);
    }

    server::MiddlewareContext ctx;
    ctx.message = message;
    ctx.method = message["method"].get<std::string>();
    ctx.params = message.value("params", Json::object());
    if (message.contains("id"))
        ctx.request_id = message["id"];
    ctx.headers = headers;
    ctx.timestamp = std::chrono::steady_clock::now();
    advance(state, RequestState::Parsed, ctx.method);

    // No authentication layer; every parsed request is admitted
    advance(state, RequestState::Authorized, ctx.method);

    advance(state, RequestState::Dispatching, ctx.method);
    Json response;
    try
    {
        response = pipeline_.execute(ctx, [this](const server::MiddlewareContext& c)
                                     { return route(c); });
    }
    catch (const std::exception& e)
    {
        util::log::error("unhandled error in " + ctx.method + ": " + e.what());
        response = make_error(ctx.request_id.value_or(nullptr), ErrorCode::ExecutionFailed,
                              "Internal error", Json{{"kind", "Internal"}, {"detail", e.what()}});
    }
    advance(state, RequestState::Completed, ctx.method);

    if (ctx.is_notification())
        return std::nullopt;
    return response;
}

Json Dispatcher::route(const server::MiddlewareContext& ctx) const
{
    const Json id = ctx.request_id.value_or(nullptr);

    if (ctx.method == "initialize")
        return make_result(id, handle_initialize(ctx));
    if (ctx.method == "ping")
        return make_result(id, Json::object());
    if (ctx.method.rfind("notifications/", 0) == 0)
        return make_result(id, Json::object());
    if (ctx.method == "tools/list")
        return make_result(id, Json{{"tools", tools_.list_descriptors()}});
    if (ctx.method == "tools/call")
        return handle_tools_call(ctx);

    return make_error(id, ErrorCode::MethodNotFound, "Method '" + ctx.method + "' not found");
}

Json Dispatcher::handle_initialize(const server::MiddlewareContext& ctx) const
{
    std::string version = DEFAULT_PROTOCOL_VERSION;
    if (ctx.params.is_object() && ctx.params.contains("protocolVersion") &&
        ctx.params["protocolVersion"].is_string())
    {
        auto requested = ctx.params["protocolVersion"].get<std::string>();
        if (std::find(SUPPORTED_PROTOCOL_VERSIONS.begin(), SUPPORTED_PROTOCOL_VERSIONS.end(),
                      requested) != SUPPORTED_PROTOCOL_VERSIONS.end())
            version = requested;
    }

    Json result = {{"protocolVersion", version},
                   {"capabilities", {{"tools", {{"listChanged", false}}}}},
                   {"serverInfo", {{"name", info_.name}, {"version", info_.version}}}};
    if (info_.instructions)
        result["instructions"] = *info_.instructions;
    return result;
}

Json Dispatcher::handle_tools_call(const server::MiddlewareContext& ctx) const
{
    const Json id = ctx.request_id.value_or(nullptr);
    const Json& params = ctx.params;

    if (!params.is_object() || !params.contains("name") || !params["name"].is_string() ||
        params["name"].get<std::string>().empty())
        return make_error(id, ErrorCode::InvalidParams, "Missing tool name");
    if (!params.contains("arguments"))
        return make_error(id, ErrorCode::InvalidParams, "Missing arguments");
    if (!params["arguments"].is_object())
        return make_error(id, ErrorCode::InvalidParams, "arguments must be an object");

    const auto name = params["name"].get<std::string>();
    const auto& args = params["arguments"];

    if (ctx.span)
        ctx.span->set_attribute("mcp.tool.input", args.dump());

    auto outcome = tools_.invoke(name, args);
    if (!outcome.ok())
        return tool_error_response(id, *outcome.error);

    const Json& output = *outcome.value;
    if (ctx.span)
        ctx.span->set_attribute("mcp.tool.output", output.dump());

    Json result = {{"content", Json::array({{{"type", "text"}, {"text", output.dump()}}})},
                   {"structuredContent", output},
                   {"isError", false}};
    return make_result(id, std::move(result));
}

} // namespace tracedmcp::mcp
