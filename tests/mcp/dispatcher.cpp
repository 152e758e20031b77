/// @file dispatcher.cpp
/// @brief JSON-RPC dispatch, error codes and the spans each request produces

#include "tracedmcp/mcp/dispatcher.hpp"
#include "tracedmcp/mcp/jsonrpc.hpp"
#include "tracedmcp/tools/weather.hpp"

#include "../test_support.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace tracedmcp;
using namespace tracedmcp::mcp;
using telemetry::StatusCode;

namespace
{

const std::string TRACE_ID = "4bf92f3577b34da6a3ce929d0e0e4736";
const std::string PARENT_SPAN_ID = "00f067aa0ba902b7";
const Carrier TRACED_HEADERS = {{"traceparent", "00-" + TRACE_ID + "-" + PARENT_SPAN_ID + "-01"}};

struct Fixture
{
    std::shared_ptr<testing::CollectingProcessor> processor =
        std::make_shared<testing::CollectingProcessor>();
    tools::ToolManager tools;
    std::unique_ptr<Dispatcher> dispatcher;

    Fixture()
    {
        tools::weather::register_weather_tools(tools);
        tools.register_tool(tools::Tool("explode", Json{{"type", "object"}}, Json(),
                                        [](const Json&) -> Json
                                        { throw std::runtime_error("sensor offline"); }));
        auto tracer = std::make_shared<const telemetry::Tracer>(processor);
        dispatcher = std::make_unique<Dispatcher>(
            ServerInfo{"weather-assistant", "1.0.0", std::string("Ask about the weather")},
            tools, tracer);
    }

    Json call(const Json& request, const Carrier& headers = {})
    {
        auto response = dispatcher->handle(request, headers);
        assert(response.has_value());
        return *response;
    }
};

Json request(const Json& id, const std::string& method, const Json& params = Json::object())
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

Json tool_call(const Json& id, const std::string& name, const Json& args)
{
    return request(id, "tools/call", Json{{"name", name}, {"arguments", args}});
}

void test_traced_tool_call()
{
    std::cout << "  test_traced_tool_call... " << std::flush;
    Fixture f;
    auto resp = f.call(tool_call(1, "get_weather", {{"location", "Paris"}}), TRACED_HEADERS);

    assert(resp["jsonrpc"] == "2.0");
    assert(resp["id"] == 1);
    assert(!resp.contains("error"));
    const auto& result = resp["result"];
    assert(result["isError"] == false);
    assert(result["structuredContent"]["location"] == "Paris");
    assert(result["content"][0]["type"] == "text");
    assert(Json::parse(result["content"][0]["text"].get<std::string>()) ==
           result["structuredContent"]);

    // Exactly one span, already closed when handle() returns
    auto spans = f.processor->spans();
    assert(spans.size() == 1);
    const auto& span = spans[0];
    assert(span.name == "get_weather");
    assert(span.kind == telemetry::SpanKind::Server);
    assert(span.trace_id == TRACE_ID);
    assert(span.parent_span_id == PARENT_SPAN_ID);
    assert(span.span_id != PARENT_SPAN_ID);
    assert(span.status == StatusCode::Ok);
    assert(span.attributes.at("rpc.system") == "jsonrpc");
    assert(span.attributes.at("rpc.method") == "tools/call");
    assert(span.attributes.at("rpc.jsonrpc.request_id") == "1");
    assert(span.attributes.at("mcp.tool.name") == "get_weather");
    assert(Json::parse(span.attributes.at("mcp.tool.input").get<std::string>())["location"] ==
           "Paris");
    assert(Json::parse(span.attributes.at("mcp.tool.output").get<std::string>()) ==
           result["structuredContent"]);
    std::cout << "PASSED\n";
}

void test_untraced_requests_start_new_traces()
{
    std::cout << "  test_untraced_requests_start_new_traces... " << std::flush;
    Fixture f;
    auto resp = f.call(request("list-1", "tools/list"));
    assert(resp["id"] == "list-1");
    const auto& tools = resp["result"]["tools"];
    assert(tools.size() == 3);
    assert(tools[0]["name"] == "get_weather");
    assert(tools[1]["name"] == "get_forecast");
    assert(tools[0].contains("inputSchema"));

    f.call(request(2, "tools/list"), {{"traceparent", "not-a-traceparent"}});

    auto spans = f.processor->spans();
    assert(spans.size() == 2);
    for (const auto& s : spans)
    {
        assert(s.name == "tools/list");
        assert(s.is_root());
        assert(s.trace_id != TRACE_ID);
    }
    assert(spans[0].trace_id != spans[1].trace_id);
    std::cout << "PASSED\n";
}

void test_forecast_days()
{
    std::cout << "  test_forecast_days... " << std::flush;
    Fixture f;
    auto resp = f.call(tool_call(3, "get_forecast", {{"location", "Oslo"}, {"days", 5}}));
    assert(resp["result"]["structuredContent"]["items"].size() == 5);

    auto bad = f.call(tool_call(4, "get_forecast", {{"location", "Oslo"}, {"days", 0}}));
    assert(bad["error"]["code"] == ErrorCode::InvalidParams);
    assert(bad["error"]["data"]["kind"] == "InvalidParams");

    // Schema rejection still closes the span with the error
    auto spans = f.processor->spans();
    assert(spans.size() == 2);
    assert(spans[1].status == StatusCode::Error);
    assert(spans[1].attributes.at("rpc.jsonrpc.error_code") == ErrorCode::InvalidParams);
    assert(spans[1].attributes.at("error.type") == "InvalidParams");
    std::cout << "PASSED\n";
}

void test_unknown_tool()
{
    std::cout << "  test_unknown_tool... " << std::flush;
    Fixture f;
    auto resp = f.call(tool_call(5, "get_tides", {{"location", "Brest"}}), TRACED_HEADERS);
    assert(resp["id"] == 5);
    assert(resp["error"]["code"] == ErrorCode::InvalidParams);
    assert(resp["error"]["message"].get<std::string>().find("get_tides") != std::string::npos);
    assert(resp["error"]["data"]["kind"] == "NotFound");
    assert(f.processor->size() == 0);
    std::cout << "PASSED\n";
}

void test_missing_name_or_arguments()
{
    std::cout << "  test_missing_name_or_arguments... " << std::flush;
    Fixture f;
    auto no_name = f.call(request(6, "tools/call", Json{{"arguments", Json::object()}}));
    assert(no_name["error"]["code"] == ErrorCode::InvalidParams);

    auto no_args = f.call(request(7, "tools/call", Json{{"name", "get_weather"}}));
    assert(no_args["error"]["code"] == ErrorCode::InvalidParams);
    assert(no_args["error"]["message"] == "Missing arguments");

    auto bad_args = f.call(request(8, "tools/call",
                                   Json{{"name", "get_weather"}, {"arguments", "Paris"}}));
    assert(bad_args["error"]["code"] == ErrorCode::InvalidParams);

    // Rejected before any tool work starts, so no span
    assert(f.processor->size() == 0);
    std::cout << "PASSED\n";
}

void test_execution_failure()
{
    std::cout << "  test_execution_failure... " << std::flush;
    Fixture f;
    auto resp = f.call(tool_call(9, "explode", Json::object()), TRACED_HEADERS);
    assert(resp["error"]["code"] == ErrorCode::ExecutionFailed);
    assert(resp["error"]["data"]["kind"] == "ExecutionFailed");
    assert(resp["error"]["data"]["detail"] == "sensor offline");

    auto spans = f.processor->spans();
    assert(spans.size() == 1);
    assert(spans[0].name == "explode");
    assert(spans[0].trace_id == TRACE_ID);
    assert(spans[0].status == StatusCode::Error);
    assert(spans[0].status_message.find("sensor offline") != std::string::npos);
    assert(spans[0].attributes.at("error.type") == "ExecutionFailed");
    assert(spans[0].attributes.count("mcp.tool.output") == 0);
    std::cout << "PASSED\n";
}

void test_unknown_method()
{
    std::cout << "  test_unknown_method... " << std::flush;
    Fixture f;
    auto resp = f.call(request(10, "resources/list"));
    assert(resp["error"]["code"] == ErrorCode::MethodNotFound);

    auto spans = f.processor->spans();
    assert(spans.size() == 1);
    assert(spans[0].name == "resources/list");
    assert(spans[0].status == StatusCode::Error);
    std::cout << "PASSED\n";
}

void test_malformed_envelopes()
{
    std::cout << "  test_malformed_envelopes... " << std::flush;
    Fixture f;
    auto wrong_version = f.call(Json{{"jsonrpc", "1.0"}, {"id", 11}, {"method", "ping"}});
    assert(wrong_version["error"]["code"] == ErrorCode::ParseError);
    assert(wrong_version["id"] == 11);

    auto no_method = f.call(Json{{"jsonrpc", "2.0"}, {"id", 12}});
    assert(no_method["error"]["code"] == ErrorCode::ParseError);

    auto not_object = f.call(Json("tools/list"));
    assert(not_object["error"]["code"] == ErrorCode::ParseError);
    assert(not_object["id"].is_null());

    auto bad_params = f.call(Json{{"jsonrpc", "2.0"}, {"id", 13}, {"method", "ping"}, {"params", 5}});
    assert(bad_params["error"]["code"] == ErrorCode::ParseError);

    auto empty_batch = f.call(Json::array());
    assert(empty_batch["error"]["code"] == ErrorCode::ParseError);

    assert(f.processor->size() == 0);
    std::cout << "PASSED\n";
}

void test_notifications()
{
    std::cout << "  test_notifications... " << std::flush;
    Fixture f;
    auto none = f.dispatcher->handle(
        Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}, TRACED_HEADERS);
    assert(!none.has_value());

    // Unknown notifications are ignored silently
    auto ignored = f.dispatcher->handle(Json{{"jsonrpc", "2.0"}, {"method", "whatever"}}, {});
    assert(!ignored.has_value());
    assert(f.processor->size() == 0);
    std::cout << "PASSED\n";
}

void test_initialize_and_ping()
{
    std::cout << "  test_initialize_and_ping... " << std::flush;
    Fixture f;
    auto init = f.call(request(14, "initialize",
                               Json{{"protocolVersion", "2025-03-26"},
                                    {"capabilities", Json::object()},
                                    {"clientInfo", {{"name", "test"}, {"version", "0"}}}}));
    const auto& result = init["result"];
    assert(result["protocolVersion"] == "2025-03-26");
    assert(result["serverInfo"]["name"] == "weather-assistant");
    assert(result["serverInfo"]["version"] == "1.0.0");
    assert(result["capabilities"].contains("tools"));
    assert(result["instructions"] == "Ask about the weather");

    auto old = f.call(request(15, "initialize", Json{{"protocolVersion", "1999-01-01"}}));
    assert(old["result"]["protocolVersion"] == DEFAULT_PROTOCOL_VERSION);

    auto pong = f.call(request(16, "ping"));
    assert(pong["result"].is_object() && pong["result"].empty());

    auto spans = f.processor->spans();
    assert(spans.size() == 3);
    assert(spans[0].name == "initialize");
    assert(spans[2].name == "ping");
    std::cout << "PASSED\n";
}

void test_batch()
{
    std::cout << "  test_batch... " << std::flush;
    Fixture f;
    Json batch = Json::array({tool_call(20, "get_weather", {{"location", "Rome"}}),
                              Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}},
                              request(21, "tools/list")});
    auto resp = f.call(batch, TRACED_HEADERS);
    assert(resp.is_array());
    assert(resp.size() == 2);
    assert(resp[0]["id"] == 20);
    assert(resp[1]["id"] == 21);

    auto spans = f.processor->spans();
    assert(spans.size() == 2);
    for (const auto& s : spans)
        assert(s.trace_id == TRACE_ID);

    // A batch of notifications has nothing to answer
    Json quiet = Json::array({Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}});
    assert(!f.dispatcher->handle(quiet, {}).has_value());
    std::cout << "PASSED\n";
}

void test_tracestate_is_carried()
{
    std::cout << "  test_tracestate_is_carried... " << std::flush;
    Fixture f;
    Carrier headers = TRACED_HEADERS;
    headers["tracestate"] = "langfuse=abc";
    f.call(tool_call(30, "get_weather", {{"location", "Lima"}}), headers);
    auto spans = f.processor->spans();
    assert(spans.size() == 1);
    assert(spans[0].trace_state == "langfuse=abc");
    std::cout << "PASSED\n";
}

} // namespace

int main()
{
    std::cout << "Dispatcher tests\n";
    test_traced_tool_call();
    test_untraced_requests_start_new_traces();
    test_forecast_days();
    test_unknown_tool();
    test_missing_name_or_arguments();
    test_execution_failure();
    test_unknown_method();
    test_malformed_envelopes();
    test_notifications();
    test_initialize_and_ping();
    test_batch();
    test_tracestate_is_carried();
    std::cout << "All dispatcher tests passed\n";
    return 0;
}
