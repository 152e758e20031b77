/// @file otlp_exporter.cpp
/// @brief OTLP/JSON encoding and delivery to a local collector

#include "tracedmcp/exceptions.hpp"
#include "tracedmcp/telemetry/otlp_http_exporter.hpp"

#include <atomic>
#include <cassert>
#include <httplib.h>
#include <iostream>
#include <mutex>
#include <thread>

using namespace tracedmcp;
using namespace tracedmcp::telemetry;

namespace
{

Span sample_span()
{
    Span s;
    s.name = "get_weather";
    s.kind = SpanKind::Server;
    s.instrumentation_version = "1.0.0";
    s.trace_id = "4bf92f3577b34da6a3ce929d0e0e4736";
    s.span_id = "b7ad6b7169203331";
    s.parent_span_id = "00f067aa0ba902b7";
    s.trace_state = "rojo=1";
    s.start_time_unix_nano = 1700000000000000000ULL;
    s.end_time_unix_nano = 1700000000005000000ULL;
    s.status = StatusCode::Error;
    s.status_message = "boom";
    s.attributes = {{"rpc.method", "tools/call"}, {"count", 7}, {"ok", false}, {"ratio", 0.5}};
    s.events.push_back(SpanEvent{"exception", 1700000000001000000ULL, {{"exception.message", "boom"}}});
    return s;
}

const Json* find_attr(const Json& attrs, const std::string& key)
{
    for (const auto& kv : attrs)
        if (kv["key"] == key)
            return &kv["value"];
    return nullptr;
}

void test_encoding()
{
    std::cout << "  test_encoding... " << std::flush;
    OtlpHttpExporterOptions opts;
    opts.service_name = "weather-assistant";
    opts.service_version = "1.0.0";

    auto root = sample_span();
    root.name = "tools/list";
    root.parent_span_id.reset();
    root.trace_state.clear();
    root.status = StatusCode::Ok;
    root.status_message.clear();
    root.events.clear();

    auto j = to_otlp_json({sample_span(), root}, opts);
    assert(j["resourceSpans"].size() == 1);
    const auto& rs = j["resourceSpans"][0];
    auto* svc = find_attr(rs["resource"]["attributes"], "service.name");
    assert(svc && (*svc)["stringValue"] == "weather-assistant");
    auto* ver = find_attr(rs["resource"]["attributes"], "service.version");
    assert(ver && (*ver)["stringValue"] == "1.0.0");

    assert(rs["scopeSpans"].size() == 1);
    const auto& scope = rs["scopeSpans"][0];
    assert(scope["scope"]["name"] == INSTRUMENTATION_NAME);
    assert(scope["scope"]["version"] == "1.0.0");
    assert(scope["spans"].size() == 2);

    const auto& span = scope["spans"][0];
    assert(span["traceId"] == "4bf92f3577b34da6a3ce929d0e0e4736");
    assert(span["spanId"] == "b7ad6b7169203331");
    assert(span["parentSpanId"] == "00f067aa0ba902b7");
    assert(span["traceState"] == "rojo=1");
    assert(span["kind"] == 2);
    assert(span["startTimeUnixNano"] == "1700000000000000000");
    assert(span["endTimeUnixNano"] == "1700000000005000000");
    assert(span["status"]["code"] == 2);
    assert(span["status"]["message"] == "boom");
    assert((*find_attr(span["attributes"], "rpc.method"))["stringValue"] == "tools/call");
    assert((*find_attr(span["attributes"], "count"))["intValue"] == "7");
    assert((*find_attr(span["attributes"], "ok"))["boolValue"] == false);
    assert((*find_attr(span["attributes"], "ratio"))["doubleValue"] == 0.5);
    assert(span["events"].size() == 1);
    assert(span["events"][0]["name"] == "exception");

    const auto& root_json = scope["spans"][1];
    assert(!root_json.contains("parentSpanId"));
    assert(!root_json.contains("traceState"));
    assert(root_json["status"]["code"] == 1);
    assert(!root_json["status"].contains("message"));
    std::cout << "PASSED\n";
}

void test_endpoint_parsing()
{
    std::cout << "  test_endpoint_parsing... " << std::flush;
    OtlpHttpExporterOptions opts;
    opts.endpoint = "http://localhost:4318/v1/traces";
    OtlpHttpExporter a(opts);
    assert(a.base_url() == "http://localhost:4318");
    assert(a.path() == "/v1/traces");

    opts.endpoint = "https://cloud.langfuse.com/api/public/otel/v1/traces";
    OtlpHttpExporter b(opts);
    assert(b.base_url() == "https://cloud.langfuse.com");
    assert(b.path() == "/api/public/otel/v1/traces");

    opts.endpoint = "http://collector:4318";
    OtlpHttpExporter c(opts);
    assert(c.path() == "/v1/traces");

    bool threw = false;
    try
    {
        opts.endpoint = "localhost:4318";
        OtlpHttpExporter bad(opts);
    }
    catch (const ConfigError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

struct Collector
{
    httplib::Server svr;
    std::thread thread;
    int port{0};
    std::mutex mutex;
    std::string authorization;
    std::string custom_header;
    Json body;
    std::atomic<int> requests{0};
    std::atomic<int> status{200};
    std::atomic<int> stall_ms{0};

    Collector()
    {
        svr.Post("/v1/traces",
                 [this](const httplib::Request& req, httplib::Response& res)
                 {
                     std::this_thread::sleep_for(std::chrono::milliseconds(stall_ms.load()));
                     std::lock_guard<std::mutex> lock(mutex);
                     authorization = req.get_header_value("Authorization");
                     custom_header = req.get_header_value("x-tenant");
                     body = Json::parse(req.body);
                     ++requests;
                     res.status = status.load();
                     res.set_content("{}", "application/json");
                 });
        port = svr.bind_to_any_port("127.0.0.1");
        thread = std::thread([this]() { svr.listen_after_bind(); });
        svr.wait_until_ready();
    }

    ~Collector()
    {
        svr.stop();
        if (thread.joinable())
            thread.join();
    }
};

void test_delivery_to_collector()
{
    std::cout << "  test_delivery_to_collector... " << std::flush;
    Collector collector;
    assert(collector.port > 0);

    OtlpHttpExporterOptions opts;
    opts.endpoint = "http://127.0.0.1:" + std::to_string(collector.port) + "/v1/traces";
    opts.username = "user";
    opts.password = "pass";
    opts.headers = {{"x-tenant", "weather"}};
    opts.timeout = std::chrono::milliseconds(2000);
    OtlpHttpExporter exporter(opts);

    assert(exporter.export_spans({sample_span()}) == ExportResult::Success);
    assert(collector.requests == 1);
    {
        std::lock_guard<std::mutex> lock(collector.mutex);
        assert(collector.authorization == "Basic dXNlcjpwYXNz");
        assert(collector.custom_header == "weather");
        assert(collector.body["resourceSpans"][0]["scopeSpans"][0]["spans"][0]["name"] ==
               "get_weather");
    }

    // Empty batches never reach the wire
    assert(exporter.export_spans({}) == ExportResult::Success);
    assert(collector.requests == 1);

    collector.status = 500;
    assert(exporter.export_spans({sample_span()}) == ExportResult::Failure);
    std::cout << "PASSED\n";
}

void test_time_limit_cuts_stalled_export()
{
    std::cout << "  test_time_limit_cuts_stalled_export... " << std::flush;
    Collector collector;
    collector.stall_ms = 1500;

    OtlpHttpExporterOptions opts;
    opts.endpoint = "http://127.0.0.1:" + std::to_string(collector.port) + "/v1/traces";
    opts.timeout = std::chrono::milliseconds(5000);
    OtlpHttpExporter exporter(opts);
    exporter.limit_export_time(std::chrono::milliseconds(300));

    auto started = std::chrono::steady_clock::now();
    assert(exporter.export_spans({sample_span()}) == ExportResult::Failure);
    auto elapsed = std::chrono::steady_clock::now() - started;
    assert(elapsed < std::chrono::milliseconds(1200));
    std::cout << "PASSED\n";
}

void test_unreachable_collector()
{
    std::cout << "  test_unreachable_collector... " << std::flush;
    int port = 0;
    {
        // Grab a free port, then release it so nothing is listening there
        httplib::Server probe;
        port = probe.bind_to_any_port("127.0.0.1");
    }
    OtlpHttpExporterOptions opts;
    opts.endpoint = "http://127.0.0.1:" + std::to_string(port) + "/v1/traces";
    opts.timeout = std::chrono::milliseconds(500);
    OtlpHttpExporter exporter(opts);
    assert(exporter.export_spans({sample_span()}) == ExportResult::Failure);
    std::cout << "PASSED\n";
}

} // namespace

int main()
{
    std::cout << "OTLP exporter tests\n";
    test_encoding();
    test_endpoint_parsing();
    test_delivery_to_collector();
    test_time_limit_cuts_stalled_export();
    test_unreachable_collector();
    std::cout << "All OTLP exporter tests passed\n";
    return 0;
}
