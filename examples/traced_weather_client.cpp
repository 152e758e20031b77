/// @file traced_weather_client.cpp
/// @brief Calls the weather tools over HTTP inside a client span and prints its trace id
///
/// Usage: traced_weather_client [location] [days] [base_url]
///
/// The client span is exported with the same settings as the server (environment
/// variables), so both halves of the trace land in the same backend.

#include "tracedmcp/exceptions.hpp"
#include "tracedmcp/settings.hpp"
#include "tracedmcp/telemetry/batch_span_processor.hpp"
#include "tracedmcp/telemetry/otlp_http_exporter.hpp"
#include "tracedmcp/telemetry/propagation.hpp"
#include "tracedmcp/telemetry/tracer.hpp"

#include <httplib.h>
#include <iostream>
#include <string>

using namespace tracedmcp;

static Json call_tool(httplib::Client& cli, const std::string& path, const Carrier& carrier,
                      int id, const std::string& tool, const Json& args)
{
    httplib::Headers headers;
    for (const auto& kv : carrier)
        headers.emplace(kv.first, kv.second);

    Json request = {{"jsonrpc", "2.0"},
                    {"id", id},
                    {"method", "tools/call"},
                    {"params", {{"name", tool}, {"arguments", args}}}};
    auto res = cli.Post(path.c_str(), headers, request.dump(), "application/json");
    if (!res)
        throw TransportError("request failed: " + httplib::to_string(res.error()));
    return Json::parse(res->body);
}

int main(int argc, char** argv)
{
    std::string location = argc > 1 ? argv[1] : "San Francisco";
    int days = argc > 2 ? std::stoi(argv[2]) : 3;
    std::string base_url = argc > 3 ? argv[3] : "http://localhost:8001";

    auto settings = Settings::from_env();
    telemetry::OtlpHttpExporterOptions opts;
    opts.endpoint = settings.traces_endpoint;
    opts.service_name = "weather-cli";
    opts.service_version = settings.service_version;
    opts.username = settings.sink_username;
    opts.password = settings.sink_password;
    opts.headers = settings.sink_headers;

    auto processor = std::make_shared<telemetry::BatchSpanProcessor>(
        std::make_unique<telemetry::OtlpHttpExporter>(opts), settings.batch);
    telemetry::Tracer tracer(processor);

    std::string trace_id;
    try
    {
        auto span = tracer.start_span(telemetry::TraceContext::new_root(), "cli_weather_request",
                                      telemetry::SpanKind::Client);
        trace_id = span.span().trace_id;
        auto carrier = telemetry::propagation::inject(span.context());

        httplib::Client cli(base_url);
        cli.set_read_timeout(10, 0);

        auto weather =
            call_tool(cli, settings.endpoint_path, carrier, 1, "get_weather", {{"location", location}});
        std::cout << weather.dump(2) << "\n";
        auto forecast = call_tool(cli, settings.endpoint_path, carrier, 2, "get_forecast",
                                  {{"location", location}, {"days", days}});
        std::cout << forecast.dump(2) << "\n";
        span.end();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        processor->shutdown(settings.batch.shutdown_timeout);
        return 1;
    }

    processor->shutdown(settings.batch.shutdown_timeout);
    std::cout << "CLIENT_TRACE_ID=" << trace_id << "\n";
    return 0;
}
