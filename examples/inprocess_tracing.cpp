/// @file inprocess_tracing.cpp
/// @brief Dispatches a traced tools/call without a network and prints the recorded span

#include "tracedmcp.hpp"

#include <iostream>

using namespace tracedmcp;

int main()
{
    auto exporter = std::make_unique<telemetry::InMemorySpanExporter>();
    auto* sink = exporter.get();
    auto processor = std::make_shared<telemetry::BatchSpanProcessor>(std::move(exporter));
    auto tracer = std::make_shared<const telemetry::Tracer>(processor);

    tools::ToolManager tools;
    tools::weather::register_weather_tools(tools);
    mcp::Dispatcher dispatcher({"weather-assistant", "1.0.0", std::nullopt}, tools, tracer);

    Json request = {{"jsonrpc", "2.0"},
                    {"id", 1},
                    {"method", "tools/call"},
                    {"params", {{"name", "get_weather"}, {"arguments", {{"location", "Oslo"}}}}}};
    Carrier headers = {{"traceparent", "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01"}};

    auto response = dispatcher.handle(request, headers);
    std::cout << response->dump(2) << "\n";

    processor->force_flush(std::chrono::seconds(1));
    telemetry::OtlpHttpExporterOptions opts;
    opts.service_name = "weather-assistant";
    std::cout << telemetry::to_otlp_json(sink->finished_spans(), opts).dump(2) << "\n";

    processor->shutdown(std::chrono::seconds(1));
    return 0;
}
