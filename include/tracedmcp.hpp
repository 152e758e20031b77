#pragma once

/// @file tracedmcp.hpp
/// @brief Main header for tracedmcp - includes commonly used components
///
/// Usage:
/// @code
/// #include <tracedmcp.hpp>
///
/// int main() {
///     auto processor = std::make_shared<tracedmcp::telemetry::BatchSpanProcessor>(
///         std::make_unique<tracedmcp::telemetry::InMemorySpanExporter>());
///     auto tracer = std::make_shared<const tracedmcp::telemetry::Tracer>(processor);
///
///     tracedmcp::tools::ToolManager tools;
///     tracedmcp::tools::weather::register_weather_tools(tools);
///
///     tracedmcp::mcp::Dispatcher dispatcher({"weather-assistant", "1.0.0"}, tools, tracer);
///     tracedmcp::server::HttpServerWrapper server(dispatcher, "127.0.0.1", 8001, "/weather");
///     server.start();
/// }
/// @endcode

// Core types and exceptions
#include "tracedmcp/exceptions.hpp"
#include "tracedmcp/settings.hpp"
#include "tracedmcp/types.hpp"
#include "tracedmcp/version.hpp"

// Telemetry
#include "tracedmcp/telemetry/batch_span_processor.hpp"
#include "tracedmcp/telemetry/exporter.hpp"
#include "tracedmcp/telemetry/otlp_http_exporter.hpp"
#include "tracedmcp/telemetry/propagation.hpp"
#include "tracedmcp/telemetry/trace_context.hpp"
#include "tracedmcp/telemetry/tracer.hpp"

// Tools
#include "tracedmcp/tools/manager.hpp"
#include "tracedmcp/tools/tool.hpp"
#include "tracedmcp/tools/weather.hpp"

// Protocol and transport
#include "tracedmcp/mcp/dispatcher.hpp"
#include "tracedmcp/mcp/jsonrpc.hpp"
#include "tracedmcp/server/http_server.hpp"
#include "tracedmcp/server/middleware_pipeline.hpp"
#include "tracedmcp/server/tracing_middleware.hpp"
