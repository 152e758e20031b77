#pragma once
#include "tracedmcp/telemetry/batch_config.hpp"
#include "tracedmcp/types.hpp"

#include <string>
#include <unordered_map>

namespace tracedmcp
{

/// Which span sink the server ships closed spans to.
enum class ExporterKind
{
    Otlp,     ///< OTLP/HTTP JSON to a collector or SaaS endpoint
    InMemory, ///< Keep spans in process (tests, local debugging)
    None      ///< Spans are recorded but discarded
};

std::string to_string(ExporterKind kind);
ExporterKind exporter_kind_from_string(const std::string& s);

struct Settings
{
    std::string log_level{"INFO"};

    // Attached to every exported batch as resource attributes
    std::string service_name{"weather-assistant"};
    std::string service_version;

    // HTTP transport
    std::string host{"0.0.0.0"};
    int port{8001};
    std::string endpoint_path{"/weather"};
    std::string cors_origin{"*"};

    // Span sink
    ExporterKind exporter{ExporterKind::Otlp};
    std::string traces_endpoint{"http://localhost:4318/v1/traces"};
    std::string sink_username; ///< Basic auth user (e.g. Langfuse public key)
    std::string sink_password; ///< Basic auth password (e.g. Langfuse secret key)
    std::unordered_map<std::string, std::string> sink_headers;
    telemetry::BatchConfig batch;

    Settings();

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace tracedmcp
