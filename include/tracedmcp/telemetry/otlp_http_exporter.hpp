#pragma once

#include "tracedmcp/telemetry/exporter.hpp"
#include "tracedmcp/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

namespace tracedmcp::telemetry
{

struct OtlpHttpExporterOptions
{
    /// Full traces URL, e.g. http://localhost:4318/v1/traces
    std::string endpoint{"http://localhost:4318/v1/traces"};
    std::string service_name{"weather-assistant"};
    std::string service_version;
    /// Static credentials; sent as HTTP Basic auth when the username is set
    std::string username;
    std::string password;
    std::unordered_map<std::string, std::string> headers;
    std::chrono::milliseconds timeout{10000};
};

/// Encode spans as an OTLP/JSON ExportTraceServiceRequest.
///
/// Spans are grouped under one resource (service.name, service.version, sdk info) and one
/// scope per instrumentation name. Every span carries its own trace and span ids.
Json to_otlp_json(const std::vector<Span>& spans, const OtlpHttpExporterOptions& options);

/// Ships batches to an OTLP/HTTP receiver (a local collector such as Jaeger on :4318, or a
/// SaaS OTLP ingestion endpoint such as Langfuse's /api/public/otel/v1/traces).
class OtlpHttpExporter : public SpanExporter
{
  public:
    explicit OtlpHttpExporter(OtlpHttpExporterOptions options);

    ExportResult export_spans(const std::vector<Span>& batch) override;
    /// Splits the limit across connect, write and read so one POST stays within it.
    void limit_export_time(std::chrono::milliseconds limit) override;

    const std::string& base_url() const
    {
        return base_url_;
    }
    const std::string& path() const
    {
        return path_;
    }

  private:
    OtlpHttpExporterOptions options_;
    std::string base_url_; // scheme://host[:port]
    std::string path_;
    std::optional<std::chrono::milliseconds> time_limit_;
};

} // namespace tracedmcp::telemetry
