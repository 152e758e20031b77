#include "tracedmcp/telemetry/otlp_http_exporter.hpp"

#include "tracedmcp/exceptions.hpp"
#include "tracedmcp/util/log.hpp"

#include <algorithm>
#include <httplib.h>
#include <map>

namespace tracedmcp::telemetry
{
namespace
{

// opentelemetry.proto.trace.v1.Span.SpanKind
int otlp_kind(SpanKind kind)
{
    switch (kind)
    {
    case SpanKind::Internal:
        return 1;
    case SpanKind::Server:
        return 2;
    case SpanKind::Client:
        return 3;
    }
    return 0;
}

// opentelemetry.proto.trace.v1.Status.StatusCode
int otlp_status(StatusCode code)
{
    switch (code)
    {
    case StatusCode::Unset:
        return 0;
    case StatusCode::Ok:
        return 1;
    case StatusCode::Error:
        return 2;
    }
    return 0;
}

Json any_value(const Json& v)
{
    if (v.is_boolean())
        return Json{{"boolValue", v.get<bool>()}};
    // 64-bit integers are strings in OTLP/JSON
    if (v.is_number_integer())
        return Json{{"intValue", std::to_string(v.get<long long>())}};
    if (v.is_number_float())
        return Json{{"doubleValue", v.get<double>()}};
    if (v.is_string())
        return Json{{"stringValue", v.get<std::string>()}};
    return Json{{"stringValue", v.dump()}};
}

Json key_values(const Attributes& attrs)
{
    // Sorted for stable payloads
    std::map<std::string, Json> sorted(attrs.begin(), attrs.end());
    Json out = Json::array();
    for (const auto& [key, value] : sorted)
        out.push_back(Json{{"key", key}, {"value", any_value(value)}});
    return out;
}

Json encode_span(const Span& span)
{
    Json j = {
        {"traceId", span.trace_id},
        {"spanId", span.span_id},
        {"name", span.name},
        {"kind", otlp_kind(span.kind)},
        {"startTimeUnixNano", std::to_string(span.start_time_unix_nano)},
        {"endTimeUnixNano", std::to_string(span.end_time_unix_nano)},
        {"attributes", key_values(span.attributes)},
        {"flags", static_cast<int>(span.trace_flags)},
    };
    if (span.parent_span_id)
        j["parentSpanId"] = *span.parent_span_id;
    if (!span.trace_state.empty())
        j["traceState"] = span.trace_state;

    Json status = {{"code", otlp_status(span.status)}};
    if (!span.status_message.empty())
        status["message"] = span.status_message;
    j["status"] = status;

    if (!span.events.empty())
    {
        Json events = Json::array();
        for (const auto& e : span.events)
            events.push_back(Json{{"name", e.name},
                                  {"timeUnixNano", std::to_string(e.time_unix_nano)},
                                  {"attributes", key_values(e.attributes)}});
        j["events"] = events;
    }
    return j;
}

} // namespace

Json to_otlp_json(const std::vector<Span>& spans, const OtlpHttpExporterOptions& options)
{
    Attributes resource_attrs = {
        {"service.name", options.service_name},
        {"telemetry.sdk.name", INSTRUMENTATION_NAME},
        {"telemetry.sdk.language", "cpp"},
    };
    if (!options.service_version.empty())
        resource_attrs["service.version"] = options.service_version;

    // One scope entry per instrumentation name, in first-seen order
    std::vector<std::string> scope_order;
    std::map<std::string, Json> scope_spans;
    std::map<std::string, std::optional<std::string>> scope_versions;
    for (const auto& span : spans)
    {
        auto it = scope_spans.find(span.instrumentation_name);
        if (it == scope_spans.end())
        {
            scope_order.push_back(span.instrumentation_name);
            scope_versions[span.instrumentation_name] = span.instrumentation_version;
            it = scope_spans.emplace(span.instrumentation_name, Json::array()).first;
        }
        it->second.push_back(encode_span(span));
    }

    Json scopes = Json::array();
    for (const auto& name : scope_order)
    {
        Json scope = {{"name", name}};
        if (const auto& version = scope_versions[name])
            scope["version"] = *version;
        scopes.push_back(Json{{"scope", scope}, {"spans", scope_spans[name]}});
    }

    return Json{{"resourceSpans", Json::array({Json{
                                      {"resource", Json{{"attributes", key_values(resource_attrs)}}},
                                      {"scopeSpans", scopes},
                                  }})}};
}

OtlpHttpExporter::OtlpHttpExporter(OtlpHttpExporterOptions options) : options_(std::move(options))
{
    const auto& url = options_.endpoint;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw ConfigError("traces endpoint must be an absolute URL: " + url);
    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos)
    {
        base_url_ = url;
        path_ = "/v1/traces";
    }
    else
    {
        base_url_ = url.substr(0, path_start);
        path_ = url.substr(path_start);
    }
    if (base_url_.size() <= scheme_end + 3)
        throw ConfigError("traces endpoint has no host: " + url);
}

void OtlpHttpExporter::limit_export_time(std::chrono::milliseconds limit)
{
    time_limit_ = limit;
}

ExportResult OtlpHttpExporter::export_spans(const std::vector<Span>& batch)
{
    if (batch.empty())
        return ExportResult::Success;

    auto body = to_otlp_json(batch, options_).dump();

    httplib::Client cli(base_url_);
    // Each phase gets the full timeout, so an unlimited POST may take up to three of them
    auto phase = options_.timeout;
    if (time_limit_)
        phase = std::max(std::min(phase, *time_limit_ / 3), std::chrono::milliseconds(1));
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(phase);
    auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(phase - secs);
    cli.set_connection_timeout(secs.count(), usecs.count());
    cli.set_read_timeout(secs.count(), usecs.count());
    cli.set_write_timeout(secs.count(), usecs.count());
    if (!options_.username.empty())
        cli.set_basic_auth(options_.username, options_.password);

    httplib::Headers headers;
    for (const auto& [key, value] : options_.headers)
        headers.emplace(key, value);

    auto res = cli.Post(path_, headers, body, "application/json");
    if (!res)
    {
        util::log::warn("OTLP export to " + base_url_ + path_ +
                        " failed: " + httplib::to_string(res.error()));
        return ExportResult::Failure;
    }
    if (res->status < 200 || res->status >= 300)
    {
        util::log::warn("OTLP export to " + base_url_ + path_ + " rejected with HTTP " +
                        std::to_string(res->status));
        return ExportResult::Failure;
    }
    util::log::debug("exported " + std::to_string(batch.size()) + " spans");
    return ExportResult::Success;
}

} // namespace tracedmcp::telemetry
