#include "tracedmcp/settings.hpp"

#include "tracedmcp/exceptions.hpp"
#include "tracedmcp/version.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace tracedmcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static bool has_env(const char* key)
{
    const char* v = std::getenv(key);
    return v != nullptr && *v != '\0';
}

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s)
{
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

static long long parse_positive(const std::string& key, const std::string& value)
{
    std::size_t consumed = 0;
    long long parsed = 0;
    try
    {
        parsed = std::stoll(value, &consumed);
    }
    catch (const std::exception&)
    {
        throw ConfigError(key + ": not a number: '" + value + "'");
    }
    if (consumed != value.size() || parsed <= 0)
        throw ConfigError(key + ": expected a positive integer, got '" + value + "'");
    return parsed;
}

static long long json_positive(const Json& obj, const std::string& key)
{
    const auto& v = obj.at(key);
    if (!v.is_number_integer() || v.get<long long>() <= 0)
        throw ConfigError(key + ": expected a positive integer, got " + v.dump());
    return v.get<long long>();
}

static std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// OTEL_EXPORTER_OTLP_HEADERS format: "key1=value1,key2=value2"
static std::unordered_map<std::string, std::string> parse_header_list(const std::string& value)
{
    std::unordered_map<std::string, std::string> headers;
    std::size_t start = 0;
    while (start <= value.size())
    {
        auto comma = value.find(',', start);
        auto item = value.substr(start, comma == std::string::npos ? std::string::npos
                                                                   : comma - start);
        auto eq = item.find('=');
        if (eq != std::string::npos)
        {
            auto key = trim(item.substr(0, eq));
            if (!key.empty())
                headers[key] = trim(item.substr(eq + 1));
        }
        else if (!trim(item).empty())
        {
            throw ConfigError("OTEL_EXPORTER_OTLP_HEADERS: malformed entry '" + item + "'");
        }
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return headers;
}

std::string to_string(ExporterKind kind)
{
    switch (kind)
    {
    case ExporterKind::Otlp:
        return "otlp";
    case ExporterKind::InMemory:
        return "inmemory";
    case ExporterKind::None:
        return "none";
    }
    return "otlp";
}

ExporterKind exporter_kind_from_string(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "otlp")
        return ExporterKind::Otlp;
    if (v == "inmemory" || v == "memory")
        return ExporterKind::InMemory;
    if (v == "none")
        return ExporterKind::None;
    throw ConfigError("unknown exporter kind: " + s);
}

namespace telemetry
{

OverflowPolicy overflow_policy_from_string(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "drop_newest")
        return OverflowPolicy::DropNewest;
    if (v == "drop_oldest")
        return OverflowPolicy::DropOldest;
    throw ConfigError("unknown overflow policy: " + s);
}

} // namespace telemetry

Settings::Settings() : service_version(VERSION_STRING) {}

Settings Settings::from_env()
{
    Settings s;
    s.log_level = to_upper(getenv_str("TRACEDMCP_LOG_LEVEL", s.log_level));

    s.service_name = getenv_str("OTEL_SERVICE_NAME", s.service_name);
    s.host = getenv_str("TRACEDMCP_HOST", s.host);
    if (has_env("TRACEDMCP_PORT"))
    {
        auto port = parse_positive("TRACEDMCP_PORT", getenv_str("TRACEDMCP_PORT", ""));
        if (port > 65535)
            throw ConfigError("TRACEDMCP_PORT: out of range: " + std::to_string(port));
        s.port = static_cast<int>(port);
    }
    s.endpoint_path = getenv_str("TRACEDMCP_PATH", s.endpoint_path);
    s.cors_origin = getenv_str("TRACEDMCP_CORS_ORIGIN", s.cors_origin);

    if (has_env("TRACEDMCP_EXPORTER"))
        s.exporter = exporter_kind_from_string(getenv_str("TRACEDMCP_EXPORTER", ""));

    // Same precedence as the OpenTelemetry SDKs: signal-specific endpoint first
    if (has_env("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT"))
    {
        s.traces_endpoint = getenv_str("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "");
    }
    else if (has_env("OTEL_EXPORTER_OTLP_ENDPOINT"))
    {
        auto base = getenv_str("OTEL_EXPORTER_OTLP_ENDPOINT", "");
        while (!base.empty() && base.back() == '/')
            base.pop_back();
        s.traces_endpoint = base + "/v1/traces";
    }

    s.sink_username = getenv_str("LANGFUSE_PUBLIC_KEY", s.sink_username);
    s.sink_password = getenv_str("LANGFUSE_SECRET_KEY", s.sink_password);
    if (has_env("OTEL_EXPORTER_OTLP_HEADERS"))
        s.sink_headers = parse_header_list(getenv_str("OTEL_EXPORTER_OTLP_HEADERS", ""));

    if (has_env("TRACEDMCP_MAX_QUEUE_SIZE"))
        s.batch.max_queue_size = static_cast<std::size_t>(
            parse_positive("TRACEDMCP_MAX_QUEUE_SIZE", getenv_str("TRACEDMCP_MAX_QUEUE_SIZE", "")));
    if (has_env("TRACEDMCP_MAX_EXPORT_BATCH_SIZE"))
        s.batch.max_export_batch_size = static_cast<std::size_t>(parse_positive(
            "TRACEDMCP_MAX_EXPORT_BATCH_SIZE", getenv_str("TRACEDMCP_MAX_EXPORT_BATCH_SIZE", "")));
    if (has_env("TRACEDMCP_SCHEDULED_DELAY_MS"))
        s.batch.scheduled_delay = std::chrono::milliseconds(parse_positive(
            "TRACEDMCP_SCHEDULED_DELAY_MS", getenv_str("TRACEDMCP_SCHEDULED_DELAY_MS", "")));
    if (has_env("TRACEDMCP_EXPORT_TIMEOUT_MS"))
        s.batch.export_timeout = std::chrono::milliseconds(parse_positive(
            "TRACEDMCP_EXPORT_TIMEOUT_MS", getenv_str("TRACEDMCP_EXPORT_TIMEOUT_MS", "")));
    if (has_env("TRACEDMCP_SHUTDOWN_TIMEOUT_MS"))
        s.batch.shutdown_timeout = std::chrono::milliseconds(parse_positive(
            "TRACEDMCP_SHUTDOWN_TIMEOUT_MS", getenv_str("TRACEDMCP_SHUTDOWN_TIMEOUT_MS", "")));
    if (has_env("TRACEDMCP_OVERFLOW_POLICY"))
        s.batch.overflow_policy =
            telemetry::overflow_policy_from_string(getenv_str("TRACEDMCP_OVERFLOW_POLICY", ""));
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    try
    {
        if (j.contains("log_level"))
            s.log_level = to_upper(j.at("log_level").get<std::string>());
        if (j.contains("service_name"))
            s.service_name = j.at("service_name").get<std::string>();
        if (j.contains("service_version"))
            s.service_version = j.at("service_version").get<std::string>();
        if (j.contains("host"))
            s.host = j.at("host").get<std::string>();
        if (j.contains("port"))
            s.port = j.at("port").get<int>();
        if (j.contains("endpoint_path"))
            s.endpoint_path = j.at("endpoint_path").get<std::string>();
        if (j.contains("cors_origin"))
            s.cors_origin = j.at("cors_origin").get<std::string>();
        if (j.contains("exporter"))
            s.exporter = exporter_kind_from_string(j.at("exporter").get<std::string>());
        if (j.contains("traces_endpoint"))
            s.traces_endpoint = j.at("traces_endpoint").get<std::string>();
        if (j.contains("sink_username"))
            s.sink_username = j.at("sink_username").get<std::string>();
        if (j.contains("sink_password"))
            s.sink_password = j.at("sink_password").get<std::string>();
        if (j.contains("sink_headers"))
            s.sink_headers =
                j.at("sink_headers").get<std::unordered_map<std::string, std::string>>();

        if (j.contains("batch"))
        {
            const auto& b = j.at("batch");
            if (b.contains("max_queue_size"))
                s.batch.max_queue_size =
                    static_cast<std::size_t>(json_positive(b, "max_queue_size"));
            if (b.contains("max_export_batch_size"))
                s.batch.max_export_batch_size =
                    static_cast<std::size_t>(json_positive(b, "max_export_batch_size"));
            if (b.contains("scheduled_delay_ms"))
                s.batch.scheduled_delay =
                    std::chrono::milliseconds(json_positive(b, "scheduled_delay_ms"));
            if (b.contains("export_timeout_ms"))
                s.batch.export_timeout =
                    std::chrono::milliseconds(json_positive(b, "export_timeout_ms"));
            if (b.contains("shutdown_timeout_ms"))
                s.batch.shutdown_timeout =
                    std::chrono::milliseconds(json_positive(b, "shutdown_timeout_ms"));
            if (b.contains("overflow_policy"))
                s.batch.overflow_policy = telemetry::overflow_policy_from_string(
                    b.at("overflow_policy").get<std::string>());
        }
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(std::string("invalid settings: ") + e.what());
    }

    if (s.port <= 0 || s.port > 65535)
        throw ConfigError("port out of range: " + std::to_string(s.port));
    return s;
}

} // namespace tracedmcp
