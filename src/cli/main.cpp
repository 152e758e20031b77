#include "tracedmcp/exceptions.hpp"
#include "tracedmcp/mcp/dispatcher.hpp"
#include "tracedmcp/server/http_server.hpp"
#include "tracedmcp/settings.hpp"
#include "tracedmcp/telemetry/batch_span_processor.hpp"
#include "tracedmcp/telemetry/otlp_http_exporter.hpp"
#include "tracedmcp/telemetry/tracer.hpp"
#include "tracedmcp/tools/weather.hpp"
#include "tracedmcp/util/log.hpp"
#include "tracedmcp/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

std::atomic<bool> g_stop{false};

void on_signal(int)
{
    g_stop = true;
}

static int usage(int exit_code = 1)
{
    std::cout << "tracedmcp_server " << tracedmcp::VERSION_STRING << "\n";
    std::cout << "Usage:\n";
    std::cout << "  tracedmcp_server [--config <file.json>]\n";
    std::cout << "  tracedmcp_server --help\n";
    std::cout << "  tracedmcp_server --version\n";
    std::cout << "\n";
    std::cout << "Without --config, settings come from the environment:\n";
    std::cout << "  OTEL_SERVICE_NAME, OTEL_EXPORTER_OTLP_TRACES_ENDPOINT, OTEL_EXPORTER_OTLP_ENDPOINT,\n";
    std::cout << "  OTEL_EXPORTER_OTLP_HEADERS, LANGFUSE_PUBLIC_KEY, LANGFUSE_SECRET_KEY,\n";
    std::cout << "  TRACEDMCP_HOST, TRACEDMCP_PORT, TRACEDMCP_PATH, TRACEDMCP_CORS_ORIGIN,\n";
    std::cout << "  TRACEDMCP_EXPORTER (otlp|inmemory|none), TRACEDMCP_LOG_LEVEL,\n";
    std::cout << "  TRACEDMCP_MAX_QUEUE_SIZE, TRACEDMCP_MAX_EXPORT_BATCH_SIZE,\n";
    std::cout << "  TRACEDMCP_SCHEDULED_DELAY_MS, TRACEDMCP_EXPORT_TIMEOUT_MS,\n";
    std::cout << "  TRACEDMCP_SHUTDOWN_TIMEOUT_MS, TRACEDMCP_OVERFLOW_POLICY (drop_newest|drop_oldest)\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static tracedmcp::Settings load_settings(const std::optional<std::string>& config_path)
{
    if (!config_path)
        return tracedmcp::Settings::from_env();

    std::ifstream in(*config_path);
    if (!in)
        throw tracedmcp::ConfigError("cannot open config file: " + *config_path);
    tracedmcp::Json j;
    try
    {
        in >> j;
    }
    catch (const tracedmcp::Json::parse_error& e)
    {
        throw tracedmcp::ConfigError("config file " + *config_path + " is not JSON: " + e.what());
    }
    return tracedmcp::Settings::from_json(j);
}

static std::unique_ptr<tracedmcp::telemetry::SpanExporter>
make_exporter(const tracedmcp::Settings& settings)
{
    using namespace tracedmcp::telemetry;
    switch (settings.exporter)
    {
    case tracedmcp::ExporterKind::Otlp:
    {
        OtlpHttpExporterOptions opts;
        opts.endpoint = settings.traces_endpoint;
        opts.service_name = settings.service_name;
        opts.service_version = settings.service_version;
        opts.username = settings.sink_username;
        opts.password = settings.sink_password;
        opts.headers = settings.sink_headers;
        opts.timeout = settings.batch.export_timeout;
        return std::make_unique<OtlpHttpExporter>(std::move(opts));
    }
    case tracedmcp::ExporterKind::InMemory:
        return std::make_unique<InMemorySpanExporter>();
    case tracedmcp::ExporterKind::None:
        return std::make_unique<NoopSpanExporter>();
    }
    throw tracedmcp::ConfigError("unsupported exporter kind");
}

static int run_server(const tracedmcp::Settings& settings)
{
    using namespace tracedmcp;

    util::log::info("starting " + settings.service_name + " " + settings.service_version);
    util::log::info("span exporter: " + to_string(settings.exporter) +
              (settings.exporter == ExporterKind::Otlp ? " -> " + settings.traces_endpoint
                                                       : std::string()));

    auto processor =
        std::make_shared<telemetry::BatchSpanProcessor>(make_exporter(settings), settings.batch);
    auto tracer = std::make_shared<const telemetry::Tracer>(
        processor, telemetry::INSTRUMENTATION_NAME, settings.service_version);

    tools::ToolManager tools;
    tools::weather::register_weather_tools(tools);

    mcp::ServerInfo info{settings.service_name, settings.service_version,
                         std::string("Weather assistant. Use get_weather for current "
                                     "conditions and get_forecast for a daily forecast.")};
    mcp::Dispatcher dispatcher(info, tools, tracer);

    server::HttpServerWrapper http(dispatcher, settings.host, settings.port,
                                   settings.endpoint_path, settings.cors_origin);
    if (!http.start())
    {
        processor->shutdown(settings.batch.shutdown_timeout);
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    while (!g_stop && http.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    util::log::info("shutting down");
    http.stop();
    processor->shutdown(settings.batch.shutdown_timeout);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);
    if (consume_flag(args, "--version") || consume_flag(args, "-v"))
    {
        std::cout << "tracedmcp " << tracedmcp::VERSION_MAJOR << "." << tracedmcp::VERSION_MINOR
                  << "." << tracedmcp::VERSION_PATCH << "\n";
        return 0;
    }

    auto config_path = consume_flag_value(args, "--config");
    if (!args.empty())
    {
        std::cerr << "Unknown option: " << args.front() << "\n";
        return usage(2);
    }

    tracedmcp::Settings settings;
    try
    {
        settings = load_settings(config_path);
    }
    catch (const tracedmcp::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }
    tracedmcp::util::log::set_level(tracedmcp::util::log::level_from_string(settings.log_level));

    try
    {
        return run_server(settings);
    }
    catch (const std::exception& e)
    {
        tracedmcp::util::log::error(std::string("fatal: ") + e.what());
        return 1;
    }
}
