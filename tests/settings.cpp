#include <cassert>
#include <cstdlib>
#include <string>
#include "tracedmcp/exceptions.hpp"
#include "tracedmcp/settings.hpp"
#include "tracedmcp/version.hpp"

// Cross-platform setenv wrapper
static void set_env(const char* name, const char* value) {
#ifdef _WIN32
  _putenv_s(name, value);
#else
  setenv(name, value, 1);
#endif
}

static void unset_env(const char* name) {
#ifdef _WIN32
  _putenv_s(name, "");
#else
  unsetenv(name);
#endif
}

template <typename Fn>
static bool throws_config_error(Fn fn) {
  try {
    fn();
  } catch (const tracedmcp::ConfigError&) {
    return true;
  }
  return false;
}

int main() {
  using namespace tracedmcp;

  // Defaults
  Settings d;
  assert(d.service_name == "weather-assistant");
  assert(d.service_version == VERSION_STRING);
  assert(d.port == 8001);
  assert(d.endpoint_path == "/weather");
  assert(d.exporter == ExporterKind::Otlp);
  assert(d.traces_endpoint == "http://localhost:4318/v1/traces");
  assert(d.batch.overflow_policy == telemetry::OverflowPolicy::DropNewest);

  // JSON parse
  auto s = Settings::from_json(Json{{"log_level","debug"},
                                    {"port", 9100},
                                    {"exporter","inmemory"},
                                    {"sink_headers", {{"x-tenant","weather"}}},
                                    {"batch", {{"max_queue_size", 16},
                                               {"scheduled_delay_ms", 50},
                                               {"overflow_policy","drop_oldest"}}}});
  assert(s.log_level == "DEBUG"); // uppercased like the env path
  assert(s.port == 9100);
  assert(s.exporter == ExporterKind::InMemory);
  assert(s.sink_headers.at("x-tenant") == "weather");
  assert(s.batch.max_queue_size == 16);
  assert(s.batch.scheduled_delay == std::chrono::milliseconds(50));
  assert(s.batch.overflow_policy == telemetry::OverflowPolicy::DropOldest);

  assert(throws_config_error([] { Settings::from_json(Json{{"port", 70000}}); }));
  assert(throws_config_error([] { Settings::from_json(Json{{"port", "eighty"}}); }));
  assert(throws_config_error([] { Settings::from_json(Json{{"exporter", "zipkin"}}); }));
  assert(throws_config_error([] { Settings::from_json(Json{{"batch", {{"max_queue_size", 0}}}}); }));
  assert(throws_config_error([] { Settings::from_json(Json{{"batch", {{"max_queue_size", -1}}}}); }));
  assert(throws_config_error([] { Settings::from_json(Json{{"batch", {{"max_export_batch_size", 2.5}}}}); }));
  assert(throws_config_error([] { Settings::from_json(Json{{"batch", {{"scheduled_delay_ms", 0}}}}); }));
  assert(throws_config_error([] { Settings::from_json(Json{{"batch", {{"export_timeout_ms", "fast"}}}}); }));
  assert(throws_config_error([] { Settings::from_json(Json{{"batch", {{"shutdown_timeout_ms", -5}}}}); }));

  // Env parse (set locally)
  set_env("TRACEDMCP_LOG_LEVEL","warn");
  set_env("OTEL_SERVICE_NAME","weather-test");
  set_env("TRACEDMCP_PORT","9200");
  set_env("OTEL_EXPORTER_OTLP_ENDPOINT","https://cloud.langfuse.com/api/public/otel/");
  set_env("LANGFUSE_PUBLIC_KEY","pk-lf-1");
  set_env("LANGFUSE_SECRET_KEY","sk-lf-1");
  set_env("OTEL_EXPORTER_OTLP_HEADERS","x-tenant=weather, x-env = test");
  set_env("TRACEDMCP_MAX_QUEUE_SIZE","128");
  set_env("TRACEDMCP_OVERFLOW_POLICY","drop_oldest");
  auto e = Settings::from_env();
  assert(e.log_level == "WARN"); // uppercased
  assert(e.service_name == "weather-test");
  assert(e.port == 9200);
  assert(e.traces_endpoint == "https://cloud.langfuse.com/api/public/otel/v1/traces");
  assert(e.sink_username == "pk-lf-1");
  assert(e.sink_password == "sk-lf-1");
  assert(e.sink_headers.at("x-tenant") == "weather");
  assert(e.sink_headers.at("x-env") == "test");
  assert(e.batch.max_queue_size == 128);
  assert(e.batch.overflow_policy == telemetry::OverflowPolicy::DropOldest);

  // Signal-specific endpoint wins
  set_env("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT","http://jaeger:4318/v1/traces");
  assert(Settings::from_env().traces_endpoint == "http://jaeger:4318/v1/traces");

  set_env("TRACEDMCP_PORT","99999");
  assert(throws_config_error([] { Settings::from_env(); }));
  set_env("TRACEDMCP_PORT","abc");
  assert(throws_config_error([] { Settings::from_env(); }));
  unset_env("TRACEDMCP_PORT");

  set_env("TRACEDMCP_EXPORTER","carrier-pigeon");
  assert(throws_config_error([] { Settings::from_env(); }));
  unset_env("TRACEDMCP_EXPORTER");
  return 0;
}
