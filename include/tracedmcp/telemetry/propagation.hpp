#pragma once
#include "tracedmcp/telemetry/trace_context.hpp"
#include "tracedmcp/types.hpp"

#include <optional>
#include <string>

namespace tracedmcp::telemetry::propagation
{

constexpr const char* TRACEPARENT_HEADER = "traceparent";
constexpr const char* TRACESTATE_HEADER = "tracestate";
constexpr std::size_t MAX_TRACESTATE_LENGTH = 512;

/// Parse a W3C traceparent value ("00-<trace-id>-<span-id>-<flags>").
/// Returns nullopt for anything but a well-formed version 00 header with non-zero ids.
std::optional<TraceContext> parse_traceparent(const std::string& value);

/// Format the traceparent value for a non-root context; empty for a root context.
std::string format_traceparent(const TraceContext& ctx);

/// Case-insensitive header lookup.
std::optional<std::string> find_header(const Carrier& carrier, const std::string& name);

/// Read the trace context out of transport headers.
///
/// Never fails: a missing, malformed or unsupported carrier yields TraceContext::new_root().
TraceContext extract(const Carrier& carrier);

/// Write traceparent (and tracestate, when present) for an outbound call.
/// A root context has no span to parent to and produces an empty carrier.
Carrier inject(const TraceContext& ctx);

} // namespace tracedmcp::telemetry::propagation
