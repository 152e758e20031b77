// Closed spans as handed to span sinks
#pragma once

#include "tracedmcp/telemetry/trace_context.hpp"
#include "tracedmcp/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracedmcp::telemetry
{

constexpr const char* INSTRUMENTATION_NAME = "tracedmcp";

enum class SpanKind
{
    Internal,
    Server,
    Client
};

enum class StatusCode
{
    Unset,
    Ok,
    Error
};

std::string to_string(SpanKind kind);
std::string to_string(StatusCode code);

/// Attribute values are scalars (string, number, boolean).
using Attributes = std::unordered_map<std::string, Json>;

struct SpanEvent
{
    std::string name;
    std::uint64_t time_unix_nano{0};
    Attributes attributes;
};

struct Span
{
    std::string name;
    SpanKind kind{SpanKind::Internal};
    std::string instrumentation_name{INSTRUMENTATION_NAME};
    std::optional<std::string> instrumentation_version;

    std::string trace_id;
    std::string span_id;
    std::optional<std::string> parent_span_id;
    std::uint8_t trace_flags{SAMPLED_FLAG};
    std::string trace_state;

    // Wall-clock for reporting; duration comes from the monotonic clock
    std::uint64_t start_time_unix_nano{0};
    std::uint64_t end_time_unix_nano{0};
    std::chrono::nanoseconds duration{0};

    StatusCode status{StatusCode::Unset};
    std::string status_message;
    Attributes attributes;
    std::vector<SpanEvent> events;

    /// Context that children of this span attach to.
    TraceContext context() const
    {
        TraceContext ctx;
        ctx.trace_id = trace_id;
        ctx.span_id = span_id;
        ctx.trace_flags = trace_flags;
        ctx.trace_state = trace_state;
        return ctx;
    }

    bool is_root() const
    {
        return !parent_span_id.has_value();
    }
};

} // namespace tracedmcp::telemetry
