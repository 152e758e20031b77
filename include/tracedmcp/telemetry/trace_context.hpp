#pragma once

#include <cstdint>
#include <string>

namespace tracedmcp::telemetry
{

constexpr std::uint8_t SAMPLED_FLAG = 0x01;

/// Position inside a distributed trace.
///
/// A context with an empty span_id is a root: spans started from it begin a new trace and have
/// no parent. Otherwise span_id names the span that children of this context attach to.
/// Ids are lower-case hex: 32 chars for the trace id, 16 for the span id.
struct TraceContext
{
    std::string trace_id;
    std::string span_id;
    std::uint8_t trace_flags{SAMPLED_FLAG};
    std::string trace_state; ///< Opaque vendor state, propagated as-is
    bool remote{false};      ///< Extracted from an inbound carrier

    bool is_valid() const;
    bool is_root() const
    {
        return span_id.empty();
    }
    bool is_sampled() const
    {
        return (trace_flags & SAMPLED_FLAG) != 0;
    }

    /// Fresh root context: random non-zero trace id, no span id.
    static TraceContext new_root();
};

bool operator==(const TraceContext& a, const TraceContext& b);
bool operator!=(const TraceContext& a, const TraceContext& b);

/// Random non-zero 128-bit id as 32 lower-case hex chars.
std::string generate_trace_id();
/// Random non-zero 64-bit id as 16 lower-case hex chars.
std::string generate_span_id();

bool is_valid_trace_id(const std::string& id);
bool is_valid_span_id(const std::string& id);

} // namespace tracedmcp::telemetry
