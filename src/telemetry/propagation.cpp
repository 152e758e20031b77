#include "tracedmcp/telemetry/propagation.hpp"

#include <cctype>
#include <cstdio>

namespace tracedmcp::telemetry::propagation
{
namespace
{

// "00-" + 32 + "-" + 16 + "-" + 2
constexpr std::size_t TRACEPARENT_LENGTH = 55;

bool iequals(const std::string& a, const std::string& b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    return true;
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

std::string trim(const std::string& s)
{
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::optional<TraceContext> parse_traceparent(const std::string& raw)
{
    auto value = trim(raw);
    if (value.size() != TRACEPARENT_LENGTH)
        return std::nullopt;
    if (value[2] != '-' || value[35] != '-' || value[52] != '-')
        return std::nullopt;

    // Only version 00 is understood; "ff" is forbidden outright.
    if (value.compare(0, 2, "00") != 0)
        return std::nullopt;

    auto trace_id = value.substr(3, 32);
    auto span_id = value.substr(36, 16);
    int hi = hex_value(value[53]);
    int lo = hex_value(value[54]);
    if (hi < 0 || lo < 0)
        return std::nullopt;
    if (!is_valid_trace_id(trace_id) || !is_valid_span_id(span_id))
        return std::nullopt;

    TraceContext ctx;
    ctx.trace_id = std::move(trace_id);
    ctx.span_id = std::move(span_id);
    ctx.trace_flags = static_cast<std::uint8_t>((hi << 4) | lo);
    ctx.remote = true;
    return ctx;
}

std::string format_traceparent(const TraceContext& ctx)
{
    if (ctx.is_root() || !ctx.is_valid())
        return "";
    char flags[3];
    std::snprintf(flags, sizeof(flags), "%02x", static_cast<unsigned>(ctx.trace_flags));
    return "00-" + ctx.trace_id + "-" + ctx.span_id + "-" + flags;
}

std::optional<std::string> find_header(const Carrier& carrier, const std::string& name)
{
    auto exact = carrier.find(name);
    if (exact != carrier.end())
        return exact->second;
    for (const auto& [key, value] : carrier)
        if (iequals(key, name))
            return value;
    return std::nullopt;
}

TraceContext extract(const Carrier& carrier)
{
    auto traceparent = find_header(carrier, TRACEPARENT_HEADER);
    if (!traceparent)
        return TraceContext::new_root();

    auto ctx = parse_traceparent(*traceparent);
    if (!ctx)
        return TraceContext::new_root();

    if (auto state = find_header(carrier, TRACESTATE_HEADER))
    {
        auto trimmed = trim(*state);
        if (trimmed.size() <= MAX_TRACESTATE_LENGTH)
            ctx->trace_state = std::move(trimmed);
    }
    return *ctx;
}

Carrier inject(const TraceContext& ctx)
{
    Carrier carrier;
    auto traceparent = format_traceparent(ctx);
    if (traceparent.empty())
        return carrier;
    carrier[TRACEPARENT_HEADER] = traceparent;
    if (!ctx.trace_state.empty())
        carrier[TRACESTATE_HEADER] = ctx.trace_state;
    return carrier;
}

} // namespace tracedmcp::telemetry::propagation
