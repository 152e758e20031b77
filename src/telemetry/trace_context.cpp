#include "tracedmcp/telemetry/trace_context.hpp"

#include <algorithm>
#include <random>

namespace tracedmcp::telemetry
{
namespace
{

bool is_lower_hex(const std::string& s)
{
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

bool is_all_zeros(const std::string& s)
{
    return std::all_of(s.begin(), s.end(), [](char c) { return c == '0'; });
}

std::string random_hex(std::size_t bytes)
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;
    static const char* digits = "0123456789abcdef";

    std::string result;
    result.reserve(bytes * 2);
    do
    {
        result.clear();
        std::size_t remaining = bytes;
        while (remaining > 0)
        {
            std::uint64_t val = dis(gen);
            std::size_t chunk = std::min<std::size_t>(remaining, 8);
            for (std::size_t i = 0; i < chunk; ++i)
            {
                auto b = static_cast<std::uint8_t>(val >> (i * 8));
                result.push_back(digits[b >> 4]);
                result.push_back(digits[b & 0x0f]);
            }
            remaining -= chunk;
        }
    } while (is_all_zeros(result));
    return result;
}

} // namespace

bool is_valid_trace_id(const std::string& id)
{
    return id.size() == 32 && is_lower_hex(id) && !is_all_zeros(id);
}

bool is_valid_span_id(const std::string& id)
{
    return id.size() == 16 && is_lower_hex(id) && !is_all_zeros(id);
}

bool TraceContext::is_valid() const
{
    return is_valid_trace_id(trace_id) && (span_id.empty() || is_valid_span_id(span_id));
}

TraceContext TraceContext::new_root()
{
    TraceContext ctx;
    ctx.trace_id = generate_trace_id();
    return ctx;
}

bool operator==(const TraceContext& a, const TraceContext& b)
{
    return a.trace_id == b.trace_id && a.span_id == b.span_id && a.trace_flags == b.trace_flags &&
           a.trace_state == b.trace_state;
}

bool operator!=(const TraceContext& a, const TraceContext& b)
{
    return !(a == b);
}

std::string generate_trace_id()
{
    return random_hex(16);
}

std::string generate_span_id()
{
    return random_hex(8);
}

} // namespace tracedmcp::telemetry
