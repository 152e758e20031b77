#include "tracedmcp/telemetry/tracer.hpp"

#include "tracedmcp/exceptions.hpp"

#include <exception>

namespace tracedmcp::telemetry
{
namespace
{

std::uint64_t now_unix_nano()
{
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                          std::chrono::system_clock::now().time_since_epoch())
                                          .count());
}

// Attributes are scalars; structured values are stored as their JSON text.
Json to_attribute_value(const Json& value)
{
    if (value.is_string() || value.is_number() || value.is_boolean())
        return value;
    return value.dump();
}

} // namespace

std::string to_string(SpanKind kind)
{
    switch (kind)
    {
    case SpanKind::Internal:
        return "internal";
    case SpanKind::Server:
        return "server";
    case SpanKind::Client:
        return "client";
    }
    return "internal";
}

std::string to_string(StatusCode code)
{
    switch (code)
    {
    case StatusCode::Unset:
        return "unset";
    case StatusCode::Ok:
        return "ok";
    case StatusCode::Error:
        return "error";
    }
    return "unset";
}

SpanScope::SpanScope(Span span, std::shared_ptr<SpanProcessor> processor)
    : ended_(false), uncaught_on_enter_(std::uncaught_exceptions()),
      started_at_(std::chrono::steady_clock::now()), span_(std::move(span)),
      processor_(std::move(processor))
{
    span_.start_time_unix_nano = now_unix_nano();
}

SpanScope::SpanScope(SpanScope&& other) noexcept
    : ended_(other.ended_), uncaught_on_enter_(other.uncaught_on_enter_),
      started_at_(other.started_at_), span_(std::move(other.span_)),
      processor_(std::move(other.processor_))
{
    other.ended_ = true;
}

SpanScope& SpanScope::operator=(SpanScope&& other) noexcept
{
    if (this == &other)
        return *this;

    if (!ended_)
        finalize(false);

    ended_ = other.ended_;
    uncaught_on_enter_ = other.uncaught_on_enter_;
    started_at_ = other.started_at_;
    span_ = std::move(other.span_);
    processor_ = std::move(other.processor_);

    other.ended_ = true;
    return *this;
}

SpanScope::~SpanScope()
{
    if (ended_)
        return;
    bool record_error = std::uncaught_exceptions() > uncaught_on_enter_;
    finalize(record_error);
}

void SpanScope::ensure_open(const char* operation) const
{
    if (ended_)
        throw SpanStateError(std::string(operation) + " on ended span '" + span_.name + "'");
}

void SpanScope::set_attribute(const std::string& key, const Json& value)
{
    ensure_open("set_attribute");
    span_.attributes[key] = to_attribute_value(value);
}

void SpanScope::set_attributes(const Attributes& attrs)
{
    ensure_open("set_attributes");
    for (const auto& [key, value] : attrs)
        span_.attributes[key] = to_attribute_value(value);
}

void SpanScope::set_status(StatusCode code, const std::string& message)
{
    ensure_open("set_status");
    span_.status = code;
    // Description is only meaningful for errors
    span_.status_message = code == StatusCode::Error ? message : "";
}

void SpanScope::record_exception(const std::string& message)
{
    ensure_open("record_exception");
    add_event("exception", {{"exception.message", message}});
    set_status(StatusCode::Error, message);
}

void SpanScope::add_event(const std::string& name, const Attributes& attrs)
{
    ensure_open("add_event");
    SpanEvent event;
    event.name = name;
    event.time_unix_nano = now_unix_nano();
    for (const auto& [key, value] : attrs)
        event.attributes[key] = to_attribute_value(value);
    span_.events.push_back(std::move(event));
}

void SpanScope::end()
{
    if (ended_)
        return;
    finalize(false);
}

void SpanScope::finalize(bool record_error)
{
    ended_ = true;

    span_.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - started_at_);
    span_.end_time_unix_nano =
        span_.start_time_unix_nano + static_cast<std::uint64_t>(span_.duration.count());

    if (record_error && span_.status != StatusCode::Error)
    {
        span_.status = StatusCode::Error;
        span_.status_message = "exception while span was active";
    }

    if (processor_)
        processor_->submit(span_);
}

SpanScope Tracer::start_span(const TraceContext& parent, const std::string& name,
                             SpanKind kind) const
{
    Span span;
    span.name = name;
    span.kind = kind;
    span.instrumentation_name = instrumentation_name_;
    span.instrumentation_version = version_;

    if (!parent.is_root() && parent.is_valid())
    {
        span.trace_id = parent.trace_id;
        span.parent_span_id = parent.span_id;
        span.trace_flags = parent.trace_flags;
        span.trace_state = parent.trace_state;
    }
    else
    {
        span.trace_id = generate_trace_id();
    }
    span.span_id = generate_span_id();

    return SpanScope(std::move(span), processor_);
}

} // namespace tracedmcp::telemetry
