#pragma once

#include "tracedmcp/telemetry/span.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace tracedmcp::telemetry
{

/// Receives spans once they are closed. Implementations must accept submissions from any
/// thread and must not block the caller.
class SpanProcessor
{
  public:
    virtual ~SpanProcessor() = default;
    virtual void submit(Span span) = 0;
    /// Wait until everything submitted so far has been handed to the sink.
    virtual bool force_flush(std::chrono::milliseconds timeout) = 0;
    virtual void shutdown(std::chrono::milliseconds timeout) = 0;
};

/// Handle to a span that is still open.
///
/// Attributes and status may be changed until end(); afterwards they throw SpanStateError.
/// end() submits the span exactly once, further calls are no-ops. A handle that goes out of
/// scope unended is ended on destruction, with Error status when an exception is unwinding.
class SpanScope
{
  public:
    SpanScope() = default;
    SpanScope(Span span, std::shared_ptr<SpanProcessor> processor);
    SpanScope(const SpanScope&) = delete;
    SpanScope& operator=(const SpanScope&) = delete;
    SpanScope(SpanScope&& other) noexcept;
    SpanScope& operator=(SpanScope&& other) noexcept;
    ~SpanScope();

    void set_attribute(const std::string& key, const Json& value);
    void set_attributes(const Attributes& attrs);
    void set_status(StatusCode code, const std::string& message = "");
    void record_exception(const std::string& message);
    void add_event(const std::string& name, const Attributes& attrs = {});

    void end();
    bool ended() const
    {
        return ended_;
    }

    /// Read-only view of the recorded data.
    const Span& span() const
    {
        return span_;
    }
    TraceContext context() const
    {
        return span_.context();
    }

  private:
    void ensure_open(const char* operation) const;
    void finalize(bool record_error);

    bool ended_{true};
    int uncaught_on_enter_{0};
    std::chrono::steady_clock::time_point started_at_{};
    Span span_;
    std::shared_ptr<SpanProcessor> processor_;
};

/// Creates spans and wires them to a processor. Immutable after construction.
class Tracer
{
  public:
    explicit Tracer(std::shared_ptr<SpanProcessor> processor,
                    std::string instrumentation_name = INSTRUMENTATION_NAME,
                    std::optional<std::string> version = std::nullopt)
        : processor_(std::move(processor)), instrumentation_name_(std::move(instrumentation_name)),
          version_(std::move(version))
    {
    }

    /// Open a span under `parent`.
    ///
    /// A root parent starts a genuinely new trace (fresh trace id, no parent span id);
    /// otherwise the span joins the parent's trace with parent_span_id = parent.span_id.
    SpanScope start_span(const TraceContext& parent, const std::string& name,
                         SpanKind kind = SpanKind::Internal) const;

    const std::shared_ptr<SpanProcessor>& processor() const
    {
        return processor_;
    }

  private:
    std::shared_ptr<SpanProcessor> processor_;
    std::string instrumentation_name_;
    std::optional<std::string> version_;
};

} // namespace tracedmcp::telemetry
