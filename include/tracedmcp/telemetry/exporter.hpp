#pragma once

#include "tracedmcp/telemetry/span.hpp"

#include <chrono>
#include <mutex>
#include <vector>

namespace tracedmcp::telemetry
{

enum class ExportResult
{
    Success,
    Failure
};

/// Backend that ships a batch of closed spans in its own wire format.
/// Called from a single worker thread; never from request handling.
class SpanExporter
{
  public:
    virtual ~SpanExporter() = default;
    virtual ExportResult export_spans(const std::vector<Span>& batch) = 0;
    virtual void shutdown() {}

    /// Cap the wall time of subsequent export_spans() calls. Exporters that never block
    /// may ignore it.
    virtual void limit_export_time(std::chrono::milliseconds) {}
};

/// Accepts and discards every batch.
class NoopSpanExporter : public SpanExporter
{
  public:
    ExportResult export_spans(const std::vector<Span>&) override
    {
        return ExportResult::Success;
    }
};

/// Keeps exported spans in memory. Safe to read while the worker is exporting.
class InMemorySpanExporter : public SpanExporter
{
  public:
    ExportResult export_spans(const std::vector<Span>& batch) override;
    std::vector<Span> finished_spans() const;
    std::size_t size() const;
    std::size_t batch_count() const;
    void reset();

  private:
    mutable std::mutex mutex_;
    std::vector<Span> spans_;
    std::size_t batches_{0};
};

} // namespace tracedmcp::telemetry
