#include "tracedmcp/telemetry/exporter.hpp"

namespace tracedmcp::telemetry
{

ExportResult InMemorySpanExporter::export_spans(const std::vector<Span>& batch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.insert(spans_.end(), batch.begin(), batch.end());
    ++batches_;
    return ExportResult::Success;
}

std::vector<Span> InMemorySpanExporter::finished_spans() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_;
}

std::size_t InMemorySpanExporter::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_.size();
}

std::size_t InMemorySpanExporter::batch_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_;
}

void InMemorySpanExporter::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.clear();
    batches_ = 0;
}

} // namespace tracedmcp::telemetry
