#pragma once

#include "tracedmcp/telemetry/batch_config.hpp"
#include "tracedmcp/telemetry/exporter.hpp"
#include "tracedmcp/telemetry/tracer.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace tracedmcp::telemetry
{

/**
 * Bounded, non-blocking span queue drained by one background worker.
 *
 * Request threads call submit(), which only takes the queue lock long enough to append.
 * When the queue holds max_queue_size spans the overflow policy decides which span is
 * discarded; the discard is counted in Stats::dropped and never reported to the caller.
 *
 * The worker exports in batches of at most max_export_batch_size, either when a full batch
 * is waiting or every scheduled_delay. A failed export is logged and the batch is dropped;
 * there are no retries.
 *
 * shutdown() stops intake and performs one best-effort flush bounded by its timeout;
 * spans still queued at the deadline are discarded. Each export during that flush is
 * limited to the time left (SpanExporter::limit_export_time); an exporter that ignores
 * the limit can overrun the deadline by one call.
 */
class BatchSpanProcessor : public SpanProcessor
{
  public:
    struct Stats
    {
        std::uint64_t submitted{0};      ///< Spans accepted into the queue
        std::uint64_t exported{0};       ///< Spans the sink acknowledged
        std::uint64_t dropped{0};        ///< Spans discarded by overflow or shutdown
        std::uint64_t failed_spans{0};   ///< Spans lost with a failed batch
        std::uint64_t failed_batches{0}; ///< Batches the sink rejected
        std::size_t queued{0};           ///< Spans currently waiting
    };

    explicit BatchSpanProcessor(std::unique_ptr<SpanExporter> exporter, BatchConfig config = {});
    ~BatchSpanProcessor() override;

    BatchSpanProcessor(const BatchSpanProcessor&) = delete;
    BatchSpanProcessor& operator=(const BatchSpanProcessor&) = delete;

    void submit(Span span) override;
    bool force_flush(std::chrono::milliseconds timeout) override;
    void shutdown(std::chrono::milliseconds timeout) override;

    Stats stats() const;
    const BatchConfig& config() const
    {
        return config_;
    }

  private:
    void worker_loop();
    std::vector<Span> take_batch_locked();
    void export_batch(const std::vector<Span>& batch);

    std::unique_ptr<SpanExporter> exporter_;
    BatchConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable flushed_cv_;
    std::deque<Span> queue_;
    bool stopped_{false};
    std::chrono::steady_clock::time_point shutdown_deadline_{};
    std::uint64_t flush_requested_{0};
    std::uint64_t flush_completed_{0};
    std::thread worker_;

    std::atomic<std::uint64_t> submitted_{0};
    std::atomic<std::uint64_t> exported_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> failed_spans_{0};
    std::atomic<std::uint64_t> failed_batches_{0};
};

} // namespace tracedmcp::telemetry
