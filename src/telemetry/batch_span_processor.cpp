#include "tracedmcp/telemetry/batch_span_processor.hpp"

#include "tracedmcp/util/log.hpp"

#include <algorithm>

namespace tracedmcp::telemetry
{

BatchSpanProcessor::BatchSpanProcessor(std::unique_ptr<SpanExporter> exporter, BatchConfig config)
    : exporter_(std::move(exporter)), config_(config)
{
    config_.max_queue_size = std::max<std::size_t>(config_.max_queue_size, 1);
    config_.max_export_batch_size =
        std::min(std::max<std::size_t>(config_.max_export_batch_size, 1), config_.max_queue_size);
    worker_ = std::thread([this]() { worker_loop(); });
}

BatchSpanProcessor::~BatchSpanProcessor()
{
    shutdown(config_.shutdown_timeout);
}

void BatchSpanProcessor::submit(Span span)
{
    bool wake_worker = false;
    bool first_drop = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
        {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        bool accept = true;
        if (queue_.size() >= config_.max_queue_size)
        {
            first_drop = dropped_.fetch_add(1, std::memory_order_relaxed) == 0;
            if (config_.overflow_policy == OverflowPolicy::DropOldest)
                queue_.pop_front();
            else
                accept = false;
        }
        if (accept)
        {
            queue_.push_back(std::move(span));
            submitted_.fetch_add(1, std::memory_order_relaxed);
            wake_worker = queue_.size() >= config_.max_export_batch_size;
        }
    }
    if (first_drop)
        util::log::warn("span queue full (" + std::to_string(config_.max_queue_size) +
                        " spans), applying " + to_string(config_.overflow_policy));
    if (wake_worker)
        queue_cv_.notify_one();
}

bool BatchSpanProcessor::force_flush(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopped_)
        return queue_.empty();
    const auto target = ++flush_requested_;
    queue_cv_.notify_one();
    return flushed_cv_.wait_for(lock, timeout, [&]() { return flush_completed_ >= target; });
}

void BatchSpanProcessor::shutdown(std::chrono::milliseconds timeout)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
            return;
        stopped_ = true;
        shutdown_deadline_ = std::chrono::steady_clock::now() + timeout;
    }
    queue_cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
    exporter_->shutdown();

    auto s = stats();
    util::log::info("span exporter stopped: exported=" + std::to_string(s.exported) +
                    " dropped=" + std::to_string(s.dropped) +
                    " failed=" + std::to_string(s.failed_spans));
}

BatchSpanProcessor::Stats BatchSpanProcessor::stats() const
{
    Stats s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.exported = exported_.load(std::memory_order_relaxed);
    s.dropped = dropped_.load(std::memory_order_relaxed);
    s.failed_spans = failed_spans_.load(std::memory_order_relaxed);
    s.failed_batches = failed_batches_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(mutex_);
    s.queued = queue_.size();
    return s;
}

std::vector<Span> BatchSpanProcessor::take_batch_locked()
{
    std::vector<Span> batch;
    auto n = std::min(queue_.size(), config_.max_export_batch_size);
    batch.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        batch.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    return batch;
}

void BatchSpanProcessor::export_batch(const std::vector<Span>& batch)
{
    if (batch.empty())
        return;

    ExportResult result = ExportResult::Failure;
    try
    {
        result = exporter_->export_spans(batch);
    }
    catch (const std::exception& e)
    {
        util::log::error(std::string("span exporter threw: ") + e.what());
    }

    if (result == ExportResult::Success)
    {
        exported_.fetch_add(batch.size(), std::memory_order_relaxed);
        return;
    }
    failed_batches_.fetch_add(1, std::memory_order_relaxed);
    failed_spans_.fetch_add(batch.size(), std::memory_order_relaxed);
    util::log::warn("span export failed, dropping batch of " + std::to_string(batch.size()) +
                    " spans");
}

void BatchSpanProcessor::worker_loop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (true)
    {
        queue_cv_.wait_for(lock, config_.scheduled_delay,
                           [this]()
                           {
                               return stopped_ || flush_requested_ > flush_completed_ ||
                                      queue_.size() >= config_.max_export_batch_size;
                           });
        if (stopped_)
            break;

        const auto flush_target = flush_requested_;
        const bool drain_all = flush_target > flush_completed_;

        // Scheduled tick or full batch: ship what is queued. A flush drains everything.
        while (!queue_.empty())
        {
            auto batch = take_batch_locked();
            lock.unlock();
            export_batch(batch);
            lock.lock();
            if (stopped_)
                break;
            if (!drain_all && queue_.size() < config_.max_export_batch_size)
                break;
        }

        if (stopped_)
            break;
        if (drain_all)
        {
            flush_completed_ = flush_target;
            flushed_cv_.notify_all();
        }
    }

    // One bounded best-effort flush on the way out
    while (!queue_.empty())
    {
        if (std::chrono::steady_clock::now() >= shutdown_deadline_)
        {
            dropped_.fetch_add(queue_.size(), std::memory_order_relaxed);
            util::log::warn("shutdown deadline reached, discarding " +
                            std::to_string(queue_.size()) + " queued spans");
            queue_.clear();
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            shutdown_deadline_ - std::chrono::steady_clock::now());
        auto batch = take_batch_locked();
        lock.unlock();
        exporter_->limit_export_time(std::max(remaining, std::chrono::milliseconds(1)));
        export_batch(batch);
        lock.lock();
    }
    flush_completed_ = flush_requested_;
    flushed_cv_.notify_all();
}

} // namespace tracedmcp::telemetry
