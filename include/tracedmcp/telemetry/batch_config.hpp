#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace tracedmcp::telemetry
{

/// What submit() does when the export queue is already at capacity.
enum class OverflowPolicy
{
    DropNewest, ///< Discard the span being submitted
    DropOldest  ///< Evict the oldest queued span to make room
};

inline std::string to_string(OverflowPolicy policy)
{
    switch (policy)
    {
    case OverflowPolicy::DropNewest:
        return "drop_newest";
    case OverflowPolicy::DropOldest:
        return "drop_oldest";
    }
    return "drop_newest";
}

OverflowPolicy overflow_policy_from_string(const std::string& s);

struct BatchConfig
{
    std::size_t max_queue_size{2048};
    std::size_t max_export_batch_size{512};
    std::chrono::milliseconds scheduled_delay{200};
    std::chrono::milliseconds export_timeout{10000};
    std::chrono::milliseconds shutdown_timeout{5000};
    OverflowPolicy overflow_policy{OverflowPolicy::DropNewest};
};

} // namespace tracedmcp::telemetry
