#pragma once
#include <cstdint>

namespace shp {
namespace util {

/* Lightweight latency accumulators.
 * Kept out of the pipeline itself; the dispatcher feeds them from tick stamps.
 */

struct QueueLatencyStats {
    std::uint64_t count = 0;  // number of completed items measured
    std::uint64_t total = 0;  // sum of latencies over all completed items
    std::uint64_t max   = 0;  // maximum single-item latency observed
    std::uint64_t min   = 0;  // minimum single-item latency observed (valid when count > 0)

    double Mean() const {
        return count == 0 ? 0.0 : static_cast<double>(total) / static_cast<double>(count);
    }
};

struct LatencyStats {
    QueueLatencyStats block;    // admission -> retirement of one block (fixed by the pipeline)
    QueueLatencyStats message;  // submission -> final hash of one message
};

// Add one observation to a QueueLatencyStats.
inline void AccumulateQueueLatency(QueueLatencyStats& dst, std::uint64_t latency) {
    if (dst.count == 0 || latency < dst.min) dst.min = latency;
    dst.count += 1;
    dst.total += latency;
    if (latency > dst.max) dst.max = latency;
}

} // namespace util
} // namespace shp
