#include "core/cache/metrics/CacheStats.hpp"
#include <cmath>

namespace homebook {
namespace core {
namespace cache {

CacheStats StatsCollector::snapshot() const {
    CacheStats stats;
    stats.memoryHits = memoryHits_.load(std::memory_order_relaxed);
    stats.fileHits = fileHits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.evictions = evictions_.load(std::memory_order_relaxed);
    stats.totalHits = stats.memoryHits + stats.fileHits;
    stats.totalRequests = stats.totalHits + stats.misses;
    if (stats.totalRequests > 0) {
        double rate = static_cast<double>(stats.totalHits) / stats.totalRequests * 100.0;
        stats.hitRate = std::round(rate * 100.0) / 100.0;
    }
    return stats;
}

void StatsCollector::reset() {
    memoryHits_.store(0, std::memory_order_relaxed);
    fileHits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
    evictions_.store(0, std::memory_order_relaxed);
}

} // namespace cache
} // namespace core
} // namespace homebook
