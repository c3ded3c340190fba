#include "resource_tracker.h"

#include <utility>

#include <glog/logging.h>

namespace Sluice {

ResourceTracker::ResourceTracker(size_t memory_limit_bytes, ResourceLimiter limiter)
    : memory_limit_bytes_(memory_limit_bytes), limiter_(std::move(limiter)) {}

bool ResourceTracker::MemoryGrowing(size_t current, size_t desired) {
    if (desired > memory_limit_bytes_) {
        grow_failures_.fetch_add(1, std::memory_order_relaxed);
        VLOG(2) << "ResourceTracker: growth to " << desired << " bytes exceeds limit "
                << memory_limit_bytes_;
        return false;
    }
    if (limiter_ && !limiter_(current, desired)) {
        grow_failures_.fetch_add(1, std::memory_order_relaxed);
        VLOG(2) << "ResourceTracker: limiter denied growth " << current << " -> " << desired;
        return false;
    }

    current_bytes_.store(desired, std::memory_order_relaxed);
    size_t peak = peak_bytes_.load(std::memory_order_relaxed);
    while (desired > peak &&
           !peak_bytes_.compare_exchange_weak(peak, desired, std::memory_order_relaxed)) {
    }
    return true;
}

void ResourceTracker::MemoryShrunk(size_t new_total) {
    current_bytes_.store(new_total, std::memory_order_relaxed);
}

} // namespace Sluice
