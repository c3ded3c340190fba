#ifndef SLUICE_RESOURCE_TRACKER_H_
#define SLUICE_RESOURCE_TRACKER_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace Sluice {

/**
 * External allow/deny hook consulted before every memory growth of an
 * engine instance. Arguments are the current and the requested total size.
 */
using ResourceLimiter = std::function<bool(size_t current, size_t desired)>;

/**
 * Per-instance memory accounting.
 *
 * Engines report growth through MemoryGrowing() before expanding. A request
 * beyond the ceiling, or one the limiter denies, is refused and counted in
 * grow_failures; the pool retires instances that keep getting refused.
 * Safe to call from the worker running the engine while the pool samples.
 */
class ResourceTracker {
public:
    ResourceTracker(size_t memory_limit_bytes, ResourceLimiter limiter = nullptr);

    ResourceTracker(const ResourceTracker&) = delete;
    ResourceTracker& operator=(const ResourceTracker&) = delete;

    // True when growth from |current| to |desired| total bytes is allowed.
    bool MemoryGrowing(size_t current, size_t desired);

    // Engine gave memory back; |new_total| is the size after shrinking.
    void MemoryShrunk(size_t new_total);

    size_t CurrentBytes() const { return current_bytes_.load(std::memory_order_relaxed); }
    size_t PeakBytes() const { return peak_bytes_.load(std::memory_order_relaxed); }
    uint64_t GrowFailures() const { return grow_failures_.load(std::memory_order_relaxed); }
    size_t MemoryLimit() const { return memory_limit_bytes_; }

private:
    const size_t memory_limit_bytes_;
    const ResourceLimiter limiter_;

    std::atomic<size_t> current_bytes_{0};
    std::atomic<size_t> peak_bytes_{0};
    std::atomic<uint64_t> grow_failures_{0};
};

} // namespace Sluice

#endif // SLUICE_RESOURCE_TRACKER_H_
