#ifndef SLUICE_EXTRACTION_ENGINE_H_
#define SLUICE_EXTRACTION_ENGINE_H_

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/clock.h"
#include "common/types.h"
#include "resource_tracker.h"

namespace Sluice {

/**
 * Per-call execution state handed to an engine.
 *
 * Outlives the caller when an epoch timeout abandons the call: the pool
 * keeps it alive until the engine returns.
 */
class ExecutionContext {
public:
    ExecutionContext(std::shared_ptr<ResourceTracker> tracker, TimePoint deadline)
        : tracker_(std::move(tracker)), deadline_(deadline) {}

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    void Interrupt() { interrupted_.store(true, std::memory_order_release); }
    bool interrupted() const { return interrupted_.load(std::memory_order_acquire); }

    TimePoint deadline() const { return deadline_; }
    ResourceTracker& tracker() { return *tracker_; }

    // Engines call this at safe points. kExtractionTimeout once interrupted.
    absl::Status CheckInterrupt() const;

    // Engines call this before growing to |desired_total| bytes.
    // kResourceLimitExceeded when the tracker refuses.
    absl::Status RequestMemory(size_t desired_total);

private:
    std::shared_ptr<ResourceTracker> tracker_;
    const TimePoint deadline_;
    std::atomic<bool> interrupted_{false};
};

/**
 * One sandboxed extraction engine. Called by at most one thread at a time,
 * except Interrupt(), which may arrive from the pool while Extract runs.
 */
class IExtractionEngine {
public:
    virtual ~IExtractionEngine() = default;

    virtual absl::StatusOr<ExtractedDocument> Extract(std::string_view content,
                                                      std::string_view url, Decision mode,
                                                      ExecutionContext& context) = 0;

    // Asks a running Extract to stop as soon as possible.
    virtual void Interrupt() {}
};

/**
 * Builds fresh engine instances. |tracker| accounts load-time allocations;
 * per-call growth goes through ExecutionContext.
 */
class IEngineLoader {
public:
    virtual ~IEngineLoader() = default;

    virtual absl::StatusOr<std::shared_ptr<IExtractionEngine>> Load(const std::string& engine_path,
                                                                     ResourceTracker& tracker) = 0;
};

} // namespace Sluice

#endif // SLUICE_EXTRACTION_ENGINE_H_
