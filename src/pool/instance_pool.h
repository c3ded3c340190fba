#ifndef SLUICE_INSTANCE_POOL_H_
#define SLUICE_INSTANCE_POOL_H_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "common/clock.h"
#include "common/event_bus.h"
#include "common/task_executor.h"
#include "extraction_engine.h"
#include "resource_tracker.h"

namespace Sluice {

struct PoolConfig {
    std::string name = "extraction_pool";
    size_t initial_size = 2;
    size_t max_size = 8;
    uint64_t max_uses_per_instance = 1000;
    uint64_t max_failures_per_instance = 5;
    size_t memory_limit_bytes = 256ull * 1024 * 1024;
    Duration epoch_timeout = std::chrono::seconds(10);
    Duration health_check_interval = std::chrono::seconds(30);

    // Longest Acquire() waits for an instance before reporting exhaustion.
    Duration acquire_wait_budget = std::chrono::seconds(5);
    uint64_t grow_failure_threshold = 10;
    Duration max_instance_age = std::chrono::hours(1);
    Duration max_idle_time = std::chrono::minutes(30);
    std::string engine_path = "engines/extractor.wasm";
    size_t executor_threads = 4;

    absl::Status Validate() const;
};

struct PooledInstance {
    std::string id;
    TimePoint created_at{};
    TimePoint last_used_at{};
    uint64_t use_count = 0;
    uint64_t failure_count = 0;
    size_t memory_usage_bytes = 0;
    std::shared_ptr<ResourceTracker> resource_tracker;
    std::shared_ptr<IExtractionEngine> engine;
    // Set after an epoch timeout; a retired instance never returns to idle.
    bool retired = false;
};

// Arena slot index plus the generation it was issued under.
struct InstanceHandle {
    uint32_t index = 0;
    uint32_t generation = 0;
};

struct PoolSnapshot {
    size_t idle = 0;
    size_t checked_out = 0;
    size_t creating = 0;
    size_t max_size = 0;
    uint64_t created_total = 0;
    uint64_t retired_total = 0;
    uint64_t exhausted_total = 0;
    uint64_t creation_failures = 0;
    uint64_t epoch_timeouts = 0;

    // Bodies run through RunWithEpochTimeout; timeouts count as failed.
    uint64_t total_extractions = 0;
    uint64_t successful_extractions = 0;
    uint64_t failed_extractions = 0;
    double avg_processing_time_ms = 0.0;
    // Time successful Acquire calls spent before obtaining an instance or a
    // slot to create one in.
    uint64_t acquisitions = 0;
    double avg_acquire_wait_ms = 0.0;
};

class ExtractionInstancePool;

/**
 * Exclusive ownership of one pooled instance for the checkout's lifetime.
 * Destroying a still-held instance releases it back to the pool.
 */
class CheckedOutInstance {
public:
    CheckedOutInstance() = default;
    ~CheckedOutInstance();

    CheckedOutInstance(CheckedOutInstance&& other) noexcept;
    CheckedOutInstance& operator=(CheckedOutInstance&& other) noexcept;

    CheckedOutInstance(const CheckedOutInstance&) = delete;
    CheckedOutInstance& operator=(const CheckedOutInstance&) = delete;

    bool valid() const { return pool_ != nullptr; }
    InstanceHandle handle() const { return handle_; }

    PooledInstance& instance() { return instance_; }
    const PooledInstance& instance() const { return instance_; }
    PooledInstance* operator->() { return &instance_; }
    const PooledInstance* operator->() const { return &instance_; }

private:
    friend class ExtractionInstancePool;

    CheckedOutInstance(ExtractionInstancePool* pool, InstanceHandle handle,
                       PooledInstance instance)
        : pool_(pool), handle_(handle), instance_(std::move(instance)) {}

    ExtractionInstancePool* pool_ = nullptr;
    InstanceHandle handle_;
    PooledInstance instance_;
};

/**
 * Bounded pool of sandboxed extraction engines.
 *
 * Instances live in an arena of max_size slots. Only the idle list and the
 * size counters are shared; a checked-out instance is moved into its
 * CheckedOutInstance and mutated by that owner alone.
 * Invariant: idle + checked_out + creating <= max_size.
 *
 * Engine bodies and asynchronous replacements run on an internal
 * TaskExecutor. All CheckedOutInstances must be released before the pool
 * is destroyed.
 */
class ExtractionInstancePool {
public:
    using Body = std::function<absl::StatusOr<ExtractedDocument>(IExtractionEngine&,
                                                                 ExecutionContext&)>;

    /**
     * Validate |config| and warm initial_size instances.
     * @param loader Builds engines; a load error aborts creation
     * @param limiter Consulted before every engine memory growth (may be empty)
     * @param sink Receives pool health events (may be null)
     * @return The pool, or kInvalidConfig / kPoolCreationFailed
     */
    static absl::StatusOr<std::unique_ptr<ExtractionInstancePool>> Create(
        PoolConfig config, std::shared_ptr<IEngineLoader> loader,
        ResourceLimiter limiter = nullptr, std::shared_ptr<Clock> clock = DefaultClock(),
        std::shared_ptr<IEventSink> sink = nullptr);

    ~ExtractionInstancePool();

    ExtractionInstancePool(const ExtractionInstancePool&) = delete;
    ExtractionInstancePool& operator=(const ExtractionInstancePool&) = delete;

    /**
     * Check out a healthy instance, creating one if there is room.
     * @param deadline Caller deadline; bounds the wait together with
     *        acquire_wait_budget
     * @return kPoolExhausted when the wait budget elapsed, kDeadlineExpired
     *         when the caller deadline did (nothing is charged), or
     *         kPoolCreationFailed when a new engine failed to load
     */
    absl::StatusOr<CheckedOutInstance> Acquire(std::optional<TimePoint> deadline = std::nullopt);

    /**
     * Return an instance. Healthy ones go back to idle; others are destroyed
     * and replaced asynchronously.
     */
    void Release(CheckedOutInstance instance);

    static bool IsHealthy(const PooledInstance& instance, const PoolConfig& config);

    // Stamp last use, count the call and refresh memory from the tracker.
    void RecordUsage(CheckedOutInstance& instance, bool success);

    /**
     * Run |body| against the instance's engine on a worker thread, bounded by
     * min(deadline, now + epoch_timeout). On expiry the engine is interrupted,
     * the instance is marked retired and kExtractionTimeout is returned; the
     * abandoned body keeps the engine alive until it finishes. Returns
     * kDeadlineExpired without running anything when |deadline| has already
     * passed.
     */
    absl::StatusOr<ExtractedDocument> RunWithEpochTimeout(CheckedOutInstance& instance,
                                                          TimePoint deadline, Body body);

    /**
     * Sample memory of idle instances and emit kMemoryCleanup.
     * Evicts nothing.
     * @return Total sampled bytes
     */
    size_t TriggerMemoryCleanup();

    /**
     * Retire up to |count| idle instances and replace them synchronously.
     * @return Number of instances replaced
     */
    size_t ClearSome(size_t count);

    /**
     * Retire idle instances above 80% of memory_limit_bytes and replace them
     * asynchronously.
     * @return Number of instances retired
     */
    size_t ClearHighMemoryInstances();

    /**
     * One health sweep over idle instances: retire unhealthy, older than
     * max_instance_age or idle longer than max_idle_time, then replace.
     * @return Number of instances retired
     */
    size_t RunHealthCheck();

    // Background RunHealthCheck every health_check_interval.
    void StartHealthMonitor();
    void StopHealthMonitor();

    // Blocks until at least |count| instances are idle or |timeout| passes.
    bool WaitForIdle(size_t count, absl::Duration timeout);

    PoolSnapshot Snapshot() const;
    const PoolConfig& config() const { return config_; }

private:
    enum class SlotState : uint8_t { kFree, kCreating, kIdle, kCheckedOut };

    struct Slot {
        SlotState state = SlotState::kFree;
        uint32_t generation = 0;
        std::optional<PooledInstance> instance;
    };

    ExtractionInstancePool(PoolConfig config, std::shared_ptr<IEngineLoader> loader,
                           ResourceLimiter limiter, std::shared_ptr<Clock> clock,
                           std::shared_ptr<IEventSink> sink);

    absl::StatusOr<PooledInstance> CreateInstance();

    size_t TotalLocked() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
        return idle_.size() + checked_out_ + creating_;
    }
    bool HasCapacityLocked() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
        return !idle_.empty() || TotalLocked() < config_.max_size;
    }

    // Reserve a free slot for a new instance; nullopt when the pool is full.
    std::optional<uint32_t> ReserveSlotLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
    // Take the instance out of an idle slot and free the slot.
    PooledInstance EvictIdleLocked(uint32_t index) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
    // Fill a reserved slot, or roll the reservation back on failure.
    void CompleteCreationLocked(uint32_t index, absl::StatusOr<PooledInstance>& created,
                                bool to_idle) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

    // Retire idle instances matching |should_retire| and replace them.
    size_t RetireIdleWhere(const std::function<bool(const PooledInstance&)>& should_retire,
                           const std::string& reason);

    struct IdleWait {
        const ExtractionInstancePool* pool;
        size_t count;
    };
    static bool IdleReached(IdleWait* wait);

    void RecordExtraction(bool success, Duration elapsed);
    void SpawnReplacement();
    HealthEvent MakeEvent(EventType type, const std::string& instance_id = "") const;
    void Emit(const std::vector<HealthEvent>& events);
    void HealthMonitorThread();

    const PoolConfig config_;
    const std::shared_ptr<IEngineLoader> loader_;
    const ResourceLimiter limiter_;
    const std::shared_ptr<Clock> clock_;
    const std::shared_ptr<IEventSink> sink_;
    std::atomic<uint64_t> next_instance_id_{0};

    mutable absl::Mutex mutex_;
    std::vector<Slot> slots_ ABSL_GUARDED_BY(mutex_);
    std::deque<uint32_t> idle_ ABSL_GUARDED_BY(mutex_);
    size_t checked_out_ ABSL_GUARDED_BY(mutex_) = 0;
    size_t creating_ ABSL_GUARDED_BY(mutex_) = 0;

    uint64_t created_total_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t retired_total_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t exhausted_total_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t creation_failures_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t epoch_timeouts_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t successful_extractions_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t failed_extractions_ ABSL_GUARDED_BY(mutex_) = 0;
    Duration total_processing_time_ ABSL_GUARDED_BY(mutex_) = Duration::zero();
    uint64_t acquisitions_ ABSL_GUARDED_BY(mutex_) = 0;
    Duration total_acquire_wait_ ABSL_GUARDED_BY(mutex_) = Duration::zero();

    absl::Mutex monitor_mutex_;
    bool monitor_stop_ ABSL_GUARDED_BY(monitor_mutex_) = false;
    std::thread monitor_thread_;

    // Declared last so it is destroyed first, while the state above is live.
    std::unique_ptr<TaskExecutor> executor_;
};

} // namespace Sluice

#endif // SLUICE_INSTANCE_POOL_H_
