#include "instance_pool.h"

#include <algorithm>
#include <exception>
#include <future>
#include <limits>
#include <utility>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace Sluice {

absl::Status PoolConfig::Validate() const {
    if (max_size < 1 || max_size > std::numeric_limits<uint32_t>::max()) {
        return MakeError(ErrorKind::kInvalidConfig,
                         absl::StrCat("pool max_size must be at least 1, got ", max_size));
    }
    if (initial_size > max_size) {
        return MakeError(ErrorKind::kInvalidConfig,
                         absl::StrCat("pool initial_size ", initial_size, " exceeds max_size ",
                                      max_size));
    }
    if (max_uses_per_instance < 1 || max_failures_per_instance < 1) {
        return MakeError(ErrorKind::kInvalidConfig,
                         "pool max_uses_per_instance and max_failures_per_instance must be >= 1");
    }
    if (memory_limit_bytes == 0) {
        return MakeError(ErrorKind::kInvalidConfig, "pool memory_limit_bytes must be positive");
    }
    if (epoch_timeout <= Duration::zero()) {
        return MakeError(ErrorKind::kInvalidConfig, "pool epoch_timeout must be positive");
    }
    if (health_check_interval <= Duration::zero()) {
        return MakeError(ErrorKind::kInvalidConfig, "pool health_check_interval must be positive");
    }
    if (acquire_wait_budget < Duration::zero()) {
        return MakeError(ErrorKind::kInvalidConfig, "pool acquire_wait_budget must not be negative");
    }
    if (grow_failure_threshold < 1) {
        return MakeError(ErrorKind::kInvalidConfig, "pool grow_failure_threshold must be >= 1");
    }
    if (executor_threads < 1) {
        return MakeError(ErrorKind::kInvalidConfig, "pool executor_threads must be >= 1");
    }
    return absl::OkStatus();
}

//----------------------------------------------------------------------------
// CheckedOutInstance
//----------------------------------------------------------------------------

CheckedOutInstance::~CheckedOutInstance() {
    if (pool_ != nullptr) {
        pool_->Release(std::move(*this));
    }
}

CheckedOutInstance::CheckedOutInstance(CheckedOutInstance&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)),
      handle_(other.handle_),
      instance_(std::move(other.instance_)) {}

CheckedOutInstance& CheckedOutInstance::operator=(CheckedOutInstance&& other) noexcept {
    if (this != &other) {
        if (pool_ != nullptr) {
            pool_->Release(std::move(*this));
        }
        pool_ = std::exchange(other.pool_, nullptr);
        handle_ = other.handle_;
        instance_ = std::move(other.instance_);
    }
    return *this;
}

//----------------------------------------------------------------------------
// ExtractionInstancePool
//----------------------------------------------------------------------------

absl::StatusOr<std::unique_ptr<ExtractionInstancePool>> ExtractionInstancePool::Create(
    PoolConfig config, std::shared_ptr<IEngineLoader> loader, ResourceLimiter limiter,
    std::shared_ptr<Clock> clock, std::shared_ptr<IEventSink> sink) {
    absl::Status status = config.Validate();
    if (!status.ok()) {
        return status;
    }
    if (loader == nullptr || clock == nullptr) {
        return MakeError(ErrorKind::kInvalidConfig, "pool requires an engine loader and a clock");
    }

    std::unique_ptr<ExtractionInstancePool> pool(new ExtractionInstancePool(
        std::move(config), std::move(loader), std::move(limiter), std::move(clock),
        std::move(sink)));

    const PoolConfig& cfg = pool->config_;
    for (size_t i = 0; i < cfg.initial_size; ++i) {
        std::optional<uint32_t> index;
        {
            absl::MutexLock lock(&pool->mutex_);
            index = pool->ReserveSlotLocked();
        }
        absl::StatusOr<PooledInstance> created = pool->CreateInstance();
        std::string id = created.ok() ? created->id : std::string();
        {
            absl::MutexLock lock(&pool->mutex_);
            pool->CompleteCreationLocked(*index, created, true);
        }
        if (!created.ok()) {
            LOG(ERROR) << "ExtractionInstancePool " << cfg.name << ": warm-up failed at instance "
                       << i << ": " << created.status();
            return created.status();
        }
        pool->Emit({pool->MakeEvent(EventType::kInstanceCreated, id).With("reason", "warm_up")});
    }

    LOG(INFO) << "ExtractionInstancePool " << cfg.name << " ready: " << cfg.initial_size << "/"
              << cfg.max_size << " instances, engine=" << cfg.engine_path;
    return pool;
}

ExtractionInstancePool::ExtractionInstancePool(PoolConfig config,
                                               std::shared_ptr<IEngineLoader> loader,
                                               ResourceLimiter limiter,
                                               std::shared_ptr<Clock> clock,
                                               std::shared_ptr<IEventSink> sink)
    : config_(std::move(config)),
      loader_(std::move(loader)),
      limiter_(std::move(limiter)),
      clock_(std::move(clock)),
      sink_(std::move(sink)),
      slots_(config_.max_size),
      executor_(std::make_unique<TaskExecutor>(config_.executor_threads, 1024,
                                               config_.name + "-exec")) {}

ExtractionInstancePool::~ExtractionInstancePool() {
    StopHealthMonitor();
    // Drains pending replacements and abandoned bodies while the pool is intact.
    executor_->Stop();

    absl::MutexLock lock(&mutex_);
    if (checked_out_ > 0) {
        LOG(WARNING) << "ExtractionInstancePool " << config_.name << " destroyed with "
                     << checked_out_ << " instances still checked out";
    }
}

absl::StatusOr<PooledInstance> ExtractionInstancePool::CreateInstance() {
    auto tracker = std::make_shared<ResourceTracker>(config_.memory_limit_bytes, limiter_);

    absl::StatusOr<std::shared_ptr<IExtractionEngine>> engine;
    try {
        engine = loader_->Load(config_.engine_path, *tracker);
    } catch (const std::exception& e) {
        engine = absl::InternalError(e.what());
    }
    if (!engine.ok()) {
        return MakeError(ErrorKind::kPoolCreationFailed,
                         absl::StrCat("loading ", config_.engine_path,
                                      " failed: ", engine.status().message()));
    }
    if (*engine == nullptr) {
        return MakeError(ErrorKind::kPoolCreationFailed,
                         absl::StrCat("loader returned no engine for ", config_.engine_path));
    }

    PooledInstance instance;
    instance.id = absl::StrCat(config_.name, "-",
                               next_instance_id_.fetch_add(1, std::memory_order_relaxed) + 1);
    instance.created_at = clock_->Now();
    instance.last_used_at = instance.created_at;
    instance.memory_usage_bytes = tracker->CurrentBytes();
    instance.resource_tracker = std::move(tracker);
    instance.engine = std::move(*engine);
    VLOG(2) << "ExtractionInstancePool " << config_.name << ": created " << instance.id;
    return instance;
}

std::optional<uint32_t> ExtractionInstancePool::ReserveSlotLocked() {
    if (TotalLocked() >= config_.max_size) {
        return std::nullopt;
    }
    for (uint32_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].state == SlotState::kFree) {
            slots_[i].state = SlotState::kCreating;
            ++creating_;
            return i;
        }
    }
    LOG(ERROR) << "ExtractionInstancePool " << config_.name
               << ": size accounting says room but no free slot";
    return std::nullopt;
}

PooledInstance ExtractionInstancePool::EvictIdleLocked(uint32_t index) {
    Slot& slot = slots_[index];
    PooledInstance instance = std::move(*slot.instance);
    slot.instance.reset();
    slot.state = SlotState::kFree;
    ++slot.generation;
    ++retired_total_;
    return instance;
}

void ExtractionInstancePool::CompleteCreationLocked(uint32_t index,
                                                    absl::StatusOr<PooledInstance>& created,
                                                    bool to_idle) {
    Slot& slot = slots_[index];
    --creating_;
    if (!created.ok()) {
        slot.state = SlotState::kFree;
        ++creation_failures_;
        return;
    }
    ++created_total_;
    if (to_idle) {
        slot.instance = std::move(*created);
        slot.state = SlotState::kIdle;
        idle_.push_back(index);
    } else {
        slot.state = SlotState::kCheckedOut;
        ++checked_out_;
    }
}

absl::StatusOr<CheckedOutInstance> ExtractionInstancePool::Acquire(
    std::optional<TimePoint> deadline) {
    const TimePoint started = clock_->Now();
    const TimePoint budget_end = started + config_.acquire_wait_budget;
    const bool deadline_binds = deadline.has_value() && *deadline < budget_end;
    const TimePoint wait_end = deadline_binds ? *deadline : budget_end;

    std::vector<HealthEvent> events;
    std::vector<PooledInstance> discarded;
    std::optional<CheckedOutInstance> checkout;
    std::optional<uint32_t> reserved;
    absl::Status failure;
    {
        absl::MutexLock lock(&mutex_);
        bool waited_out = false;
        while (true) {
            if (deadline.has_value() && clock_->Now() >= *deadline) {
                failure = MakeError(ErrorKind::kDeadlineExpired,
                                    "deadline expired while waiting for an instance");
                break;
            }

            while (!idle_.empty()) {
                const uint32_t index = idle_.front();
                idle_.pop_front();
                Slot& slot = slots_[index];
                if (IsHealthy(*slot.instance, config_)) {
                    slot.state = SlotState::kCheckedOut;
                    ++checked_out_;
                    PooledInstance instance = std::move(*slot.instance);
                    slot.instance.reset();
                    checkout.emplace(CheckedOutInstance(this, InstanceHandle{index, slot.generation},
                                                        std::move(instance)));
                    break;
                }
                discarded.push_back(EvictIdleLocked(index));
                events.push_back(MakeEvent(EventType::kInstanceRetired, discarded.back().id)
                                     .With("reason", "unhealthy_on_acquire"));
            }
            if (checkout.has_value()) {
                ++acquisitions_;
                total_acquire_wait_ += clock_->Now() - started;
                break;
            }

            reserved = ReserveSlotLocked();
            if (reserved.has_value()) {
                ++acquisitions_;
                total_acquire_wait_ += clock_->Now() - started;
                break;
            }

            const TimePoint now = clock_->Now();
            if (waited_out || now >= wait_end) {
                if (deadline_binds) {
                    failure = MakeError(ErrorKind::kDeadlineExpired,
                                        "deadline expired while waiting for an instance");
                } else {
                    ++exhausted_total_;
                    events.push_back(MakeEvent(EventType::kPoolExhausted)
                                         .With("max_size", absl::StrCat(config_.max_size)));
                    failure = MakeError(ErrorKind::kPoolExhausted,
                                        absl::StrCat("no instance available within ",
                                                     ToMillis(config_.acquire_wait_budget),
                                                     "ms (max_size ", config_.max_size, ")"));
                }
                break;
            }

            VLOG(3) << "ExtractionInstancePool " << config_.name << ": waiting for capacity";
            if (!mutex_.AwaitWithTimeout(
                    absl::Condition(this, &ExtractionInstancePool::HasCapacityLocked),
                    absl::FromChrono(wait_end - now))) {
                waited_out = true;
            }
        }
    }

    Emit(events);
    discarded.clear();

    if (!failure.ok()) {
        VLOG(2) << "ExtractionInstancePool " << config_.name << ": acquire failed: " << failure;
        return failure;
    }
    if (checkout.has_value()) {
        return std::move(*checkout);
    }

    absl::StatusOr<PooledInstance> created = CreateInstance();
    uint32_t generation = 0;
    {
        absl::MutexLock lock(&mutex_);
        CompleteCreationLocked(*reserved, created, false);
        generation = slots_[*reserved].generation;
    }
    if (!created.ok()) {
        LOG(WARNING) << "ExtractionInstancePool " << config_.name
                     << ": instance creation failed: " << created.status();
        return created.status();
    }
    Emit({MakeEvent(EventType::kInstanceCreated, created->id).With("reason", "on_demand")});
    return CheckedOutInstance(this, InstanceHandle{*reserved, generation}, std::move(*created));
}

void ExtractionInstancePool::Release(CheckedOutInstance instance) {
    if (instance.pool_ != this) {
        LOG(ERROR) << "ExtractionInstancePool " << config_.name
                   << ": release of an instance not checked out from this pool";
        return;
    }
    instance.pool_ = nullptr;

    PooledInstance pooled = std::move(instance.instance_);
    const InstanceHandle handle = instance.handle_;
    const bool healthy = !pooled.retired && IsHealthy(pooled, config_);
    std::string reason;
    if (!healthy) {
        reason = pooled.retired ? "epoch_timeout" : "unhealthy";
    }

    {
        absl::MutexLock lock(&mutex_);
        if (handle.index >= slots_.size() ||
            slots_[handle.index].state != SlotState::kCheckedOut ||
            slots_[handle.index].generation != handle.generation) {
            LOG(ERROR) << "ExtractionInstancePool " << config_.name << ": stale handle "
                       << handle.index << "/" << handle.generation << " released";
            return;
        }
        Slot& slot = slots_[handle.index];
        --checked_out_;
        if (healthy) {
            slot.instance = std::move(pooled);
            slot.state = SlotState::kIdle;
            idle_.push_back(handle.index);
            return;
        }
        slot.state = SlotState::kFree;
        ++slot.generation;
        ++retired_total_;
    }

    LOG(INFO) << "ExtractionInstancePool " << config_.name << ": retiring " << pooled.id
              << " (" << reason << ", uses=" << pooled.use_count
              << ", failures=" << pooled.failure_count << ")";
    Emit({MakeEvent(EventType::kInstanceRetired, pooled.id).With("reason", reason)});
    SpawnReplacement();
}

bool ExtractionInstancePool::IsHealthy(const PooledInstance& instance, const PoolConfig& config) {
    const uint64_t grow_failures =
        instance.resource_tracker ? instance.resource_tracker->GrowFailures() : 0;
    return instance.use_count < config.max_uses_per_instance &&
           instance.failure_count < config.max_failures_per_instance &&
           instance.memory_usage_bytes < config.memory_limit_bytes &&
           grow_failures < config.grow_failure_threshold;
}

void ExtractionInstancePool::RecordUsage(CheckedOutInstance& instance, bool success) {
    PooledInstance& pooled = instance.instance();
    pooled.last_used_at = clock_->Now();
    ++pooled.use_count;
    if (!success) {
        ++pooled.failure_count;
    }
    if (pooled.resource_tracker) {
        pooled.memory_usage_bytes = pooled.resource_tracker->CurrentBytes();
    }
}

absl::StatusOr<ExtractedDocument> ExtractionInstancePool::RunWithEpochTimeout(
    CheckedOutInstance& instance, TimePoint deadline, Body body) {
    if (!instance.valid() || instance->engine == nullptr) {
        return MakeError(ErrorKind::kEngineError, "no checked-out engine to run on");
    }

    const TimePoint now = clock_->Now();
    const TimePoint epoch_deadline = std::min(deadline, now + config_.epoch_timeout);
    if (epoch_deadline <= now) {
        // Only the caller deadline can be behind us; the engine never ran.
        return MakeError(ErrorKind::kDeadlineExpired,
                         absl::StrCat("deadline passed before ", instance->id, " could run"));
    }

    auto context = std::make_shared<ExecutionContext>(instance->resource_tracker, epoch_deadline);
    std::shared_ptr<IExtractionEngine> engine = instance->engine;
    auto future = executor_->Submit([engine, context, body = std::move(body)]() {
        return body(*engine, *context);
    });

    if (future.wait_for(epoch_deadline - now) == std::future_status::timeout) {
        context->Interrupt();
        engine->Interrupt();
        instance->retired = true;
        {
            absl::MutexLock lock(&mutex_);
            ++epoch_timeouts_;
        }
        RecordExtraction(false, epoch_deadline - now);
        LOG(WARNING) << "ExtractionInstancePool " << config_.name << ": " << instance->id
                     << " exceeded epoch of " << ToMillis(epoch_deadline - now)
                     << "ms, interrupted and retired";
        return MakeError(ErrorKind::kExtractionTimeout,
                         absl::StrCat("extraction on ", instance->id, " exceeded ",
                                      ToMillis(epoch_deadline - now), "ms"));
    }

    absl::StatusOr<ExtractedDocument> result;
    try {
        result = future.get();
    } catch (const std::future_error& e) {
        result = MakeError(ErrorKind::kEngineError,
                           absl::StrCat("extraction task was not run: ", e.what()));
    } catch (const std::exception& e) {
        result = MakeError(ErrorKind::kEngineError, absl::StrCat("engine threw: ", e.what()));
    }
    RecordExtraction(result.ok(), clock_->Now() - now);
    return result;
}

void ExtractionInstancePool::RecordExtraction(bool success, Duration elapsed) {
    absl::MutexLock lock(&mutex_);
    if (success) {
        ++successful_extractions_;
    } else {
        ++failed_extractions_;
    }
    if (elapsed > Duration::zero()) {
        total_processing_time_ += elapsed;
    }
}

size_t ExtractionInstancePool::TriggerMemoryCleanup() {
    const size_t high_water = config_.memory_limit_bytes / 10 * 8;
    size_t total_bytes = 0;
    size_t high_memory = 0;
    size_t sampled = 0;
    {
        absl::MutexLock lock(&mutex_);
        for (uint32_t index : idle_) {
            PooledInstance& instance = *slots_[index].instance;
            if (instance.resource_tracker) {
                instance.memory_usage_bytes = instance.resource_tracker->CurrentBytes();
            }
            total_bytes += instance.memory_usage_bytes;
            if (instance.memory_usage_bytes > high_water) {
                ++high_memory;
            }
        }
        sampled = idle_.size();
    }

    VLOG(1) << "ExtractionInstancePool " << config_.name << ": memory sample " << total_bytes
            << " bytes over " << sampled << " idle instances (" << high_memory << " high)";
    Emit({MakeEvent(EventType::kMemoryCleanup)
              .With("total_bytes", absl::StrCat(total_bytes))
              .With("idle_instances", absl::StrCat(sampled))
              .With("high_memory_instances", absl::StrCat(high_memory))});
    return total_bytes;
}

size_t ExtractionInstancePool::RetireIdleWhere(
    const std::function<bool(const PooledInstance&)>& should_retire, const std::string& reason) {
    std::vector<PooledInstance> retired;
    std::vector<HealthEvent> events;
    {
        absl::MutexLock lock(&mutex_);
        for (auto it = idle_.begin(); it != idle_.end();) {
            const uint32_t index = *it;
            if (should_retire(*slots_[index].instance)) {
                it = idle_.erase(it);
                retired.push_back(EvictIdleLocked(index));
                events.push_back(MakeEvent(EventType::kInstanceRetired, retired.back().id)
                                     .With("reason", reason));
            } else {
                ++it;
            }
        }
    }

    Emit(events);
    const size_t count = retired.size();
    retired.clear();
    for (size_t i = 0; i < count; ++i) {
        SpawnReplacement();
    }
    if (count > 0) {
        LOG(INFO) << "ExtractionInstancePool " << config_.name << ": retired " << count
                  << " idle instances (" << reason << ")";
    }
    return count;
}

size_t ExtractionInstancePool::ClearSome(size_t count) {
    std::vector<PooledInstance> retired;
    std::vector<uint32_t> reserved;
    std::vector<HealthEvent> events;
    {
        absl::MutexLock lock(&mutex_);
        while (retired.size() < count && !idle_.empty()) {
            const uint32_t index = idle_.front();
            idle_.pop_front();
            retired.push_back(EvictIdleLocked(index));
            events.push_back(MakeEvent(EventType::kInstanceRetired, retired.back().id)
                                 .With("reason", "rebalance"));
        }
        for (size_t i = 0; i < retired.size(); ++i) {
            std::optional<uint32_t> index = ReserveSlotLocked();
            if (!index.has_value()) {
                break;
            }
            reserved.push_back(*index);
        }
    }
    Emit(events);
    const size_t cleared = retired.size();
    retired.clear();

    size_t replaced = 0;
    for (uint32_t index : reserved) {
        absl::StatusOr<PooledInstance> created = CreateInstance();
        std::string id = created.ok() ? created->id : std::string();
        {
            absl::MutexLock lock(&mutex_);
            CompleteCreationLocked(index, created, true);
        }
        if (!created.ok()) {
            LOG(WARNING) << "ExtractionInstancePool " << config_.name
                         << ": replacement during rebalance failed: " << created.status();
            continue;
        }
        ++replaced;
        Emit({MakeEvent(EventType::kInstanceCreated, id).With("reason", "rebalance")});
    }

    LOG(INFO) << "ExtractionInstancePool " << config_.name << ": cleared " << cleared
              << " idle instances, replaced " << replaced;
    return replaced;
}

size_t ExtractionInstancePool::ClearHighMemoryInstances() {
    const size_t high_water = config_.memory_limit_bytes / 10 * 8;
    return RetireIdleWhere(
        [high_water](const PooledInstance& instance) {
            const size_t bytes = instance.resource_tracker
                                     ? instance.resource_tracker->CurrentBytes()
                                     : instance.memory_usage_bytes;
            return bytes > high_water;
        },
        "high_memory");
}

size_t ExtractionInstancePool::RunHealthCheck() {
    const TimePoint now = clock_->Now();
    const PoolConfig& config = config_;
    const size_t retired = RetireIdleWhere(
        [now, &config](const PooledInstance& instance) {
            return !IsHealthy(instance, config) ||
                   now - instance.created_at > config.max_instance_age ||
                   now - instance.last_used_at > config.max_idle_time;
        },
        "health_check");

    const PoolSnapshot snapshot = Snapshot();
    VLOG(1) << "ExtractionInstancePool " << config_.name << ": health check retired " << retired
            << ", idle=" << snapshot.idle << ", checked_out=" << snapshot.checked_out;
    Emit({MakeEvent(EventType::kPoolHealthCheck)
              .With("retired", absl::StrCat(retired))
              .With("idle", absl::StrCat(snapshot.idle))
              .With("checked_out", absl::StrCat(snapshot.checked_out))});
    return retired;
}

void ExtractionInstancePool::SpawnReplacement() {
    if (!executor_->IsRunning()) {
        return;
    }
    std::optional<uint32_t> index;
    {
        absl::MutexLock lock(&mutex_);
        index = ReserveSlotLocked();
    }
    if (!index.has_value()) {
        return;
    }

    executor_->Submit([this, slot = *index]() {
        absl::StatusOr<PooledInstance> created = CreateInstance();
        std::string id = created.ok() ? created->id : std::string();
        {
            absl::MutexLock lock(&mutex_);
            CompleteCreationLocked(slot, created, true);
        }
        if (!created.ok()) {
            LOG(WARNING) << "ExtractionInstancePool " << config_.name
                         << ": replacement failed: " << created.status();
            return;
        }
        Emit({MakeEvent(EventType::kInstanceCreated, id).With("reason", "replacement")});
    });
}

void ExtractionInstancePool::StartHealthMonitor() {
    absl::MutexLock lock(&monitor_mutex_);
    if (monitor_thread_.joinable()) {
        return;
    }
    monitor_stop_ = false;
    monitor_thread_ = std::thread(&ExtractionInstancePool::HealthMonitorThread, this);
    LOG(INFO) << "ExtractionInstancePool " << config_.name << ": health monitor every "
              << ToMillis(config_.health_check_interval) << "ms";
}

void ExtractionInstancePool::StopHealthMonitor() {
    std::thread monitor;
    {
        absl::MutexLock lock(&monitor_mutex_);
        monitor_stop_ = true;
        monitor = std::move(monitor_thread_);
    }
    if (monitor.joinable()) {
        monitor.join();
    }
}

void ExtractionInstancePool::HealthMonitorThread() {
    const absl::Duration interval = absl::FromChrono(config_.health_check_interval);
    while (true) {
        {
            absl::MutexLock lock(&monitor_mutex_);
            if (monitor_mutex_.AwaitWithTimeout(absl::Condition(&monitor_stop_), interval)) {
                return;
            }
        }
        RunHealthCheck();
    }
}

bool ExtractionInstancePool::IdleReached(IdleWait* wait) ABSL_NO_THREAD_SAFETY_ANALYSIS {
    return wait->pool->idle_.size() >= wait->count;
}

bool ExtractionInstancePool::WaitForIdle(size_t count, absl::Duration timeout) {
    IdleWait wait{this, count};
    absl::MutexLock lock(&mutex_);
    return mutex_.AwaitWithTimeout(absl::Condition(&IdleReached, &wait), timeout);
}

PoolSnapshot ExtractionInstancePool::Snapshot() const {
    absl::MutexLock lock(&mutex_);
    PoolSnapshot snapshot;
    snapshot.idle = idle_.size();
    snapshot.checked_out = checked_out_;
    snapshot.creating = creating_;
    snapshot.max_size = config_.max_size;
    snapshot.created_total = created_total_;
    snapshot.retired_total = retired_total_;
    snapshot.exhausted_total = exhausted_total_;
    snapshot.creation_failures = creation_failures_;
    snapshot.epoch_timeouts = epoch_timeouts_;
    snapshot.successful_extractions = successful_extractions_;
    snapshot.failed_extractions = failed_extractions_;
    snapshot.total_extractions = successful_extractions_ + failed_extractions_;
    if (snapshot.total_extractions > 0) {
        snapshot.avg_processing_time_ms =
            std::chrono::duration<double, std::milli>(total_processing_time_).count() /
            static_cast<double>(snapshot.total_extractions);
    }
    snapshot.acquisitions = acquisitions_;
    if (acquisitions_ > 0) {
        snapshot.avg_acquire_wait_ms =
            std::chrono::duration<double, std::milli>(total_acquire_wait_).count() /
            static_cast<double>(acquisitions_);
    }
    return snapshot;
}

HealthEvent ExtractionInstancePool::MakeEvent(EventType type, const std::string& instance_id) const {
    HealthEvent event;
    event.type = type;
    event.source = config_.name;
    event.instance_id = instance_id;
    event.at = clock_->Now();
    return event;
}

void ExtractionInstancePool::Emit(const std::vector<HealthEvent>& events) {
    for (const HealthEvent& event : events) {
        NotifyBestEffort(sink_.get(), event);
    }
}

} // namespace Sluice
