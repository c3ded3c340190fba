#include "monitored_circuit_breaker.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace Sluice {

absl::StatusOr<std::shared_ptr<MonitoredCircuitBreaker>> MonitoredCircuitBreaker::Create(
    std::string name, CircuitBreakerConfig config, std::shared_ptr<Clock> clock,
    std::shared_ptr<IEventSink> sink) {
    absl::Status status = config.Validate();
    if (!status.ok()) {
        return status;
    }
    if (clock == nullptr) {
        return MakeError(ErrorKind::kInvalidConfig, "circuit breaker requires a clock");
    }
    return std::shared_ptr<MonitoredCircuitBreaker>(new MonitoredCircuitBreaker(
        std::move(name), config, std::move(clock), std::move(sink)));
}

MonitoredCircuitBreaker::MonitoredCircuitBreaker(std::string name, CircuitBreakerConfig config,
                                                 std::shared_ptr<Clock> clock,
                                                 std::shared_ptr<IEventSink> sink)
    : name_(std::move(name)),
      config_(config),
      clock_(std::move(clock)),
      sink_(std::move(sink)),
      state_(CircuitClosed{}) {}

HealthEvent MonitoredCircuitBreaker::MakeEvent(EventType type) const {
    HealthEvent event;
    event.type = type;
    event.source = name_;
    event.at = clock_->Now();
    return event;
}

void MonitoredCircuitBreaker::Emit(const std::optional<HealthEvent>& event) {
    if (event.has_value()) {
        NotifyBestEffort(sink_.get(), *event);
    }
}

absl::StatusOr<Permit> MonitoredCircuitBreaker::TryAcquire() {
    std::optional<HealthEvent> event;
    absl::StatusOr<Permit> result;
    {
        absl::MutexLock lock(&mutex_);
        const TimePoint now = clock_->Now();

        if (auto* open = std::get_if<CircuitOpen>(&state_)) {
            if (now - open->opened_at >= config_.open_cooldown) {
                state_ = CircuitHalfOpen{0, now};
                ++episode_;
                event = MakeEvent(EventType::kCircuitHalfOpened);
                LOG(INFO) << "Circuit " << name_ << " half-open after cooldown";
            }
        }

        if (std::holds_alternative<CircuitClosed>(state_)) {
            ++total_permits_;
            result = MakePermit(false, closed_generation_);
        } else if (auto* half_open = std::get_if<CircuitHalfOpen>(&state_);
                   half_open != nullptr &&
                   half_open->in_flight_trials < config_.half_open_max_in_flight) {
            ++half_open->in_flight_trials;
            ++total_permits_;
            result = MakePermit(true, episode_);
        } else {
            ++rejections_;
            result = MakeError(ErrorKind::kCircuitOpen,
                               absl::StrCat("circuit ", name_, " is ",
                                            CircuitStateName(KindOf(state_))));
        }
    }
    Emit(event);
    return result;
}

void MonitoredCircuitBreaker::OnSuccess(Permit permit) {
    if (!Consume(permit)) {
        return;
    }

    std::optional<HealthEvent> event;
    {
        absl::MutexLock lock(&mutex_);
        ++successes_;

        if (permit.is_trial()) {
            if (std::holds_alternative<CircuitHalfOpen>(state_) && episode_ == permit.episode()) {
                state_ = CircuitClosed{};
                ++recoveries_;
                event = MakeEvent(EventType::kCircuitClosed);
                event->With("reason", "trial_succeeded");
                LOG(INFO) << "Circuit " << name_ << " closed after successful trial";
            } else {
                VLOG(2) << "Circuit " << name_ << ": stale trial success ignored";
            }
        } else if (auto* closed = std::get_if<CircuitClosed>(&state_);
                   closed != nullptr && closed_generation_ == permit.episode()) {
            closed->failure_count = 0;
            ++closed->success_count;
        } else {
            VLOG(2) << "Circuit " << name_ << ": success from an earlier closed period ignored";
        }
    }
    Emit(event);
}

void MonitoredCircuitBreaker::OnFailure(Permit permit) {
    if (!Consume(permit)) {
        return;
    }

    std::optional<HealthEvent> event;
    {
        absl::MutexLock lock(&mutex_);
        const TimePoint now = clock_->Now();
        ++failures_;

        if (permit.is_trial()) {
            if (std::holds_alternative<CircuitHalfOpen>(state_) && episode_ == permit.episode()) {
                state_ = CircuitOpen{now, 0};
                ++trips_;
                event = MakeEvent(EventType::kCircuitOpened);
                event->With("reason", "trial_failed");
                LOG(WARNING) << "Circuit " << name_ << " reopened after failed trial";
            } else {
                VLOG(2) << "Circuit " << name_ << ": stale trial failure ignored";
            }
        } else if (auto* closed = std::get_if<CircuitClosed>(&state_);
                   closed != nullptr && closed_generation_ == permit.episode()) {
            ++closed->failure_count;
            closed->last_failure_time = now;
            if (closed->failure_count >= config_.failure_threshold) {
                const uint32_t failures = closed->failure_count;
                state_ = CircuitOpen{now, failures};
                ++closed_generation_;
                ++trips_;
                event = MakeEvent(EventType::kCircuitOpened);
                event->With("reason", "failure_threshold")
                    .With("failure_count", absl::StrCat(failures));
                LOG(WARNING) << "Circuit " << name_ << " opened after " << failures
                             << " consecutive failures";
            }
        } else {
            VLOG(2) << "Circuit " << name_ << ": failure from an earlier closed period ignored";
        }
    }
    Emit(event);
}

void MonitoredCircuitBreaker::OnAbandon(const Permit& permit) {
    if (!permit.is_trial()) {
        return;
    }
    absl::MutexLock lock(&mutex_);
    auto* half_open = std::get_if<CircuitHalfOpen>(&state_);
    if (half_open != nullptr && episode_ == permit.episode() && half_open->in_flight_trials > 0) {
        --half_open->in_flight_trials;
        VLOG(2) << "Circuit " << name_ << ": trial permit abandoned";
    }
}

CircuitStateKind MonitoredCircuitBreaker::State() const {
    absl::MutexLock lock(&mutex_);
    return KindOf(state_);
}

CircuitState MonitoredCircuitBreaker::CurrentState() const {
    absl::MutexLock lock(&mutex_);
    return state_;
}

BreakerSnapshot MonitoredCircuitBreaker::Snapshot() const {
    absl::MutexLock lock(&mutex_);
    BreakerSnapshot snapshot;
    snapshot.name = name_;
    snapshot.state = KindOf(state_);
    if (const auto* closed = std::get_if<CircuitClosed>(&state_)) {
        snapshot.failure_count = closed->failure_count;
        snapshot.success_count = closed->success_count;
        snapshot.last_failure_time = closed->last_failure_time;
    } else if (const auto* open = std::get_if<CircuitOpen>(&state_)) {
        snapshot.failure_count = open->failure_count;
        snapshot.last_failure_time = open->opened_at;
    } else if (const auto* half_open = std::get_if<CircuitHalfOpen>(&state_)) {
        snapshot.in_flight_trials = half_open->in_flight_trials;
    }
    snapshot.trips = trips_;
    snapshot.rejections = rejections_;
    snapshot.total_permits = total_permits_;
    snapshot.successes = successes_;
    snapshot.failures = failures_;
    snapshot.recoveries = recoveries_;
    return snapshot;
}

void MonitoredCircuitBreaker::Reset() {
    std::optional<HealthEvent> event;
    {
        absl::MutexLock lock(&mutex_);
        const bool was_closed = std::holds_alternative<CircuitClosed>(state_);
        state_ = CircuitClosed{};
        ++closed_generation_;
        if (!was_closed) {
            event = MakeEvent(EventType::kCircuitClosed);
            event->With("reason", "reset");
        }
    }
    LOG(INFO) << "Circuit " << name_ << " reset";
    Emit(event);
}

} // namespace Sluice
