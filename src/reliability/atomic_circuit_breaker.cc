#include "atomic_circuit_breaker.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace Sluice {

absl::StatusOr<std::shared_ptr<AtomicCircuitBreaker>> AtomicCircuitBreaker::Create(
    std::string name, CircuitBreakerConfig config, std::shared_ptr<Clock> clock) {
    absl::Status status = config.Validate();
    if (!status.ok()) {
        return status;
    }
    if (clock == nullptr) {
        return MakeError(ErrorKind::kInvalidConfig, "circuit breaker requires a clock");
    }
    return std::shared_ptr<AtomicCircuitBreaker>(
        new AtomicCircuitBreaker(std::move(name), config, std::move(clock)));
}

AtomicCircuitBreaker::AtomicCircuitBreaker(std::string name, CircuitBreakerConfig config,
                                           std::shared_ptr<Clock> clock)
    : name_(std::move(name)),
      config_(config),
      clock_(std::move(clock)),
      base_(clock_->Now()),
      cooldown_ms_(static_cast<uint64_t>(ToMillis(config.open_cooldown))),
      word_(Pack(CircuitStateKind::kClosed, 0, 0)) {}

uint64_t AtomicCircuitBreaker::NowMs() const {
    int64_t ms = ToMillis(clock_->Now() - base_);
    return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

absl::StatusOr<Permit> AtomicCircuitBreaker::TryAcquire() {
    uint64_t word = word_.load(std::memory_order_acquire);
    while (true) {
        switch (StateOf(word)) {
            case CircuitStateKind::kClosed:
                return MakePermit(false, StampOf(word));

            case CircuitStateKind::kOpen: {
                const uint64_t now = NowMs();
                if (now < StampOf(word) + cooldown_ms_) {
                    rejections_.fetch_add(1, std::memory_order_relaxed);
                    return MakeError(ErrorKind::kCircuitOpen,
                                     absl::StrCat("circuit ", name_, " is open"));
                }
                const uint64_t next = Pack(CircuitStateKind::kHalfOpen, 1, now);
                if (word_.compare_exchange_weak(word, next, std::memory_order_acq_rel,
                                                std::memory_order_acquire)) {
                    LOG(INFO) << "Circuit " << name_ << " half-open after cooldown";
                    return MakePermit(true, now);
                }
                break;
            }

            case CircuitStateKind::kHalfOpen: {
                const uint64_t in_flight = CounterOf(word);
                if (in_flight >= config_.half_open_max_in_flight) {
                    rejections_.fetch_add(1, std::memory_order_relaxed);
                    return MakeError(ErrorKind::kCircuitOpen,
                                     absl::StrCat("circuit ", name_,
                                                  " is half-open at trial capacity"));
                }
                const uint64_t next =
                    Pack(CircuitStateKind::kHalfOpen, in_flight + 1, StampOf(word));
                if (word_.compare_exchange_weak(word, next, std::memory_order_acq_rel,
                                                std::memory_order_acquire)) {
                    return MakePermit(true, StampOf(word));
                }
                break;
            }
        }
    }
}

void AtomicCircuitBreaker::OnSuccess(Permit permit) {
    if (!Consume(permit)) {
        return;
    }

    uint64_t word = word_.load(std::memory_order_acquire);
    if (permit.is_trial()) {
        const uint64_t generation = NextClosedGeneration();
        while (StateOf(word) == CircuitStateKind::kHalfOpen && StampOf(word) == permit.episode()) {
            if (word_.compare_exchange_weak(word,
                                            Pack(CircuitStateKind::kClosed, 0, generation),
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire)) {
                success_count_.store(0, std::memory_order_relaxed);
                LOG(INFO) << "Circuit " << name_ << " closed after successful trial";
                return;
            }
        }
        VLOG(2) << "Circuit " << name_ << ": stale trial success ignored";
        return;
    }

    while (StateOf(word) == CircuitStateKind::kClosed && StampOf(word) == permit.episode()) {
        if (CounterOf(word) == 0 ||
            word_.compare_exchange_weak(word, Pack(CircuitStateKind::kClosed, 0, StampOf(word)),
                                        std::memory_order_acq_rel, std::memory_order_acquire)) {
            success_count_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    VLOG(2) << "Circuit " << name_ << ": success from an earlier closed period ignored";
}

void AtomicCircuitBreaker::OnFailure(Permit permit) {
    if (!Consume(permit)) {
        return;
    }

    const uint64_t now = NowMs();
    uint64_t word = word_.load(std::memory_order_acquire);

    if (permit.is_trial()) {
        while (StateOf(word) == CircuitStateKind::kHalfOpen && StampOf(word) == permit.episode()) {
            if (word_.compare_exchange_weak(word, Pack(CircuitStateKind::kOpen, 0, now),
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire)) {
                last_failure_ms_.store(now + 1, std::memory_order_relaxed);
                trips_.fetch_add(1, std::memory_order_relaxed);
                LOG(WARNING) << "Circuit " << name_ << " reopened after failed trial";
                return;
            }
        }
        VLOG(2) << "Circuit " << name_ << ": stale trial failure ignored";
        return;
    }

    while (StateOf(word) == CircuitStateKind::kClosed && StampOf(word) == permit.episode()) {
        const uint64_t failures = CounterOf(word) + 1;
        const bool trip = failures >= config_.failure_threshold;
        const uint64_t next = trip ? Pack(CircuitStateKind::kOpen, failures, now)
                                   : Pack(CircuitStateKind::kClosed, failures, StampOf(word));
        if (word_.compare_exchange_weak(word, next, std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
            last_failure_ms_.store(now + 1, std::memory_order_relaxed);
            if (trip) {
                trips_.fetch_add(1, std::memory_order_relaxed);
                LOG(WARNING) << "Circuit " << name_ << " opened after " << failures
                             << " consecutive failures";
            }
            return;
        }
    }
    VLOG(2) << "Circuit " << name_ << ": failure from an earlier closed period ignored";
}

void AtomicCircuitBreaker::OnAbandon(const Permit& permit) {
    if (!permit.is_trial()) {
        return;
    }
    uint64_t word = word_.load(std::memory_order_acquire);
    while (StateOf(word) == CircuitStateKind::kHalfOpen && StampOf(word) == permit.episode() &&
           CounterOf(word) > 0) {
        const uint64_t next =
            Pack(CircuitStateKind::kHalfOpen, CounterOf(word) - 1, StampOf(word));
        if (word_.compare_exchange_weak(word, next, std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
            VLOG(2) << "Circuit " << name_ << ": trial permit abandoned";
            return;
        }
    }
}

CircuitStateKind AtomicCircuitBreaker::State() const {
    return StateOf(word_.load(std::memory_order_acquire));
}

BreakerSnapshot AtomicCircuitBreaker::Snapshot() const {
    const uint64_t word = word_.load(std::memory_order_acquire);
    BreakerSnapshot snapshot;
    snapshot.name = name_;
    snapshot.state = StateOf(word);
    if (snapshot.state == CircuitStateKind::kHalfOpen) {
        snapshot.in_flight_trials = static_cast<uint32_t>(CounterOf(word));
    } else {
        snapshot.failure_count = static_cast<uint32_t>(CounterOf(word));
    }
    snapshot.success_count = success_count_.load(std::memory_order_relaxed);
    const uint64_t last_failure = last_failure_ms_.load(std::memory_order_relaxed);
    if (last_failure != 0) {
        snapshot.last_failure_time = base_ + std::chrono::milliseconds(last_failure - 1);
    }
    snapshot.trips = trips_.load(std::memory_order_relaxed);
    snapshot.rejections = rejections_.load(std::memory_order_relaxed);
    return snapshot;
}

uint64_t AtomicCircuitBreaker::NextClosedGeneration() {
    return (closed_generation_.fetch_add(1, std::memory_order_relaxed) + 1) & kStampMask;
}

void AtomicCircuitBreaker::Reset() {
    word_.store(Pack(CircuitStateKind::kClosed, 0, NextClosedGeneration()),
                std::memory_order_release);
    success_count_.store(0, std::memory_order_relaxed);
    last_failure_ms_.store(0, std::memory_order_relaxed);
    LOG(INFO) << "Circuit " << name_ << " reset";
}

} // namespace Sluice
