#ifndef SLUICE_MONITORED_CIRCUIT_BREAKER_H_
#define SLUICE_MONITORED_CIRCUIT_BREAKER_H_

#include <memory>
#include <optional>
#include <string>

#include "absl/synchronization/mutex.h"
#include "circuit_breaker.h"
#include "common/event_bus.h"

namespace Sluice {

/**
 * Lock-guarded breaker for places where observability matters more than
 * admission throughput.
 *
 * Same state machine as AtomicCircuitBreaker. Additionally keeps lifetime
 * counters and reports every transition to an optional IEventSink. Events
 * are delivered after the transition is committed and the lock dropped; a
 * throwing sink is logged and has no effect on breaker state.
 */
class MonitoredCircuitBreaker : public ICircuitBreaker {
public:
    static absl::StatusOr<std::shared_ptr<MonitoredCircuitBreaker>> Create(
        std::string name, CircuitBreakerConfig config,
        std::shared_ptr<Clock> clock = DefaultClock(),
        std::shared_ptr<IEventSink> sink = nullptr);

    ~MonitoredCircuitBreaker() override = default;

    MonitoredCircuitBreaker(const MonitoredCircuitBreaker&) = delete;
    MonitoredCircuitBreaker& operator=(const MonitoredCircuitBreaker&) = delete;

    absl::StatusOr<Permit> TryAcquire() override;
    void OnSuccess(Permit permit) override;
    void OnFailure(Permit permit) override;

    CircuitStateKind State() const override;
    BreakerSnapshot Snapshot() const override;
    void Reset() override;

    const std::string& Name() const override { return name_; }
    const CircuitBreakerConfig& Config() const override { return config_; }

    // Copy of the full tagged state.
    CircuitState CurrentState() const;

protected:
    void OnAbandon(const Permit& permit) override;

private:
    MonitoredCircuitBreaker(std::string name, CircuitBreakerConfig config,
                            std::shared_ptr<Clock> clock, std::shared_ptr<IEventSink> sink);

    HealthEvent MakeEvent(EventType type) const;
    void Emit(const std::optional<HealthEvent>& event);

    const std::string name_;
    const CircuitBreakerConfig config_;
    const std::shared_ptr<Clock> clock_;
    const std::shared_ptr<IEventSink> sink_;

    mutable absl::Mutex mutex_;
    CircuitState state_ ABSL_GUARDED_BY(mutex_);
    // Bumped on every entry into HalfOpen.
    uint64_t episode_ ABSL_GUARDED_BY(mutex_) = 0;
    // Bumped when Closed trips and on Reset; stamps Closed-issued permits.
    uint64_t closed_generation_ ABSL_GUARDED_BY(mutex_) = 0;

    uint64_t total_permits_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t rejections_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t successes_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t failures_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t trips_ ABSL_GUARDED_BY(mutex_) = 0;
    uint64_t recoveries_ ABSL_GUARDED_BY(mutex_) = 0;
};

} // namespace Sluice

#endif // SLUICE_MONITORED_CIRCUIT_BREAKER_H_
