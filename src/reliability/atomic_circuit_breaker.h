#ifndef SLUICE_ATOMIC_CIRCUIT_BREAKER_H_
#define SLUICE_ATOMIC_CIRCUIT_BREAKER_H_

#include <atomic>
#include <memory>
#include <string>

#include "circuit_breaker.h"

namespace Sluice {

/**
 * Lock-free breaker for the admission hot path.
 *
 * The whole state lives in one 64-bit word:
 *   bits  0..1   state (CircuitStateKind)
 *   bits  2..21  counter (failure streak when Closed/Open, in-flight trials when HalfOpen)
 *   bits 22..63  stamp: milliseconds since construction (opened_at or
 *                entered_at), or the closed generation while Closed
 * Every transition is a single compare-and-swap on that word. The HalfOpen
 * entered_at stamp doubles as the trial episode; open_cooldown >= 1ms keeps
 * consecutive episodes distinct. Each entry into Closed (recovery or Reset)
 * takes a fresh generation, so permits from an earlier closed period are
 * ignored.
 */
class AtomicCircuitBreaker : public ICircuitBreaker {
public:
    static absl::StatusOr<std::shared_ptr<AtomicCircuitBreaker>> Create(
        std::string name, CircuitBreakerConfig config,
        std::shared_ptr<Clock> clock = DefaultClock());

    ~AtomicCircuitBreaker() override = default;

    AtomicCircuitBreaker(const AtomicCircuitBreaker&) = delete;
    AtomicCircuitBreaker& operator=(const AtomicCircuitBreaker&) = delete;

    absl::StatusOr<Permit> TryAcquire() override;
    void OnSuccess(Permit permit) override;
    void OnFailure(Permit permit) override;

    CircuitStateKind State() const override;
    BreakerSnapshot Snapshot() const override;
    void Reset() override;

    const std::string& Name() const override { return name_; }
    const CircuitBreakerConfig& Config() const override { return config_; }

protected:
    void OnAbandon(const Permit& permit) override;

private:
    AtomicCircuitBreaker(std::string name, CircuitBreakerConfig config,
                         std::shared_ptr<Clock> clock);

    static constexpr uint64_t kStateBits = 2;
    static constexpr uint64_t kCounterBits = 20;
    static constexpr uint64_t kStateMask = (1ull << kStateBits) - 1;
    static constexpr uint64_t kCounterMask = (1ull << kCounterBits) - 1;
    static constexpr uint64_t kStampShift = kStateBits + kCounterBits;
    static constexpr uint64_t kStampMask = (1ull << (64 - kStampShift)) - 1;

    static uint64_t Pack(CircuitStateKind state, uint64_t counter, uint64_t stamp_ms) {
        return static_cast<uint64_t>(state) | ((counter & kCounterMask) << kStateBits) |
               (stamp_ms << kStampShift);
    }
    static CircuitStateKind StateOf(uint64_t word) {
        return static_cast<CircuitStateKind>(word & kStateMask);
    }
    static uint64_t CounterOf(uint64_t word) { return (word >> kStateBits) & kCounterMask; }
    static uint64_t StampOf(uint64_t word) { return word >> kStampShift; }

    uint64_t NowMs() const;
    uint64_t NextClosedGeneration();

    const std::string name_;
    const CircuitBreakerConfig config_;
    const std::shared_ptr<Clock> clock_;
    const TimePoint base_;
    const uint64_t cooldown_ms_;

    std::atomic<uint64_t> word_;
    std::atomic<uint64_t> success_count_{0};
    // Milliseconds since construction plus one; zero means none.
    std::atomic<uint64_t> last_failure_ms_{0};
    std::atomic<uint64_t> trips_{0};
    std::atomic<uint64_t> closed_generation_{0};
    std::atomic<uint64_t> rejections_{0};
};

} // namespace Sluice

#endif // SLUICE_ATOMIC_CIRCUIT_BREAKER_H_
