#ifndef SLUICE_CIRCUIT_BREAKER_H_
#define SLUICE_CIRCUIT_BREAKER_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/clock.h"

namespace Sluice {

struct CircuitBreakerConfig {
    // Consecutive failures while Closed that open the circuit.
    uint32_t failure_threshold = 5;
    Duration open_cooldown = std::chrono::seconds(30);
    // Concurrent trial permits allowed while HalfOpen.
    uint32_t half_open_max_in_flight = 1;

    // Largest counter value the packed breaker word can hold.
    static constexpr uint32_t kMaxCounter = (1u << 20) - 1;

    absl::Status Validate() const;
};

enum class CircuitStateKind : uint8_t {
    kClosed = 0,
    kOpen = 1,
    kHalfOpen = 2,
};

const char* CircuitStateName(CircuitStateKind kind);

struct CircuitClosed {
    uint32_t failure_count = 0;
    uint64_t success_count = 0;
    std::optional<TimePoint> last_failure_time;
};

struct CircuitOpen {
    TimePoint opened_at{};
    uint32_t failure_count = 0;
};

struct CircuitHalfOpen {
    uint32_t in_flight_trials = 0;
    TimePoint entered_at{};
};

using CircuitState = std::variant<CircuitClosed, CircuitOpen, CircuitHalfOpen>;

CircuitStateKind KindOf(const CircuitState& state);

/**
 * Read-only view for observability sinks. Counters a variant does not
 * maintain stay zero.
 */
struct BreakerSnapshot {
    std::string name;
    CircuitStateKind state = CircuitStateKind::kClosed;
    uint32_t failure_count = 0;
    uint64_t success_count = 0;
    std::optional<TimePoint> last_failure_time;
    uint32_t in_flight_trials = 0;
    uint64_t trips = 0;
    uint64_t rejections = 0;
    uint64_t total_permits = 0;
    uint64_t successes = 0;
    uint64_t failures = 0;
    uint64_t recoveries = 0;
};

class ICircuitBreaker;

/**
 * Admission token returned by ICircuitBreaker::TryAcquire.
 *
 * Hand it back through OnSuccess or OnFailure. A permit destroyed without
 * an outcome gives its half-open trial slot back and counts as neither.
 */
class Permit {
public:
    Permit() = default;
    ~Permit();

    Permit(Permit&& other) noexcept;
    Permit& operator=(Permit&& other) noexcept;

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    bool valid() const { return owner_ != nullptr; }
    bool is_trial() const { return trial_; }
    uint64_t episode() const { return episode_; }
    const ICircuitBreaker* owner() const { return owner_; }

private:
    friend class ICircuitBreaker;

    Permit(ICircuitBreaker* owner, bool trial, uint64_t episode)
        : owner_(owner), trial_(trial), episode_(episode) {}

    ICircuitBreaker* owner_ = nullptr;
    bool trial_ = false;
    uint64_t episode_ = 0;
};

/**
 * Fail-fast circuit breaker guarding one backend.
 *
 * Closed -> Open after failure_threshold consecutive failures.
 * Open -> HalfOpen lazily on the first TryAcquire after open_cooldown.
 * HalfOpen -> Closed on a successful trial, HalfOpen -> Open on a failed one.
 * TryAcquire never blocks.
 */
class ICircuitBreaker {
public:
    virtual ~ICircuitBreaker() = default;

    virtual absl::StatusOr<Permit> TryAcquire() = 0;
    virtual void OnSuccess(Permit permit) = 0;
    virtual void OnFailure(Permit permit) = 0;

    virtual CircuitStateKind State() const = 0;
    virtual BreakerSnapshot Snapshot() const = 0;

    // Administrative: back to Closed with an empty failure streak. Lifetime
    // counters (trips, rejections) are kept; permits issued before the reset
    // no longer count.
    virtual void Reset() = 0;

    virtual const std::string& Name() const = 0;
    virtual const CircuitBreakerConfig& Config() const = 0;

protected:
    friend class Permit;

    // Called by a permit destroyed without an outcome.
    virtual void OnAbandon(const Permit& permit) = 0;

    Permit MakePermit(bool trial, uint64_t episode) { return Permit(this, trial, episode); }

    // Detaches |permit| from this breaker. Returns false, logging, when the
    // permit is empty or was issued by another breaker.
    bool Consume(Permit& permit) const;
};

} // namespace Sluice

#endif // SLUICE_CIRCUIT_BREAKER_H_
