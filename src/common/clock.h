#ifndef SLUICE_CLOCK_H_
#define SLUICE_CLOCK_H_

#include <chrono>
#include <cstdint>
#include <memory>

#include "absl/synchronization/mutex.h"

namespace Sluice {

using Duration = std::chrono::steady_clock::duration;
using TimePoint = std::chrono::steady_clock::time_point;

/**
 * Time source for cooldowns, deadlines and backoff sleeps.
 * Components never read std::chrono clocks directly.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint Now() const = 0;
    virtual void SleepFor(Duration duration) = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint Now() const override { return std::chrono::steady_clock::now(); }
    void SleepFor(Duration duration) override;
};

/**
 * Clock that only moves when told to. SleepFor advances time instantly,
 * so retry backoff in tests costs no wall time.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(1))
        : now_(start) {}

    TimePoint Now() const override;
    void SleepFor(Duration duration) override;

    void Advance(Duration duration);

private:
    mutable absl::Mutex mutex_;
    TimePoint now_;
};

// Process-wide steady clock for callers that do not inject one.
std::shared_ptr<Clock> DefaultClock();

inline int64_t ToMillis(Duration duration) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

} // namespace Sluice

#endif // SLUICE_CLOCK_H_
