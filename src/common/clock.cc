#include "clock.h"

#include <thread>

namespace Sluice {

void SteadyClock::SleepFor(Duration duration) {
    if (duration > Duration::zero()) {
        std::this_thread::sleep_for(duration);
    }
}

TimePoint ManualClock::Now() const {
    absl::MutexLock lock(&mutex_);
    return now_;
}

void ManualClock::SleepFor(Duration duration) {
    Advance(duration);
}

void ManualClock::Advance(Duration duration) {
    if (duration <= Duration::zero()) {
        return;
    }
    absl::MutexLock lock(&mutex_);
    now_ += duration;
}

std::shared_ptr<Clock> DefaultClock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>();
    return clock;
}

} // namespace Sluice
