#include "circuit_breaker.h"

#include <utility>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace Sluice {

absl::Status CircuitBreakerConfig::Validate() const {
    if (failure_threshold < 1 || failure_threshold > kMaxCounter) {
        return MakeError(ErrorKind::kInvalidConfig,
                         absl::StrCat("failure_threshold must be in [1, ", kMaxCounter,
                                      "], got ", failure_threshold));
    }
    if (half_open_max_in_flight < 1 || half_open_max_in_flight > kMaxCounter) {
        return MakeError(ErrorKind::kInvalidConfig,
                         absl::StrCat("half_open_max_in_flight must be in [1, ", kMaxCounter,
                                      "], got ", half_open_max_in_flight));
    }
    if (open_cooldown < std::chrono::milliseconds(1)) {
        return MakeError(ErrorKind::kInvalidConfig,
                         absl::StrCat("open_cooldown must be at least 1ms, got ",
                                      ToMillis(open_cooldown), "ms"));
    }
    return absl::OkStatus();
}

const char* CircuitStateName(CircuitStateKind kind) {
    switch (kind) {
        case CircuitStateKind::kClosed:
            return "closed";
        case CircuitStateKind::kOpen:
            return "open";
        case CircuitStateKind::kHalfOpen:
            return "half_open";
    }
    return "unknown";
}

CircuitStateKind KindOf(const CircuitState& state) {
    return static_cast<CircuitStateKind>(state.index());
}

Permit::~Permit() {
    if (owner_ != nullptr) {
        ICircuitBreaker* owner = owner_;
        owner_ = nullptr;
        owner->OnAbandon(*this);
    }
}

Permit::Permit(Permit&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)),
      trial_(other.trial_),
      episode_(other.episode_) {}

Permit& Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        if (owner_ != nullptr) {
            ICircuitBreaker* owner = std::exchange(owner_, nullptr);
            owner->OnAbandon(*this);
        }
        owner_ = std::exchange(other.owner_, nullptr);
        trial_ = other.trial_;
        episode_ = other.episode_;
    }
    return *this;
}

bool ICircuitBreaker::Consume(Permit& permit) const {
    if (permit.owner_ == nullptr) {
        LOG(ERROR) << "Circuit breaker " << Name() << ": outcome reported with an empty permit";
        return false;
    }
    if (permit.owner_ != this) {
        LOG(ERROR) << "Circuit breaker " << Name()
                   << ": outcome reported with a permit from another breaker";
        return false;
    }
    permit.owner_ = nullptr;
    return true;
}

} // namespace Sluice
