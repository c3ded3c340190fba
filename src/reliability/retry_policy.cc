#include "retry_policy.h"

#include <algorithm>
#include <cmath>

#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace Sluice {

absl::Status RetryPolicy::Validate() const {
    if (max_attempts < 1) {
        return MakeError(ErrorKind::kInvalidConfig, "retry max_attempts must be at least 1");
    }
    if (initial_backoff < Duration::zero() || max_backoff < initial_backoff) {
        return MakeError(ErrorKind::kInvalidConfig,
                         absl::StrCat("retry backoff must satisfy 0 <= initial (",
                                      ToMillis(initial_backoff), "ms) <= max (",
                                      ToMillis(max_backoff), "ms)"));
    }
    if (!(multiplier >= 1.0) || !std::isfinite(multiplier)) {
        return MakeError(ErrorKind::kInvalidConfig,
                         absl::StrCat("retry multiplier must be >= 1, got ", multiplier));
    }
    if (!(jitter >= 0.0 && jitter <= 1.0)) {
        return MakeError(ErrorKind::kInvalidConfig,
                         absl::StrCat("retry jitter must lie in [0,1], got ", jitter));
    }
    return absl::OkStatus();
}

Duration RetryPolicy::BaseBackoff(uint32_t retry) const {
    const double initial = static_cast<double>(initial_backoff.count());
    const double cap = static_cast<double>(max_backoff.count());
    const double delay = std::min(initial * std::pow(multiplier, static_cast<double>(retry)), cap);
    return Duration(static_cast<Duration::rep>(delay));
}

Duration RetryPolicy::Backoff(uint32_t retry, absl::BitGen& rng) const {
    const Duration base = BaseBackoff(retry);
    if (jitter <= 0.0 || base <= Duration::zero()) {
        return base;
    }
    const double extra = absl::Uniform(rng, 0.0, jitter) * static_cast<double>(base.count());
    return base + Duration(static_cast<Duration::rep>(extra));
}

RetryPolicies DefaultRetryPolicies() {
    RetryPolicies policies;
    policies[ModeIndex(Decision::kRaw)].max_attempts = 2;
    policies[ModeIndex(Decision::kProbesFirst)].max_attempts = 2;
    policies[ModeIndex(Decision::kHeadless)].max_attempts = 1;
    return policies;
}

} // namespace Sluice
