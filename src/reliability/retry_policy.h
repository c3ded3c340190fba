#ifndef SLUICE_RETRY_POLICY_H_
#define SLUICE_RETRY_POLICY_H_

#include <array>
#include <chrono>
#include <cstdint>

#include "absl/random/random.h"
#include "absl/status/status.h"
#include "common/clock.h"
#include "common/types.h"

namespace Sluice {

/**
 * Per-mode attempt ceiling and exponential backoff schedule.
 */
struct RetryPolicy {
    // Attempts at one mode before escalating, first attempt included.
    uint32_t max_attempts = 2;
    Duration initial_backoff = std::chrono::milliseconds(100);
    Duration max_backoff = std::chrono::seconds(2);
    double multiplier = 2.0;
    // Upper bound of the random extra delay, as a fraction of the base delay.
    double jitter = 0.05;

    absl::Status Validate() const;

    // Base delay before retry |retry| (0 for the first retry), without jitter.
    Duration BaseBackoff(uint32_t retry) const;

    // BaseBackoff plus uniform jitter in [0, jitter * base].
    Duration Backoff(uint32_t retry, absl::BitGen& rng) const;
};

// Default schedule per mode: Raw 2 attempts, ProbesFirst 2, Headless 1.
using RetryPolicies = std::array<RetryPolicy, kNumDecisions>;

RetryPolicies DefaultRetryPolicies();

} // namespace Sluice

#endif // SLUICE_RETRY_POLICY_H_
