#ifndef SLUICE_RELIABLE_EXTRACTOR_H_
#define SLUICE_RELIABLE_EXTRACTOR_H_

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "circuit_breaker.h"
#include "common/clock.h"
#include "common/types.h"
#include "gate/gate_scorer.h"
#include "headless_renderer.h"
#include "pool/instance_pool.h"
#include "probe_quality.h"
#include "retry_policy.h"

namespace Sluice {

struct ReliabilityOptions {
    bool allow_escalation = true;
    bool allow_retry = true;
    // Reset the next mode's breaker before escalating into it.
    bool reset_breaker_on_escalation = false;
    // Return the best low-quality probe when every mode fails.
    bool enable_graceful_degradation = true;
    double probe_quality_threshold = kDefaultProbeQualityThreshold;
    GateThresholds gate;
    RetryPolicies retry = DefaultRetryPolicies();
    // Deadline applied when the caller supplies none.
    Duration default_timeout = std::chrono::seconds(30);

    absl::Status Validate() const;
};

struct ReliabilityStats {
    uint64_t total_attempts = 0;
    uint64_t successes = 0;
    // Modes left without a result.
    uint64_t failures = 0;
    // Same-mode retries per extraction.
    double avg_retries = 0.0;
    uint64_t circuit_breaker_trips = 0;
    uint64_t extractions = 0;
    uint64_t escalations = 0;
    uint64_t degraded_results = 0;

    bool operator==(const ReliabilityStats& other) const = default;
};

struct ExtractorHealth {
    PoolSnapshot pool;
    std::array<BreakerSnapshot, kNumDecisions> breakers;
    ReliabilityStats stats;
};

// One breaker per mode, indexed by ModeIndex(). Two modes may share one.
using ModeBreakers = std::array<std::shared_ptr<ICircuitBreaker>, kNumDecisions>;

/**
 * Runs one extraction through gate, breakers, pool and headless fallback.
 *
 * Per call: pick the initial mode, then for each mode from there towards
 * Headless take a breaker permit, execute, and retry the same mode up to its
 * RetryPolicy before escalating. An open circuit escalates at once without
 * using retry budget. Callers see one document or one terminal error.
 */
class ReliableExtractor {
public:
    static absl::StatusOr<std::unique_ptr<ReliableExtractor>> Create(
        std::shared_ptr<ExtractionInstancePool> pool,
        std::shared_ptr<IHeadlessRenderer> renderer, ModeBreakers breakers,
        ReliabilityOptions options = ReliabilityOptions(),
        std::shared_ptr<Clock> clock = DefaultClock());

    ReliableExtractor(const ReliableExtractor&) = delete;
    ReliableExtractor& operator=(const ReliableExtractor&) = delete;

    /**
     * @param mode_hint Skips the gate when set
     * @param deadline Absolute caller deadline; default_timeout from now if unset
     * @return The document (degraded when it did not come from the initial
     *         mode), or kAllModesExhausted, kExtractionTimeout,
     *         kDeadlineExpired, or kCircuitOpen when escalation and retry are
     *         both disabled
     */
    absl::StatusOr<ExtractedDocument> ExtractWithReliability(
        const ExtractionRequest& request, std::optional<Decision> mode_hint = std::nullopt,
        std::optional<TimePoint> deadline = std::nullopt);

    // Initial mode for |request| as the gate sees it.
    Decision DecideMode(const ExtractionRequest& request) const;

    ReliabilityStats Stats() const;
    ExtractorHealth Health() const;

    const ReliabilityOptions& options() const { return options_; }

private:
    // Counters of one call, folded into the totals when it ends.
    struct CallStats {
        uint64_t attempts = 0;
        uint64_t retries = 0;
        uint64_t failures = 0;
        uint64_t trips = 0;
        uint64_t escalations = 0;
    };

    struct AttemptOutcome {
        absl::StatusOr<ExtractedDocument> result;
        // False when repeating the same mode cannot help.
        bool retryable = true;
    };

    ReliableExtractor(std::shared_ptr<ExtractionInstancePool> pool,
                      std::shared_ptr<IHeadlessRenderer> renderer, ModeBreakers breakers,
                      ReliabilityOptions options, GateScorer gate, std::shared_ptr<Clock> clock);

    AttemptOutcome RunAttempt(Decision mode, const ExtractionRequest& request, TimePoint deadline,
                              Permit permit, std::optional<ExtractedDocument>& fallback);
    AttemptOutcome RunOnPool(Decision mode, const ExtractionRequest& request, TimePoint deadline,
                             Permit permit, std::optional<ExtractedDocument>& fallback);
    AttemptOutcome RunHeadless(const ExtractionRequest& request, TimePoint deadline,
                               Permit permit);

    void Finish(const CallStats& call, bool success, bool degraded);

    const std::shared_ptr<ExtractionInstancePool> pool_;
    const std::shared_ptr<IHeadlessRenderer> renderer_;
    const ModeBreakers breakers_;
    const ReliabilityOptions options_;
    const GateScorer gate_;
    const std::shared_ptr<Clock> clock_;

    mutable absl::Mutex stats_mutex_;
    ReliabilityStats stats_ ABSL_GUARDED_BY(stats_mutex_);
    uint64_t total_retries_ ABSL_GUARDED_BY(stats_mutex_) = 0;
};

} // namespace Sluice

#endif // SLUICE_RELIABLE_EXTRACTOR_H_
