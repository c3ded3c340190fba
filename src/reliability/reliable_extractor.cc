#include "reliable_extractor.h"

#include <algorithm>
#include <exception>
#include <utility>

#include <glog/logging.h>

#include "absl/random/random.h"
#include "absl/strings/str_cat.h"
#include "common/errors.h"
#include "gate/feature_scanner.h"

namespace Sluice {

absl::Status ReliabilityOptions::Validate() const {
    if (!(probe_quality_threshold >= 0.0 && probe_quality_threshold <= 1.0)) {
        return MakeError(ErrorKind::kInvalidConfig,
                         absl::StrCat("probe_quality_threshold must lie in [0,1], got ",
                                      probe_quality_threshold));
    }
    if (default_timeout <= Duration::zero()) {
        return MakeError(ErrorKind::kInvalidConfig, "default_timeout must be positive");
    }
    for (int i = 0; i < kNumDecisions; ++i) {
        absl::Status status = retry[i].Validate();
        if (!status.ok()) {
            return MakeError(ErrorKind::kInvalidConfig,
                             absl::StrCat(ToString(static_cast<Decision>(i)), ": ",
                                          status.message()));
        }
    }
    return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<ReliableExtractor>> ReliableExtractor::Create(
    std::shared_ptr<ExtractionInstancePool> pool, std::shared_ptr<IHeadlessRenderer> renderer,
    ModeBreakers breakers, ReliabilityOptions options, std::shared_ptr<Clock> clock) {
    if (pool == nullptr || renderer == nullptr || clock == nullptr) {
        return MakeError(ErrorKind::kInvalidConfig,
                         "extractor requires a pool, a headless renderer and a clock");
    }
    for (int i = 0; i < kNumDecisions; ++i) {
        if (breakers[i] == nullptr) {
            return MakeError(ErrorKind::kInvalidConfig,
                             absl::StrCat("no circuit breaker for mode ",
                                          ToString(static_cast<Decision>(i))));
        }
    }
    absl::Status status = options.Validate();
    if (!status.ok()) {
        return status;
    }
    absl::StatusOr<GateScorer> gate = GateScorer::Create(options.gate);
    if (!gate.ok()) {
        return gate.status();
    }

    return std::unique_ptr<ReliableExtractor>(
        new ReliableExtractor(std::move(pool), std::move(renderer), std::move(breakers),
                              std::move(options), *gate, std::move(clock)));
}

ReliableExtractor::ReliableExtractor(std::shared_ptr<ExtractionInstancePool> pool,
                                     std::shared_ptr<IHeadlessRenderer> renderer,
                                     ModeBreakers breakers, ReliabilityOptions options,
                                     GateScorer gate, std::shared_ptr<Clock> clock)
    : pool_(std::move(pool)),
      renderer_(std::move(renderer)),
      breakers_(std::move(breakers)),
      options_(std::move(options)),
      gate_(gate),
      clock_(std::move(clock)) {}

Decision ReliableExtractor::DecideMode(const ExtractionRequest& request) const {
    GateFeatures features = request.features.has_value()
                                ? *request.features
                                : FeatureScanner::ScanHtml(request.html, request.domain_prior);
    return gate_.Decide(GateScorer::SanitizeFeatures(features));
}

absl::StatusOr<ExtractedDocument> ReliableExtractor::ExtractWithReliability(
    const ExtractionRequest& request, std::optional<Decision> mode_hint,
    std::optional<TimePoint> deadline) {
    const TimePoint call_deadline =
        deadline.has_value() ? *deadline : clock_->Now() + options_.default_timeout;
    const Decision initial = mode_hint.has_value() ? *mode_hint : DecideMode(request);

    CallStats call;
    std::optional<ExtractedDocument> fallback;
    std::optional<absl::BitGen> rng;
    absl::Status last_error;
    bool deadline_hit = false;

    VLOG(2) << "ReliableExtractor: " << request.url << " starts in " << ToString(initial)
            << (mode_hint.has_value() ? " (hint)" : "");

    Decision mode = initial;
    while (true) {
        const RetryPolicy& policy = options_.retry[ModeIndex(mode)];
        const uint32_t budget = options_.allow_retry ? policy.max_attempts : 1;
        ICircuitBreaker& breaker = *breakers_[ModeIndex(mode)];
        bool rejected = false;

        for (uint32_t used = 0; used < budget;) {
            if (clock_->Now() >= call_deadline) {
                deadline_hit = true;
                break;
            }

            absl::StatusOr<Permit> permit = breaker.TryAcquire();
            if (!permit.ok()) {
                ++call.trips;
                rejected = true;
                last_error = permit.status();
                VLOG(2) << "ReliableExtractor: " << ToString(mode) << " rejected: " << last_error;
                break;
            }

            ++call.attempts;
            ++used;
            AttemptOutcome outcome =
                RunAttempt(mode, request, call_deadline, std::move(*permit), fallback);
            if (outcome.result.ok()) {
                ExtractedDocument document = std::move(*outcome.result);
                document.mode = mode;
                document.degraded = mode != initial;
                document.attempts = static_cast<uint32_t>(call.attempts);
                Finish(call, true, document.degraded);
                VLOG(1) << "ReliableExtractor: " << request.url << " extracted in "
                        << ToString(mode) << " after " << call.attempts << " attempts";
                return document;
            }

            last_error = outcome.result.status();
            VLOG(2) << "ReliableExtractor: " << ToString(mode) << " attempt " << used << "/"
                    << budget << " failed: " << last_error;
            if (IsKind(last_error, ErrorKind::kDeadlineExpired)) {
                deadline_hit = true;
                break;
            }
            if (!outcome.retryable || used >= budget) {
                break;
            }

            const TimePoint now = clock_->Now();
            if (now >= call_deadline) {
                deadline_hit = true;
                break;
            }
            if (!rng.has_value()) {
                rng.emplace();
            }
            const Duration delay = std::min(policy.Backoff(used - 1, *rng), call_deadline - now);
            ++call.retries;
            clock_->SleepFor(delay);
        }

        if (deadline_hit) {
            break;
        }
        ++call.failures;

        if (rejected && !options_.allow_escalation && !options_.allow_retry) {
            Finish(call, false, false);
            return last_error;
        }

        const std::optional<Decision> next = NextStricter(mode);
        if (!options_.allow_escalation || !next.has_value()) {
            break;
        }
        if (options_.reset_breaker_on_escalation) {
            breakers_[ModeIndex(*next)]->Reset();
        }
        ++call.escalations;
        VLOG(1) << "ReliableExtractor: " << request.url << " escalating " << ToString(mode)
                << " -> " << ToString(*next);
        mode = *next;
    }

    if (fallback.has_value() && options_.enable_graceful_degradation) {
        ExtractedDocument document = std::move(*fallback);
        document.degraded = true;
        document.attempts = static_cast<uint32_t>(call.attempts);
        Finish(call, true, true);
        LOG(WARNING) << "ReliableExtractor: " << request.url
                     << " falling back to low-quality probe (quality " << document.quality_score
                     << ")";
        return document;
    }

    Finish(call, false, false);
    if (deadline_hit) {
        return MakeError(ErrorKind::kDeadlineExpired,
                         absl::StrCat("deadline expired after ", call.attempts, " attempts",
                                      last_error.ok() ? "" : "; last error: ",
                                      last_error.ok() ? "" : last_error.ToString()));
    }
    if (IsKind(last_error, ErrorKind::kExtractionTimeout)) {
        return MakeError(ErrorKind::kExtractionTimeout,
                         absl::StrCat("final attempt timed out: ", last_error.message()));
    }
    LOG(WARNING) << "ReliableExtractor: " << request.url << " exhausted all modes after "
                 << call.attempts << " attempts: " << last_error;
    return MakeError(ErrorKind::kAllModesExhausted,
                     absl::StrCat("all modes exhausted after ", call.attempts,
                                  " attempts; last error: ", last_error.ToString()));
}

ReliableExtractor::AttemptOutcome ReliableExtractor::RunAttempt(
    Decision mode, const ExtractionRequest& request, TimePoint deadline, Permit permit,
    std::optional<ExtractedDocument>& fallback) {
    if (mode == Decision::kHeadless) {
        return RunHeadless(request, deadline, std::move(permit));
    }
    return RunOnPool(mode, request, deadline, std::move(permit), fallback);
}

ReliableExtractor::AttemptOutcome ReliableExtractor::RunOnPool(
    Decision mode, const ExtractionRequest& request, TimePoint deadline, Permit permit,
    std::optional<ExtractedDocument>& fallback) {
    ICircuitBreaker& breaker = *breakers_[ModeIndex(mode)];

    absl::StatusOr<CheckedOutInstance> instance = pool_->Acquire(deadline);
    if (!instance.ok()) {
        const ErrorKind kind = GetErrorKind(instance.status());
        // Exhaustion and deadline never reached the engine; the permit is
        // dropped without an outcome.
        if (kind == ErrorKind::kPoolCreationFailed) {
            breaker.OnFailure(std::move(permit));
        }
        return {instance.status(), kind != ErrorKind::kDeadlineExpired};
    }

    absl::StatusOr<ExtractedDocument> result = pool_->RunWithEpochTimeout(
        *instance, deadline,
        [content = request.html, url = request.url, mode](IExtractionEngine& engine,
                                                          ExecutionContext& context) {
            return engine.Extract(content, url, mode, context);
        });
    if (IsKind(result.status(), ErrorKind::kDeadlineExpired)) {
        // Creating the instance used up the deadline; nothing ran, so neither
        // the instance nor the backend is charged.
        pool_->Release(std::move(*instance));
        return {result.status(), false};
    }
    pool_->RecordUsage(*instance, result.ok());
    pool_->Release(std::move(*instance));

    if (!result.ok()) {
        breaker.OnFailure(std::move(permit));
        return {result.status(), true};
    }
    breaker.OnSuccess(std::move(permit));

    if (mode == Decision::kProbesFirst) {
        result->quality_score = ProbeQuality(*result);
        if (result->quality_score < options_.probe_quality_threshold) {
            if (!fallback.has_value() || fallback->quality_score < result->quality_score) {
                fallback = *result;
                fallback->mode = mode;
            }
            return {MakeError(ErrorKind::kEngineError,
                              absl::StrCat("probe quality ", result->quality_score,
                                           " below threshold ", options_.probe_quality_threshold)),
                    false};
        }
    } else if (result->quality_score <= 0.0) {
        result->quality_score = ProbeQuality(*result);
    }
    return {std::move(result), true};
}

ReliableExtractor::AttemptOutcome ReliableExtractor::RunHeadless(const ExtractionRequest& request,
                                                                 TimePoint deadline,
                                                                 Permit permit) {
    ICircuitBreaker& breaker = *breakers_[ModeIndex(Decision::kHeadless)];

    absl::StatusOr<ExtractedDocument> result;
    try {
        result = renderer_->Render(request.url, request.html, deadline);
    } catch (const std::exception& e) {
        result = MakeError(ErrorKind::kEngineError,
                           absl::StrCat("headless renderer threw: ", e.what()));
    }

    if (!result.ok()) {
        breaker.OnFailure(std::move(permit));
        return {result.status(), true};
    }
    breaker.OnSuccess(std::move(permit));
    if (result->quality_score <= 0.0) {
        result->quality_score = ProbeQuality(*result);
    }
    return {std::move(result), true};
}

void ReliableExtractor::Finish(const CallStats& call, bool success, bool degraded) {
    absl::MutexLock lock(&stats_mutex_);
    ++stats_.extractions;
    stats_.total_attempts += call.attempts;
    stats_.failures += call.failures;
    stats_.circuit_breaker_trips += call.trips;
    stats_.escalations += call.escalations;
    if (success) {
        ++stats_.successes;
    }
    if (degraded) {
        ++stats_.degraded_results;
    }
    total_retries_ += call.retries;
    stats_.avg_retries =
        static_cast<double>(total_retries_) / static_cast<double>(stats_.extractions);
}

ReliabilityStats ReliableExtractor::Stats() const {
    absl::MutexLock lock(&stats_mutex_);
    return stats_;
}

ExtractorHealth ReliableExtractor::Health() const {
    ExtractorHealth health;
    health.pool = pool_->Snapshot();
    for (int i = 0; i < kNumDecisions; ++i) {
        health.breakers[i] = breakers_[i]->Snapshot();
    }
    health.stats = Stats();
    return health;
}

} // namespace Sluice
