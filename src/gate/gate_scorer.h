#ifndef SLUICE_GATE_SCORER_H_
#define SLUICE_GATE_SCORER_H_

#include "absl/status/statusor.h"
#include "common/types.h"

namespace Sluice {

struct GateThresholds {
    double hi = 0.7;
    double lo = 0.3;
};

/**
 * Heuristic gate that turns page signals into an extraction mode.
 *
 * Score() and Decide() are pure and total over sanitized input; the weights
 * are fixed so decisions stay comparable across deployments.
 */
class GateScorer {
public:
    // Rejects thresholds outside [0,1] or lo > hi.
    static absl::StatusOr<GateScorer> Create(GateThresholds thresholds);

    GateScorer() = default;

    const GateThresholds& thresholds() const { return thresholds_; }

    Decision Decide(const GateFeatures& features) const {
        return Decide(features, thresholds_.hi, thresholds_.lo);
    }

    /**
     * Score in [0,1]; higher means static parsing is more likely to work.
     */
    static double Score(const GateFeatures& features);

    /**
     * Raw at or above |hi_threshold|; Headless at or below |lo_threshold| or
     * when three or more SPA markers are set; ProbesFirst otherwise.
     */
    static Decision Decide(const GateFeatures& features, double hi_threshold,
                           double lo_threshold);

    static int CountSpaMarkers(uint8_t flags);

    // Clamps domain_prior into [0,1]; a non-finite prior becomes 0.5.
    static GateFeatures SanitizeFeatures(GateFeatures features);

private:
    explicit GateScorer(GateThresholds thresholds) : thresholds_(thresholds) {}

    GateThresholds thresholds_;
};

} // namespace Sluice

#endif // SLUICE_GATE_SCORER_H_
