#include "gate_scorer.h"

#include <algorithm>
#include <cmath>

#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace Sluice {

namespace {

inline double Clamp(double value, double lo, double hi) {
    return std::min(std::max(value, lo), hi);
}

} // namespace

absl::StatusOr<GateScorer> GateScorer::Create(GateThresholds thresholds) {
    if (!(thresholds.hi >= 0.0 && thresholds.hi <= 1.0) ||
        !(thresholds.lo >= 0.0 && thresholds.lo <= 1.0)) {
        return MakeError(ErrorKind::kInvalidConfig,
                         absl::StrCat("gate thresholds must lie in [0,1] (hi=", thresholds.hi,
                                      ", lo=", thresholds.lo, ")"));
    }
    if (thresholds.lo > thresholds.hi) {
        return MakeError(ErrorKind::kInvalidConfig,
                         absl::StrCat("gate lo threshold ", thresholds.lo,
                                      " exceeds hi threshold ", thresholds.hi));
    }
    return GateScorer(thresholds);
}

int GateScorer::CountSpaMarkers(uint8_t flags) {
    return __builtin_popcount(static_cast<unsigned int>(flags));
}

double GateScorer::Score(const GateFeatures& features) {
    double text_ratio = 0.0;
    double script_density = 0.0;
    if (features.html_bytes > 0) {
        const double html_bytes = static_cast<double>(features.html_bytes);
        text_ratio = static_cast<double>(features.visible_text_chars) / html_bytes;
        script_density = static_cast<double>(features.script_bytes) / html_bytes;
    }

    double s = Clamp(text_ratio * 1.2, 0.0, 0.6);
    s += Clamp(std::log(static_cast<double>(features.paragraph_count) + 1.0) * 0.06, 0.0, 0.3);
    if (features.article_tag_count > 0) {
        s += 0.15;
    }
    if (features.has_open_graph_title) {
        s += 0.08;
    }
    if (features.has_jsonld_article) {
        s += 0.12;
    }
    s -= Clamp(script_density * 0.8, 0.0, 0.4);
    if (CountSpaMarkers(features.spa_marker_flags) >= 2) {
        s -= 0.25;
    }
    s += (features.domain_prior - 0.5) * 0.1;

    return Clamp(s, 0.0, 1.0);
}

Decision GateScorer::Decide(const GateFeatures& features, double hi_threshold,
                            double lo_threshold) {
    const double s = Score(features);
    if (s >= hi_threshold) {
        return Decision::kRaw;
    }
    if (s <= lo_threshold || CountSpaMarkers(features.spa_marker_flags) >= 3) {
        return Decision::kHeadless;
    }
    return Decision::kProbesFirst;
}

GateFeatures GateScorer::SanitizeFeatures(GateFeatures features) {
    if (!std::isfinite(features.domain_prior)) {
        features.domain_prior = 0.5;
    }
    features.domain_prior = Clamp(features.domain_prior, 0.0, 1.0);
    return features;
}

} // namespace Sluice
