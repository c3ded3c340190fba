#ifndef SLUICE_PROBE_QUALITY_H_
#define SLUICE_PROBE_QUALITY_H_

#include "common/types.h"

namespace Sluice {

// Default minimum quality for a ProbesFirst result to be accepted.
constexpr double kDefaultProbeQualityThreshold = 0.6;

/**
 * Structural quality of an extracted document in [0,1]:
 *   title                          0.2
 *   text > 1000 chars / > 200      0.4 / 0.2
 *   markdown markers (#,*,[) > 5 / > 2   0.2 / 0.1
 *   byline, description, links     0.05 each
 */
double ProbeQuality(const ExtractedDocument& document);

} // namespace Sluice

#endif // SLUICE_PROBE_QUALITY_H_
