#ifndef SLUICE_FEATURE_SCANNER_H_
#define SLUICE_FEATURE_SCANNER_H_

#include <cstddef>
#include <string_view>

#include "common/types.h"

namespace Sluice {

/**
 * Single-pass HTML signal scanner producing GateFeatures.
 *
 * This is a tag-level scan, not a parser: it tolerates malformed markup and
 * never fails. Tag and attribute matching is ASCII case-insensitive.
 */
class FeatureScanner {
public:
    // Inline script larger than this marks an oversized bundle.
    static constexpr size_t kOversizedInlineScriptBytes = 100 * 1024;
    // Share of the document taken by scripts that marks an oversized bundle.
    static constexpr double kOversizedScriptShare = 0.6;
    // Below this many visible characters a scripted page counts as SPA-only.
    static constexpr uint64_t kSpaOnlyTextChars = 200;

    static GateFeatures ScanHtml(std::string_view html, double domain_prior = 0.5);
};

} // namespace Sluice

#endif // SLUICE_FEATURE_SCANNER_H_
