#ifndef SLUICE_TYPES_H_
#define SLUICE_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Sluice {

/**
 * Extraction mode chosen by the gate, ordered cheapest to most expensive.
 * Escalation only ever moves towards Headless.
 */
enum class Decision : uint8_t {
    kRaw = 0,
    kProbesFirst = 1,
    kHeadless = 2,
};

constexpr int kNumDecisions = 3;

const char* ToString(Decision decision);
std::optional<Decision> ParseDecision(std::string_view name);

// Next stricter mode, or nullopt from Headless.
std::optional<Decision> NextStricter(Decision decision);

inline int ModeIndex(Decision decision) { return static_cast<int>(decision); }

// Bits of GateFeatures::spa_marker_flags.
enum SpaMarker : uint8_t {
    kSpaHydrationMarkers = 1 << 0,
    kSpaFrameworkRootDiv = 1 << 1,
    kSpaOversizedBundle = 1 << 2,
    kSpaOnlyContent = 1 << 3,
};

/**
 * Raw page signals the gate scores. Computed outside the gate (see
 * FeatureScanner) and immutable once built.
 */
struct GateFeatures {
    uint64_t html_bytes = 0;
    uint64_t visible_text_chars = 0;
    uint32_t paragraph_count = 0;
    uint32_t article_tag_count = 0;
    uint32_t heading_count = 0;
    uint64_t script_bytes = 0;
    bool has_open_graph_title = false;
    bool has_jsonld_article = false;
    uint8_t spa_marker_flags = 0;
    // Historical success rate for the page's domain, in [0,1].
    double domain_prior = 0.5;
};

struct ExtractedDocument {
    std::string url;
    std::optional<std::string> title;
    std::string text;
    std::optional<std::string> markdown;
    std::optional<std::string> byline;
    std::optional<std::string> description;
    std::vector<std::string> links;

    double quality_score = 0.0;
    Decision mode = Decision::kRaw;
    // Set when the result did not come from the initially chosen mode, or is
    // a low-quality probe kept as last resort.
    bool degraded = false;
    uint32_t attempts = 0;
};

struct ExtractionRequest {
    std::string url;
    std::string html;
    // When absent the extractor scans |html| itself.
    std::optional<GateFeatures> features;
    double domain_prior = 0.5;
};

} // namespace Sluice

#endif // SLUICE_TYPES_H_
