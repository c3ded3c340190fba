#include "probe_quality.h"

#include <algorithm>

#include "absl/strings/ascii.h"

namespace Sluice {

double ProbeQuality(const ExtractedDocument& document) {
    double score = 0.0;

    if (document.title.has_value() && !absl::StripAsciiWhitespace(*document.title).empty()) {
        score += 0.2;
    }

    if (document.text.size() > 1000) {
        score += 0.4;
    } else if (document.text.size() > 200) {
        score += 0.2;
    }

    if (document.markdown.has_value()) {
        const std::string& markdown = *document.markdown;
        const auto markers = std::count_if(markdown.begin(), markdown.end(), [](char c) {
            return c == '#' || c == '*' || c == '[';
        });
        if (markers > 5) {
            score += 0.2;
        } else if (markers > 2) {
            score += 0.1;
        }
    }

    if (document.byline.has_value() && !document.byline->empty()) {
        score += 0.05;
    }
    if (document.description.has_value() && !document.description->empty()) {
        score += 0.05;
    }
    if (!document.links.empty()) {
        score += 0.05;
    }

    return std::min(score, 1.0);
}

} // namespace Sluice
