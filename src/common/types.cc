#include "types.h"

#include "absl/strings/ascii.h"

namespace Sluice {

const char* ToString(Decision decision) {
    switch (decision) {
        case Decision::kRaw: return "raw";
        case Decision::kProbesFirst: return "probes_first";
        case Decision::kHeadless: return "headless";
    }
    return "unknown";
}

std::optional<Decision> ParseDecision(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lowered == "raw") return Decision::kRaw;
    if (lowered == "probes_first" || lowered == "probesfirst" || lowered == "probes") {
        return Decision::kProbesFirst;
    }
    if (lowered == "headless") return Decision::kHeadless;
    return std::nullopt;
}

std::optional<Decision> NextStricter(Decision decision) {
    switch (decision) {
        case Decision::kRaw: return Decision::kProbesFirst;
        case Decision::kProbesFirst: return Decision::kHeadless;
        case Decision::kHeadless: return std::nullopt;
    }
    return std::nullopt;
}

} // namespace Sluice
