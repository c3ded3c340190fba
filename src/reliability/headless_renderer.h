#ifndef SLUICE_HEADLESS_RENDERER_H_
#define SLUICE_HEADLESS_RENDERER_H_

#include <string_view>

#include "absl/status/statusor.h"
#include "common/clock.h"
#include "common/types.h"

namespace Sluice {

/**
 * Out-of-process rendering fallback used only in Headless mode.
 * Implementations must return by |deadline|.
 */
class IHeadlessRenderer {
public:
    virtual ~IHeadlessRenderer() = default;

    virtual absl::StatusOr<ExtractedDocument> Render(std::string_view url,
                                                     std::string_view content,
                                                     TimePoint deadline) = 0;
};

} // namespace Sluice

#endif // SLUICE_HEADLESS_RENDERER_H_
