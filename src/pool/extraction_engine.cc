#include "extraction_engine.h"

#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace Sluice {

absl::Status ExecutionContext::CheckInterrupt() const {
    if (interrupted()) {
        return MakeError(ErrorKind::kExtractionTimeout, "execution interrupted at epoch deadline");
    }
    return absl::OkStatus();
}

absl::Status ExecutionContext::RequestMemory(size_t desired_total) {
    const size_t current = tracker_->CurrentBytes();
    if (desired_total <= current) {
        tracker_->MemoryShrunk(desired_total);
        return absl::OkStatus();
    }
    if (!tracker_->MemoryGrowing(current, desired_total)) {
        return MakeError(ErrorKind::kResourceLimitExceeded,
                         absl::StrCat("memory growth ", current, " -> ", desired_total,
                                      " bytes denied (limit ", tracker_->MemoryLimit(), ")"));
    }
    return absl::OkStatus();
}

} // namespace Sluice
