#ifndef SLUICE_ERRORS_H_
#define SLUICE_ERRORS_H_

#include <string>
#include <string_view>

#include "absl/status/status.h"

namespace Sluice {

/**
 * Failure taxonomy of the extraction core.
 *
 * Every error leaving a component is an absl::Status whose canonical code
 * matches the kind below; the kind itself travels as a status payload so
 * callers can tell PoolExhausted from ResourceLimitExceeded (both
 * RESOURCE_EXHAUSTED) without string matching.
 */
enum class ErrorKind {
    kNone,
    kCircuitOpen,
    kPoolExhausted,
    kPoolCreationFailed,
    kExtractionTimeout,
    kResourceLimitExceeded,
    kEngineError,
    kAllModesExhausted,
    kDeadlineExpired,
    kInvalidConfig,
};

const char* ErrorKindName(ErrorKind kind);

absl::StatusCode CanonicalCode(ErrorKind kind);

// Builds a status of the canonical code for |kind| tagged with |kind|.
absl::Status MakeError(ErrorKind kind, std::string_view message);

// kNone for OK statuses, kEngineError for untagged failures.
ErrorKind GetErrorKind(const absl::Status& status);

inline bool IsKind(const absl::Status& status, ErrorKind kind) {
    return GetErrorKind(status) == kind;
}

// Transient kinds are absorbed by retry/escalation and never reach callers
// on their own.
bool IsTransient(ErrorKind kind);

} // namespace Sluice

#endif // SLUICE_ERRORS_H_
