#include "errors.h"

#include <optional>

#include "absl/strings/cord.h"
#include "absl/types/optional.h"

namespace Sluice {

namespace {

constexpr char kErrorKindPayload[] = "type.sluice/error_kind";

} // namespace

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "none";
        case ErrorKind::kCircuitOpen: return "circuit_open";
        case ErrorKind::kPoolExhausted: return "pool_exhausted";
        case ErrorKind::kPoolCreationFailed: return "pool_creation_failed";
        case ErrorKind::kExtractionTimeout: return "extraction_timeout";
        case ErrorKind::kResourceLimitExceeded: return "resource_limit_exceeded";
        case ErrorKind::kEngineError: return "engine_error";
        case ErrorKind::kAllModesExhausted: return "all_modes_exhausted";
        case ErrorKind::kDeadlineExpired: return "deadline_expired";
        case ErrorKind::kInvalidConfig: return "invalid_config";
    }
    return "unknown";
}

absl::StatusCode CanonicalCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return absl::StatusCode::kOk;
        case ErrorKind::kCircuitOpen: return absl::StatusCode::kUnavailable;
        case ErrorKind::kPoolExhausted: return absl::StatusCode::kResourceExhausted;
        case ErrorKind::kPoolCreationFailed: return absl::StatusCode::kFailedPrecondition;
        case ErrorKind::kExtractionTimeout: return absl::StatusCode::kDeadlineExceeded;
        case ErrorKind::kResourceLimitExceeded: return absl::StatusCode::kResourceExhausted;
        case ErrorKind::kEngineError: return absl::StatusCode::kInternal;
        case ErrorKind::kAllModesExhausted: return absl::StatusCode::kAborted;
        case ErrorKind::kDeadlineExpired: return absl::StatusCode::kDeadlineExceeded;
        case ErrorKind::kInvalidConfig: return absl::StatusCode::kInvalidArgument;
    }
    return absl::StatusCode::kUnknown;
}

absl::Status MakeError(ErrorKind kind, std::string_view message) {
    if (kind == ErrorKind::kNone) {
        return absl::OkStatus();
    }
    absl::Status status(CanonicalCode(kind), absl::string_view(message.data(), message.size()));
    status.SetPayload(kErrorKindPayload, absl::Cord(ErrorKindName(kind)));
    return status;
}

ErrorKind GetErrorKind(const absl::Status& status) {
    if (status.ok()) {
        return ErrorKind::kNone;
    }
    absl::optional<absl::Cord> payload = status.GetPayload(kErrorKindPayload);
    if (!payload.has_value()) {
        return ErrorKind::kEngineError;
    }
    const std::string name(*payload);
    for (ErrorKind kind : {ErrorKind::kCircuitOpen, ErrorKind::kPoolExhausted,
                           ErrorKind::kPoolCreationFailed, ErrorKind::kExtractionTimeout,
                           ErrorKind::kResourceLimitExceeded, ErrorKind::kEngineError,
                           ErrorKind::kAllModesExhausted, ErrorKind::kDeadlineExpired,
                           ErrorKind::kInvalidConfig}) {
        if (name == ErrorKindName(kind)) {
            return kind;
        }
    }
    return ErrorKind::kEngineError;
}

bool IsTransient(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kCircuitOpen:
        case ErrorKind::kPoolExhausted:
        case ErrorKind::kPoolCreationFailed:
        case ErrorKind::kExtractionTimeout:
        case ErrorKind::kResourceLimitExceeded:
        case ErrorKind::kEngineError:
            return true;
        default:
            return false;
    }
}

} // namespace Sluice
