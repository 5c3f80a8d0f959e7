#include "admit/result.hpp"

namespace admit {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "none";
        case ErrorKind::PolicyViolation:     return "policy_violation";
        case ErrorKind::StructuralViolation: return "structural_violation";
        case ErrorKind::ResourceExceeded:    return "resource_exceeded";
        case ErrorKind::HeuristicFlag:       return "heuristic_flag";
        case ErrorKind::ConcurrencyConflict: return "concurrency_conflict";
        case ErrorKind::StorageFailure:      return "storage_failure";
        case ErrorKind::NotFound:            return "not_found";
        case ErrorKind::InvalidArgument:     return "invalid_argument";
        case ErrorKind::ConfigError:         return "config_error";
    }
    return "none";
}

} // namespace admit
