#include "errors.hpp"

namespace consent {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "OK";
        case ErrorKind::NotFound:         return "NOT_FOUND";
        case ErrorKind::InvalidState:     return "INVALID_STATE";
        case ErrorKind::Forbidden:        return "FORBIDDEN";
        case ErrorKind::Conflict:         return "CONFLICT";
        case ErrorKind::InvalidSignature: return "INVALID_SIGNATURE";
        case ErrorKind::ScopeExceeded:    return "SCOPE_EXCEEDED";
        case ErrorKind::Expired:          return "EXPIRED";
        case ErrorKind::AlreadyUsed:      return "ALREADY_USED";
        case ErrorKind::LockContention:   return "LOCK_CONTENTION";
        case ErrorKind::ChainBroken:      return "CHAIN_BROKEN";
        case ErrorKind::InvalidArgument:  return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::LockContention;
}

Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

} // namespace consent
