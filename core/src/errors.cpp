#include "warden/errors.h"

namespace warden {

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::VALIDATION:         return "ValidationError";
        case ErrorKind::ALREADY_EXISTS:     return "AlreadyExists";
        case ErrorKind::NOT_FOUND:          return "NotFoundError";
        case ErrorKind::AUTHORIZATION:      return "AuthorizationError";
        case ErrorKind::INVALID_TRANSITION: return "InvalidTransition";
        case ErrorKind::CONFLICT:           return "Conflict";
        case ErrorKind::EXECUTION_TIMEOUT:  return "ExecutionTimeout";
        case ErrorKind::EXECUTION_FAILURE:  return "ExecutionFailure";
        case ErrorKind::DISCLOSURE:         return "DisclosureError";
        case ErrorKind::STORAGE:            return "StorageError";
    }
    return "Error";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message),
      kind_(kind),
      message_(message) {}

} // namespace warden
