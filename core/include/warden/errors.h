#pragma once

#include <stdexcept>
#include <string>

namespace warden {

enum class ErrorKind {
    VALIDATION,
    ALREADY_EXISTS,
    NOT_FOUND,
    AUTHORIZATION,
    INVALID_TRANSITION,
    CONFLICT,
    EXECUTION_TIMEOUT,
    EXECUTION_FAILURE,
    DISCLOSURE,
    STORAGE,
};

const char* error_kind_name(ErrorKind k);

// Every operation of the governance core reports failures by throwing Error.
// what() carries "<kind>: <message>"; message() carries the message alone.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }

private:
    ErrorKind kind_;
    std::string message_;
};

} // namespace warden
