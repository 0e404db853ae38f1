#ifndef CONSENT_ERRORS_HPP
#define CONSENT_ERRORS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace consent {

// -----------------------------------------------------------------------------
// ErrorKind - every way a core operation can be rejected
// -----------------------------------------------------------------------------
enum class ErrorKind : uint8_t {
    None             = 0,
    NotFound         = 1,
    InvalidState     = 2,
    Forbidden        = 3,
    Conflict         = 4,
    InvalidSignature = 5,
    ScopeExceeded    = 6,
    Expired          = 7,
    AlreadyUsed      = 8,
    LockContention   = 9,   // retryable
    ChainBroken      = 10,  // incident, never auto-repaired
    InvalidArgument  = 11
};

// Stable upper-snake name, e.g. "SCOPE_EXCEEDED".
const char* error_kind_name(ErrorKind kind);

bool is_retryable(ErrorKind kind);

struct Error {
    ErrorKind   kind = ErrorKind::None;
    std::string message;
};

Error make_error(ErrorKind kind, std::string message);

// Thrown only by Result::value() on misuse.
class BadResultAccess : public std::logic_error {
public:
    explicit BadResultAccess(const std::string& msg) : std::logic_error(msg) {}
};

// -----------------------------------------------------------------------------
// Result<T> - a value or an Error
// -----------------------------------------------------------------------------
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        if (!value_) throw BadResultAccess(std::string("no value: ") + error_.message);
        return *value_;
    }
    T& value() & {
        if (!value_) throw BadResultAccess(std::string("no value: ") + error_.message);
        return *value_;
    }
    T&& value() && {
        if (!value_) throw BadResultAccess(std::string("no value: ") + error_.message);
        return std::move(*value_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

    const Error& error() const { return error_; }
    ErrorKind kind() const { return ok() ? ErrorKind::None : error_.kind; }

private:
    std::optional<T> value_;
    Error            error_;
};

// -----------------------------------------------------------------------------
// Status - success or an Error, no value
// -----------------------------------------------------------------------------
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status Ok() { return Status(); }

    bool ok() const { return error_.kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorKind kind() const { return error_.kind; }

private:
    Error error_;
};

} // namespace consent

#endif // CONSENT_ERRORS_HPP
