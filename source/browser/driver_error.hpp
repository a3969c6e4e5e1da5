#ifndef CDPSYNC_DRIVER_ERROR_HPP
#define CDPSYNC_DRIVER_ERROR_HPP

// Error taxonomy shared by every cdpsync module.
// A single exception type carries its kind and an explicit retryable flag;
// the retry engine consults retryable() on each attempt instead of matching
// on exception subclasses.

#include <exception>
#include <stdexcept>
#include <string>

namespace driver_error {

enum class ErrorKind {
    Connection,  // handshake failure, call timeout, transport closed
    Protocol,    // remote call answered with {error: {code, message}}
    StaleHandle, // remote node/object no longer exists
    Script,      // page-side script threw or returned an unsupported value
    Timeout,     // wait/retry deadline exceeded
    Usage        // caller passed something the driver cannot send
};

// Returns "ConnectionError", "ProtocolError", ... for messages and tests.
const char *kind_name(ErrorKind kind);

class DriverError : public std::runtime_error {
public:
    DriverError(ErrorKind kind, const std::string &message, bool retryable);

    ErrorKind kind() const { return kind_; }
    bool retryable() const { return retryable_; }

    // Remote error code for Protocol errors, 0 otherwise.
    long code() const { return code_; }

    // Timeout errors only: the waited expression, the printed last value
    // (empty when the operation only ever threw) and the last retryable
    // error observed before the deadline (null when none).
    const std::string &expression() const { return expression_; }
    const std::string &last_value() const { return last_value_; }
    std::exception_ptr last_error() const { return last_error_; }

    friend DriverError protocol_error(long code, const std::string &message);
    friend DriverError timeout_error(const std::string &expression, const std::string &last_value,
                                     std::exception_ptr last_error);

private:
    ErrorKind kind_;
    bool retryable_;
    long code_ = 0;
    std::string expression_;
    std::string last_value_;
    std::exception_ptr last_error_;
};

DriverError connection_error(const std::string &message);
DriverError protocol_error(long code, const std::string &message);
DriverError stale_handle_error(const std::string &message = "Tried to access a stale remote object handle");
DriverError script_error(const std::string &description);
DriverError usage_error(const std::string &message);

// Message: "Timeout exceeded while waiting for truthy value from expression: <expression>"
// followed by the last value or last error when present.
DriverError timeout_error(const std::string &expression, const std::string &last_value,
                          std::exception_ptr last_error);

// Convenience predicates for catch sites and tests.
bool is_kind(const std::exception &error, ErrorKind kind);
bool is_retryable(const std::exception &error);

// Best-effort what() of a stored exception; "" for null.
std::string describe_exception(std::exception_ptr error);

} // namespace driver_error

#endif // CDPSYNC_DRIVER_ERROR_HPP
