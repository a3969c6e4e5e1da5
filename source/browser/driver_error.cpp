#include "browser/driver_error.hpp"

namespace driver_error {

const char *kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Connection:
        return "ConnectionError";
    case ErrorKind::Protocol:
        return "ProtocolError";
    case ErrorKind::StaleHandle:
        return "StaleHandleError";
    case ErrorKind::Script:
        return "ScriptError";
    case ErrorKind::Timeout:
        return "TimeoutError";
    case ErrorKind::Usage:
        return "UsageError";
    }
    return "DriverError";
}

DriverError::DriverError(ErrorKind kind, const std::string &message, bool retryable)
    : std::runtime_error(message), kind_(kind), retryable_(retryable) {}

DriverError connection_error(const std::string &message) {
    return DriverError(ErrorKind::Connection, message, false);
}

DriverError protocol_error(long code, const std::string &message) {
    DriverError error(ErrorKind::Protocol, message + " (code = " + std::to_string(code) + ")", false);
    error.code_ = code;
    return error;
}

DriverError stale_handle_error(const std::string &message) {
    return DriverError(ErrorKind::StaleHandle, message, true);
}

DriverError script_error(const std::string &description) {
    return DriverError(ErrorKind::Script, "JavaScript error:\n" + description, false);
}

DriverError usage_error(const std::string &message) {
    return DriverError(ErrorKind::Usage, message, false);
}

DriverError timeout_error(const std::string &expression, const std::string &last_value,
                          std::exception_ptr last_error) {
    std::string message = "Timeout exceeded while waiting for truthy value from expression: " + expression;
    if (last_error) {
        message += "\nLast error: " + describe_exception(last_error);
    } else if (!last_value.empty()) {
        message += "\nLast value: " + last_value;
    }
    DriverError error(ErrorKind::Timeout, message, false);
    error.expression_ = expression;
    error.last_value_ = last_value;
    error.last_error_ = last_error;
    return error;
}

bool is_kind(const std::exception &error, ErrorKind kind) {
    const auto *driver_failure = dynamic_cast<const DriverError *>(&error);
    return driver_failure != nullptr && driver_failure->kind() == kind;
}

bool is_retryable(const std::exception &error) {
    const auto *driver_failure = dynamic_cast<const DriverError *>(&error);
    return driver_failure != nullptr && driver_failure->retryable();
}

std::string describe_exception(std::exception_ptr error) {
    if (!error) {
        return "";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception &exception) {
        return exception.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace driver_error
