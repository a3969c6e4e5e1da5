#ifndef CDPSYNC_RETRY_ENGINE_HPP
#define CDPSYNC_RETRY_ENGINE_HPP

// Retry/wait engine.
// Bridges asynchronous browser state to blocking caller code: an operation is
// re-evaluated until it yields a truthy value, retryable errors are absorbed,
// fatal errors propagate at once, and the deadline produces a TimeoutError
// naming the waited expression.

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>

#include "browser/activity_tracker.hpp"
#include "browser/driver_error.hpp"
#include "utils/settings.hpp"

namespace retry_engine {

struct WaitOptions {
    int timeout_milliseconds = 5000;
    int poll_interval_milliseconds = 50;
};

WaitOptions options_from(const settings::Settings &settings);

namespace detail {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T, typename = void>
struct is_streamable : std::false_type {};
template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream &>() << std::declval<const T &>())>>
    : std::true_type {};

} // namespace detail

// false, null pointers, empty optionals and JSON null/false are falsy.
// Every other value is truthy.
template <typename T>
bool is_truthy(const T &value) {
    if constexpr (std::is_same<T, bool>::value) {
        return value;
    } else if constexpr (std::is_same<T, nlohmann::json>::value) {
        return !(value.is_null() || (value.is_boolean() && !value.template get<bool>()));
    } else if constexpr (detail::is_optional<T>::value) {
        return value.has_value() && is_truthy(*value);
    } else if constexpr (std::is_pointer<T>::value) {
        return value != nullptr;
    } else if constexpr (std::is_constructible<bool, const T &>::value && !std::is_arithmetic<T>::value) {
        // shared_ptr, unique_ptr, std::function
        return static_cast<bool>(value);
    } else {
        return true;
    }
}

// Printed form of a waited value for timeout messages.
template <typename T>
std::string value_text(const T &value) {
    if constexpr (std::is_same<T, bool>::value) {
        return value ? "true" : "false";
    } else if constexpr (std::is_same<T, nlohmann::json>::value) {
        return value.dump();
    } else if constexpr (detail::is_optional<T>::value) {
        return value.has_value() ? value_text(*value) : "nullopt";
    } else if constexpr (std::is_pointer<T>::value) {
        return value == nullptr ? "nullptr" : "<pointer>";
    } else if constexpr (detail::is_streamable<T>::value) {
        std::ostringstream stream;
        stream << value;
        return stream.str();
    } else {
        return "<value>";
    }
}

// Re-evaluate operation until it returns a truthy value and return that value.
// Errors whose retryable() flag is set are remembered and retried; any other
// exception propagates immediately. After timeout_milliseconds a TimeoutError
// is thrown carrying expression, the last value and the last retryable error.
// Never blocks longer than the timeout plus one poll interval.
template <typename Operation>
auto wait(Operation &&operation, const WaitOptions &options, const std::string &expression)
    -> std::decay_t<decltype(operation())> {
    using Value = std::decay_t<decltype(operation())>;
    using clock = std::chrono::steady_clock;

    if (options.timeout_milliseconds < 0 || options.poll_interval_milliseconds < 0) {
        throw driver_error::usage_error("Expected timeout and poll interval to be positive integers or zero");
    }
    const auto start = clock::now();
    const auto deadline = start + std::chrono::milliseconds(options.timeout_milliseconds);
    std::string last_value;
    std::exception_ptr last_error;

    for (;;) {
        try {
            Value value = operation();
            if (is_truthy(value)) {
                return value;
            }
            last_value = value_text(value);
            last_error = nullptr;
        } catch (const driver_error::DriverError &error) {
            if (!error.retryable()) {
                throw;
            }
            last_error = std::current_exception();
        }

        const auto now = clock::now();
        if (now >= deadline) {
            throw driver_error::timeout_error(expression, last_value, last_error);
        }
        auto pause = std::min<clock::duration>(std::chrono::milliseconds(options.poll_interval_milliseconds),
                                               deadline - now);
        std::this_thread::sleep_for(pause);
    }
}

// Run a side-effecting operation until it completes without a retryable
// error. Same classification and deadline rules as wait().
void with_retry(const std::function<void()> &operation, const WaitOptions &options, const std::string &description);

// Mutation-settling policy: snapshot tracker activity, run action, pause for
// grace_milliseconds, then wait until no activity that was not already
// outstanding before the action remains.
void settle_after(const activity_tracker::ActivityTracker &tracker, const std::function<void()> &action,
                  const WaitOptions &options, int grace_milliseconds);

} // namespace retry_engine

// Waits for a truthy value of expr, using the source text of expr in the
// timeout message. options is a retry_engine::WaitOptions.
#define CDPSYNC_WAIT(options, expr) \
    ::retry_engine::wait([&]() { return (expr); }, (options), #expr)

#endif // CDPSYNC_RETRY_ENGINE_HPP
