// Tests for the retry/wait engine and the mutation-settling policy.

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "browser/activity_tracker.hpp"
#include "browser/driver_error.hpp"
#include "browser/retry_engine.hpp"

using json = nlohmann::json;

namespace test_retry_engine {

static long elapsed_milliseconds(std::chrono::steady_clock::time_point start) {
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

static bool report(bool success, const std::string &ok_message, const std::string &fail_message) {
    if (success) {
        std::cout << "  OK: " << ok_message << std::endl;
    } else {
        std::cout << "  FAIL: " << fail_message << std::endl;
    }
    return success;
}

// Test: false, false, true returns true on the third attempt.
static bool test_returns_on_third_attempt() {
    retry_engine::WaitOptions options;
    options.timeout_milliseconds = 500;
    options.poll_interval_milliseconds = 50;

    int attempts = 0;
    auto start = std::chrono::steady_clock::now();
    bool value = retry_engine::wait([&attempts]() { return ++attempts >= 3; }, options, "third attempt");
    long elapsed = elapsed_milliseconds(start);

    bool success = value && attempts == 3 && elapsed < 500 + 50;
    return report(success, "wait() returns true on the third attempt",
                  "attempts=" + std::to_string(attempts) + " elapsed=" + std::to_string(elapsed) + " ms");
}

// Test: An always-false expression times out naming the expression.
static bool test_timeout_names_expression() {
    retry_engine::WaitOptions options;
    options.timeout_milliseconds = 200;
    options.poll_interval_milliseconds = 50;

    int counter = 0;
    auto start = std::chrono::steady_clock::now();
    bool success = false;
    try {
        CDPSYNC_WAIT(options, counter++ < 0);
    } catch (const driver_error::DriverError &error) {
        long elapsed = elapsed_milliseconds(start);
        std::string message = error.what();
        success = error.kind() == driver_error::ErrorKind::Timeout &&
                  message.find("counter++ < 0") != std::string::npos && error.expression() == "counter++ < 0" &&
                  error.last_value() == "false" && elapsed >= 200 && elapsed < 200 + 50 + 100;
    }
    return report(success, "Timeout message embeds the waited expression", "timeout error was not as expected");
}

// Test: A fatal error escapes at once instead of waiting out the deadline.
static bool test_fatal_error_propagates_immediately() {
    retry_engine::WaitOptions options;
    options.timeout_milliseconds = 2000;
    options.poll_interval_milliseconds = 50;

    int attempts = 0;
    auto start = std::chrono::steady_clock::now();
    bool success = false;
    try {
        retry_engine::wait(
            [&attempts]() -> bool {
                ++attempts;
                throw driver_error::script_error("TypeError: x is undefined");
            },
            options, "fatal");
    } catch (const driver_error::DriverError &error) {
        success = error.kind() == driver_error::ErrorKind::Script && attempts == 1 && elapsed_milliseconds(start) < 500;
    }
    return report(success, "Fatal error propagates without retry", "fatal error was retried or swallowed");
}

// Test: Stale handle errors are retried until the value shows up.
static bool test_retryable_error_retried() {
    retry_engine::WaitOptions options;
    options.timeout_milliseconds = 1000;
    options.poll_interval_milliseconds = 10;

    int attempts = 0;
    std::optional<std::string> value = retry_engine::wait(
        [&attempts]() -> std::optional<std::string> {
            if (++attempts < 3) {
                throw driver_error::stale_handle_error();
            }
            return std::string("ready");
        },
        options, "fresh node");
    bool success = value && *value == "ready" && attempts == 3;
    return report(success, "StaleHandleError is retried", "retryable error was not retried");
}

// Test: The last retryable error is attached to the timeout.
static bool test_timeout_carries_last_error() {
    retry_engine::WaitOptions options;
    options.timeout_milliseconds = 100;
    options.poll_interval_milliseconds = 20;

    bool success = false;
    try {
        retry_engine::with_retry([]() { throw driver_error::stale_handle_error("node went away"); }, options,
                                 "click on stale node");
    } catch (const driver_error::DriverError &error) {
        std::string message = error.what();
        success = error.kind() == driver_error::ErrorKind::Timeout && error.last_error() != nullptr &&
                  message.find("click on stale node") != std::string::npos &&
                  message.find("Last error: node went away") != std::string::npos;
    }
    return report(success, "with_retry timeout carries the last retryable error", "last error missing");
}

// Test: with_retry passes fatal errors through untouched.
static bool test_with_retry_fatal_passthrough() {
    retry_engine::WaitOptions options;
    int attempts = 0;
    bool success = false;
    try {
        retry_engine::with_retry(
            [&attempts]() {
                ++attempts;
                throw driver_error::usage_error("bad argument");
            },
            options, "usage");
    } catch (const driver_error::DriverError &error) {
        success = error.kind() == driver_error::ErrorKind::Usage && attempts == 1;
    }
    return report(success, "with_retry passes fatal errors through", "fatal error not passed through");
}

// Test: Falsy values of several types.
static bool test_truthiness() {
    std::optional<int> empty;
    std::optional<int> zero = 0;
    const char *null_text = nullptr;
    bool success = !retry_engine::is_truthy(false) && retry_engine::is_truthy(true) &&
                   !retry_engine::is_truthy(json(nullptr)) && !retry_engine::is_truthy(json(false)) &&
                   retry_engine::is_truthy(json(0)) && retry_engine::is_truthy(json::array()) &&
                   !retry_engine::is_truthy(empty) && retry_engine::is_truthy(zero) &&
                   !retry_engine::is_truthy(null_text) && retry_engine::is_truthy(std::string());
    return report(success, "Truthiness follows false/null/empty rules", "truthiness mismatch");
}

// Test: Negative deadlines are rejected.
static bool test_negative_options_rejected() {
    retry_engine::WaitOptions options;
    options.timeout_milliseconds = -1;
    bool success = false;
    try {
        retry_engine::wait([]() { return true; }, options, "negative");
    } catch (const driver_error::DriverError &error) {
        success = error.kind() == driver_error::ErrorKind::Usage;
    }
    return report(success, "Negative timeout raises UsageError", "negative timeout accepted");
}

// Test: settle_after() returns once the new request finishes.
static bool test_settle_after_waits_for_new_activity() {
    activity_tracker::ActivityTracker tracker;
    json already_running;
    already_running["requestId"] = "old";
    already_running["type"] = "XHR";
    already_running["frameId"] = "F1";
    tracker.handle_event("Network.requestWillBeSent", already_running);

    retry_engine::WaitOptions options;
    options.timeout_milliseconds = 2000;
    options.poll_interval_milliseconds = 10;

    std::thread finisher;
    auto start = std::chrono::steady_clock::now();
    bool success = false;
    try {
        retry_engine::settle_after(
            tracker,
            [&tracker, &finisher]() {
                json started;
                started["requestId"] = "new";
                started["type"] = "XHR";
                started["frameId"] = "F1";
                tracker.handle_event("Network.requestWillBeSent", started);
                finisher = std::thread([&tracker]() {
                    std::this_thread::sleep_for(std::chrono::milliseconds(150));
                    tracker.handle_event("Network.responseReceived", json{{"requestId", "new"}});
                });
            },
            options, 20);
        long elapsed = elapsed_milliseconds(start);
        // The pre-existing request does not hold up settling.
        success = elapsed >= 150 && tracker.activities().size() == 1;
    } catch (const driver_error::DriverError &error) {
        std::cout << "  FAIL: " << error.what() << std::endl;
    }
    if (finisher.joinable()) {
        finisher.join();
    }
    return report(success, "settle_after waits for activity started by the action", "settle_after returned early");
}

// Test: settle_after() times out naming the outstanding URL.
static bool test_settle_after_timeout_names_url() {
    activity_tracker::ActivityTracker tracker;
    retry_engine::WaitOptions options;
    options.timeout_milliseconds = 100;
    options.poll_interval_milliseconds = 10;

    bool success = false;
    try {
        retry_engine::settle_after(
            tracker,
            [&tracker]() {
                json started;
                started["requestId"] = "hang";
                started["type"] = "Fetch";
                started["frameId"] = "F1";
                started["request"]["url"] = "https://example.com/never";
                started["request"]["method"] = "POST";
                tracker.handle_event("Network.requestWillBeSent", started);
            },
            options, 0);
    } catch (const driver_error::DriverError &error) {
        std::string message = error.what();
        success = error.kind() == driver_error::ErrorKind::Timeout &&
                  message.find("https://example.com/never") != std::string::npos &&
                  message.find("POST") != std::string::npos;
    }
    return report(success, "settle_after timeout names the outstanding request", "settle timeout message wrong");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_returns_on_third_attempt();
    all_passed &= test_timeout_names_expression();
    all_passed &= test_fatal_error_propagates_immediately();
    all_passed &= test_retryable_error_retried();
    all_passed &= test_timeout_carries_last_error();
    all_passed &= test_with_retry_fatal_passthrough();
    all_passed &= test_truthiness();
    all_passed &= test_negative_options_rejected();
    all_passed &= test_settle_after_waits_for_new_activity();
    all_passed &= test_settle_after_timeout_names_url();
    return all_passed;
}

} // namespace test_retry_engine
