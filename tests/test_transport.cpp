// Tests for the CDP transport: call correlation, disconnect, and event
// subscriptions. Runs against the loopback socket; no browser needed.

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "browser/cdp/cdp_transport.hpp"
#include "browser/driver_error.hpp"
#include "loopback_socket.hpp"

using json = nlohmann::json;

namespace test_transport {

static const int kCallTimeoutMilliseconds = 2000;

// Poll predicate until it holds or timeout_milliseconds pass.
static bool eventually(const std::function<bool()> &predicate, int timeout_milliseconds = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

static bool report(bool success, const std::string &ok_message, const std::string &fail_message) {
    if (success) {
        std::cout << "  OK: " << ok_message << std::endl;
    } else {
        std::cout << "  FAIL: " << fail_message << std::endl;
    }
    return success;
}

// Test: A simple call returns the browser's result object.
static bool test_invoke_returns_result() {
    auto loopback = test_support::open_loopback();
    json result = loopback.connection->invoke("Network.enable", json::object(), kCallTimeoutMilliseconds);
    std::vector<json> sent = loopback.socket->sent_with_method("Network.enable");
    bool success = result.is_object() && result.empty() && sent.size() == 1 && sent[0]["params"].is_object() &&
                   loopback.connection->pending_call_count() == 0;
    return report(success, "invoke(Network.enable) returns {}", "unexpected result: " + result.dump());
}

// Test: Replies arriving in reverse order still reach their own callers.
static bool test_out_of_order_replies() {
    auto loopback = test_support::open_loopback([](test_support::LoopbackSocket &socket) {
        socket.hold("Test.first");
        socket.hold("Test.second");
    });

    json first_result;
    json second_result;
    std::thread first_caller([&]() {
        first_result = loopback.connection->invoke("Test.first", json::object(), kCallTimeoutMilliseconds);
    });
    std::thread second_caller([&]() {
        second_result = loopback.connection->invoke("Test.second", json::object(), kCallTimeoutMilliseconds);
    });

    json first_command = loopback.socket->wait_for_sent("Test.first", 1, kCallTimeoutMilliseconds);
    json second_command = loopback.socket->wait_for_sent("Test.second", 1, kCallTimeoutMilliseconds);
    if (!first_command.is_null() && !second_command.is_null()) {
        loopback.socket->reply(second_command, json{{"answer", "second"}});
        loopback.socket->reply(first_command, json{{"answer", "first"}});
    }
    first_caller.join();
    second_caller.join();

    bool success = first_result.value("answer", "") == "first" && second_result.value("answer", "") == "second" &&
                   first_command["id"] != second_command["id"];
    return report(success, "Out-of-order replies are correlated by id",
                  "got first=" + first_result.dump() + " second=" + second_result.dump());
}

// Test: An error response raises ProtocolError with the remote code.
static bool test_error_response_raises_protocol_error() {
    auto loopback = test_support::open_loopback([](test_support::LoopbackSocket &socket) {
        socket.set_error("DOM.describeNode", -32000, "No node with given id found");
    });
    bool success = false;
    try {
        loopback.connection->invoke("DOM.describeNode", json{{"nodeId", 5}}, kCallTimeoutMilliseconds);
    } catch (const driver_error::DriverError &error) {
        success = error.kind() == driver_error::ErrorKind::Protocol && error.code() == -32000 &&
                  std::string(error.what()).find("No node with given id found") != std::string::npos &&
                  !error.retryable();
    }
    return report(success, "Error response raises ProtocolError with code", "ProtocolError not raised as expected");
}

// Test: disconnect() releases a caller blocked without a deadline.
static bool test_disconnect_resolves_pending_calls() {
    auto loopback = test_support::open_loopback([](test_support::LoopbackSocket &socket) {
        socket.hold("Page.navigate");
    });

    std::atomic<bool> got_connection_error{false};
    std::thread caller([&]() {
        try {
            loopback.connection->invoke("Page.navigate", json{{"url", "about:blank"}}, 0);
        } catch (const driver_error::DriverError &error) {
            got_connection_error = error.kind() == driver_error::ErrorKind::Connection;
        }
    });
    loopback.socket->wait_for_sent("Page.navigate", 1, kCallTimeoutMilliseconds);
    loopback.connection->disconnect();
    caller.join();

    bool rejected_after = false;
    try {
        loopback.connection->invoke("Page.enable", json::object(), kCallTimeoutMilliseconds);
    } catch (const driver_error::DriverError &error) {
        rejected_after = error.kind() == driver_error::ErrorKind::Connection;
    }

    bool success = got_connection_error && rejected_after && !loopback.connection->is_open() &&
                   loopback.connection->pending_call_count() == 0;
    return report(success, "disconnect() fails pending and later calls with ConnectionError",
                  "pending call was not released by disconnect()");
}

// Test: A peer-side close fails the waiting call instead of hanging.
static bool test_remote_close_resolves_pending_calls() {
    auto loopback = test_support::open_loopback([](test_support::LoopbackSocket &socket) {
        socket.on_command("Runtime.evaluate", [](test_support::LoopbackSocket &peer, const json &) {
            peer.simulate_remote_close();
        });
    });

    bool success = false;
    try {
        loopback.connection->invoke("Runtime.evaluate", json{{"expression", "1"}}, 0);
    } catch (const driver_error::DriverError &error) {
        success = error.kind() == driver_error::ErrorKind::Connection &&
                  std::string(error.what()).find("closed") != std::string::npos;
    }
    success = success && loopback.socket->close_fired() && !loopback.connection->is_open();
    return report(success, "Remote close fails the pending call", "pending call did not fail on remote close");
}

// Test: A response arriving after its caller timed out is dropped.
static bool test_late_response_dropped() {
    auto loopback = test_support::open_loopback([](test_support::LoopbackSocket &socket) {
        socket.hold("Slow.method");
    });

    bool timed_out = false;
    try {
        loopback.connection->invoke("Slow.method", json::object(), 50);
    } catch (const driver_error::DriverError &error) {
        timed_out = error.kind() == driver_error::ErrorKind::Connection &&
                    std::string(error.what()).find("Timed out") != std::string::npos;
    }
    json late_command = loopback.socket->wait_for_sent("Slow.method", 1, kCallTimeoutMilliseconds);
    loopback.socket->reply(late_command, json{{"late", true}});

    // The connection keeps working and the next call gets its own answer.
    json next_result = loopback.connection->invoke("Page.enable", json::object(), kCallTimeoutMilliseconds);
    bool success = timed_out && next_result.empty() && loopback.connection->pending_call_count() == 0;
    return report(success, "Late response after timeout is dropped", "late response handling is wrong");
}

// Test: Subscribers receive event params in registration order.
static bool test_subscribe_delivers_params() {
    auto loopback = test_support::open_loopback();
    std::mutex seen_mutex;
    std::vector<std::string> seen;

    auto first = loopback.connection->subscribe({"Page.lifecycleEvent"}, [&](const std::string &, const json &params) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back("first:" + params.value("name", ""));
    });
    auto second = loopback.connection->subscribe({"Page.lifecycleEvent"}, [&](const std::string &, const json &params) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back("second:" + params.value("name", ""));
    });
    loopback.socket->emit_event("Page.lifecycleEvent", json{{"name", "load"}, {"frameId", "F1"}});
    loopback.socket->emit_event("Page.frameNavigated", json{{"frame", {{"id", "F1"}}}});

    bool delivered = eventually([&]() {
        std::lock_guard<std::mutex> lock(seen_mutex);
        return seen.size() >= 2;
    });
    // Let any stray delivery of the unsubscribed method show up.
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    std::lock_guard<std::mutex> lock(seen_mutex);
    bool success = delivered && seen.size() == 2 && seen[0] == "first:load" && seen[1] == "second:load";
    return report(success, "Subscribers see params in registration order", "unexpected deliveries");
}

// Test: Unsubscribing from inside the callback stops further deliveries.
static bool test_unsubscribe_from_callback() {
    auto loopback = test_support::open_loopback();
    std::atomic<int> call_count{0};
    std::atomic<int> other_count{0};
    std::shared_ptr<cdp_transport::Subscription> subscription;
    std::mutex subscription_mutex;

    {
        std::lock_guard<std::mutex> lock(subscription_mutex);
        subscription = loopback.connection->subscribe({"Test.tick"}, [&](const std::string &, const json &) {
            call_count++;
            std::lock_guard<std::mutex> inner_lock(subscription_mutex);
            subscription->unsubscribe();
        });
    }
    auto other = loopback.connection->subscribe({"Test.tick"}, [&](const std::string &, const json &) {
        other_count++;
    });

    for (int tick = 0; tick < 3; ++tick) {
        loopback.socket->emit_event("Test.tick", json{{"n", tick}});
    }
    bool others_done = eventually([&]() { return other_count.load() == 3; });

    bool success = others_done && call_count.load() == 1 && !subscription->is_active() && other->is_active();
    return report(success, "Unsubscribe inside callback stops delivery",
                  "callback ran " + std::to_string(call_count.load()) + " times");
}

// Test: unsubscribe() from another thread waits for a running callback.
static bool test_unsubscribe_waits_for_running_callback() {
    auto loopback = test_support::open_loopback();
    std::atomic<bool> callback_started{false};
    std::atomic<bool> callback_finished{false};

    auto subscription = loopback.connection->subscribe({"Test.slow"}, [&](const std::string &, const json &) {
        callback_started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        callback_finished = true;
    });
    loopback.socket->emit_event("Test.slow", json::object());
    bool started = eventually([&]() { return callback_started.load(); });

    subscription->unsubscribe();
    bool finished_before_return = callback_finished.load();

    bool success = started && finished_before_return && !subscription->is_active() &&
                   loopback.connection->listener_count("Test.slow") == 0;
    return report(success, "unsubscribe() returns only after the running callback finished",
                  "unsubscribe() returned while the callback was still running");
}

// Test: A throwing callback does not stop delivery to the others.
static bool test_callback_exception_isolated() {
    auto loopback = test_support::open_loopback();
    std::atomic<int> healthy_count{0};

    auto failing = loopback.connection->subscribe({"Test.event"}, [](const std::string &, const json &) {
        throw std::runtime_error("listener failure");
    });
    auto healthy = loopback.connection->subscribe({"Test.event"}, [&](const std::string &, const json &) {
        healthy_count++;
    });
    loopback.socket->emit_event("Test.event", json::object());
    loopback.socket->emit_event("Test.event", json::object());

    bool success = eventually([&]() { return healthy_count.load() == 2; }) && failing->is_active();
    return report(success, "Throwing callback is logged and isolated", "healthy subscriber missed events");
}

// Test: subscribe() rejects empty method sets and invoke() rejects empty methods.
static bool test_usage_errors() {
    auto loopback = test_support::open_loopback();
    bool subscribe_rejected = false;
    bool invoke_rejected = false;
    try {
        loopback.connection->subscribe({}, [](const std::string &, const json &) {});
    } catch (const driver_error::DriverError &error) {
        subscribe_rejected = error.kind() == driver_error::ErrorKind::Usage;
    }
    try {
        loopback.connection->invoke("", json::object(), kCallTimeoutMilliseconds);
    } catch (const driver_error::DriverError &error) {
        invoke_rejected = error.kind() == driver_error::ErrorKind::Usage;
    }
    return report(subscribe_rejected && invoke_rejected, "Empty method sets and names raise UsageError",
                  "usage errors were not raised");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_invoke_returns_result();
    all_passed &= test_out_of_order_replies();
    all_passed &= test_error_response_raises_protocol_error();
    all_passed &= test_disconnect_resolves_pending_calls();
    all_passed &= test_remote_close_resolves_pending_calls();
    all_passed &= test_late_response_dropped();
    all_passed &= test_subscribe_delivers_params();
    all_passed &= test_unsubscribe_from_callback();
    all_passed &= test_unsubscribe_waits_for_running_callback();
    all_passed &= test_callback_exception_isolated();
    all_passed &= test_usage_errors();
    return all_passed;
}

} // namespace test_transport
