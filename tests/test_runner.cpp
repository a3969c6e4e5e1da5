// Test runner: runs every cdpsync suite against in-process loopback pages and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_cdp_message {
    bool run_all_tests();
}

namespace test_settings {
    bool run_all_tests();
}

namespace test_transport {
    bool run_all_tests();
}

namespace test_lws_socket {
    bool run_all_tests();
}

namespace test_activity_tracker {
    bool run_all_tests();
}

namespace test_retry_engine {
    bool run_all_tests();
}

namespace test_remote_handle {
    bool run_all_tests();
}

namespace test_js_runtime {
    bool run_all_tests();
}

namespace test_navigation {
    bool run_all_tests();
}

namespace test_browser_session {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_cdp_message", test_cdp_message::run_all_tests},
        {"test_settings", test_settings::run_all_tests},
        {"test_transport", test_transport::run_all_tests},
        {"test_lws_socket", test_lws_socket::run_all_tests},
        {"test_activity_tracker", test_activity_tracker::run_all_tests},
        {"test_retry_engine", test_retry_engine::run_all_tests},
        {"test_remote_handle", test_remote_handle::run_all_tests},
        {"test_js_runtime", test_js_runtime::run_all_tests},
        {"test_navigation", test_navigation::run_all_tests},
        {"test_browser_session", test_browser_session::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== cdpsync Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
