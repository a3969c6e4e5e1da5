#include "browser/retry_engine.hpp"
#include "utils/debug_log.hpp"

namespace retry_engine {

WaitOptions options_from(const settings::Settings &settings) {
    WaitOptions options;
    options.timeout_milliseconds = settings.wait_timeout_milliseconds;
    options.poll_interval_milliseconds = settings.poll_interval_milliseconds;
    return options;
}

void with_retry(const std::function<void()> &operation, const WaitOptions &options, const std::string &description) {
    wait(
        [&operation]() {
            operation();
            return true;
        },
        options, description);
}

static std::string describe_outstanding(const std::vector<activity_tracker::Activity> &activities) {
    std::string text;
    for (const auto &activity : activities) {
        if (!text.empty()) {
            text += ", ";
        }
        text += std::string(activity_tracker::kind_name(activity.kind)) + " " + activity.method + " " + activity.url;
    }
    return text;
}

void settle_after(const activity_tracker::ActivityTracker &tracker, const std::function<void()> &action,
                  const WaitOptions &options, int grace_milliseconds) {
    const std::vector<activity_tracker::Activity> baseline = tracker.activities();
    action();
    if (grace_milliseconds > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(grace_milliseconds));
    }

    std::vector<activity_tracker::Activity> outstanding;
    try {
        wait(
            [&tracker, &baseline, &outstanding]() {
                outstanding = activity_tracker::new_activities(tracker.activities(), baseline);
                return outstanding.empty();
            },
            options, "page activity settled after mutation");
    } catch (const driver_error::DriverError &error) {
        if (error.kind() != driver_error::ErrorKind::Timeout) {
            throw;
        }
        throw driver_error::timeout_error(error.expression(), "outstanding requests: " + describe_outstanding(outstanding),
                                          nullptr);
    }
    debug_log::log("settle_after: page activity settled");
}

} // namespace retry_engine
