#ifndef CDPSYNC_ACTIVITY_TRACKER_HPP
#define CDPSYNC_ACTIVITY_TRACKER_HPP

// Network/navigation activity tracking.
// Keeps the set of outstanding document and XHR/fetch requests, fed by
// Network and Page events. The set is the "is the page busy" signal used by
// the mutation-settling policy.

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "browser/cdp/cdp_transport.hpp"

namespace activity_tracker {

using json = nlohmann::json;

enum class ActivityKind { Document, Xhr, Other };

// Maps a CDP Network.ResourceType ("Document", "XHR", "Fetch", "Image", ...).
// Fetch requests count as XHR.
ActivityKind kind_from_resource_type(const std::string &resource_type);

const char *kind_name(ActivityKind kind);

// One outstanding request.
struct Activity {
    std::string request_id;
    ActivityKind kind = ActivityKind::Other;
    std::string url;
    std::string method; // HTTP method
    std::string frame_id;
};

class ActivityTracker {
public:
    // Enable the Network and Page domains and start listening.
    // On failure every subscription made so far is removed before rethrowing.
    static std::unique_ptr<ActivityTracker> init(const std::shared_ptr<cdp_transport::Connection> &connection,
                                                 int timeout_milliseconds);

    ~ActivityTracker();

    ActivityTracker(const ActivityTracker &) = delete;
    ActivityTracker &operator=(const ActivityTracker &) = delete;

    // Snapshot of outstanding activities, ordered by request id.
    std::vector<Activity> activities() const;

    // Stop listening. Never throws; safe to call more than once.
    void dispose() noexcept;

    // Apply one Network/Page event. Called from the dispatch thread; public so
    // recorded event streams can be replayed directly.
    void handle_event(const std::string &method, const json &params);

    // Event methods the tracker subscribes to.
    static const std::vector<std::string> &tracked_methods();

    // Detached tracker (no subscriptions); fed only through handle_event().
    ActivityTracker() = default;

private:
    void request_will_be_sent(const json &params);
    void request_finished(const json &params);
    void frame_started_loading(const json &params);

    mutable std::mutex activities_mutex_;
    std::map<std::string, Activity> activities_;

    std::mutex subscriptions_mutex_;
    std::vector<std::shared_ptr<cdp_transport::Subscription>> subscriptions_;
};

// True when every request id in current also appears in baseline.
bool is_subset_of(const std::vector<Activity> &current, const std::vector<Activity> &baseline);

// Activities in current whose request id is not in baseline.
std::vector<Activity> new_activities(const std::vector<Activity> &current, const std::vector<Activity> &baseline);

} // namespace activity_tracker

#endif // CDPSYNC_ACTIVITY_TRACKER_HPP
