#include "browser/activity_tracker.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace activity_tracker {

static const char *kRequestWillBeSent = "Network.requestWillBeSent";
static const char *kResponseReceived = "Network.responseReceived";
static const char *kLoadingFailed = "Network.loadingFailed";
static const char *kFrameStartedLoading = "Page.frameStartedLoading";

static std::string string_field(const json &object, const char *key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

ActivityKind kind_from_resource_type(const std::string &resource_type) {
    if (resource_type == "Document") {
        return ActivityKind::Document;
    }
    if (resource_type == "XHR" || resource_type == "Fetch") {
        return ActivityKind::Xhr;
    }
    return ActivityKind::Other;
}

const char *kind_name(ActivityKind kind) {
    switch (kind) {
    case ActivityKind::Document:
        return "document";
    case ActivityKind::Xhr:
        return "xhr";
    case ActivityKind::Other:
        return "other";
    }
    return "other";
}

const std::vector<std::string> &ActivityTracker::tracked_methods() {
    static const std::vector<std::string> methods = {
        kRequestWillBeSent, kResponseReceived, kLoadingFailed, kFrameStartedLoading};
    return methods;
}

std::unique_ptr<ActivityTracker> ActivityTracker::init(const std::shared_ptr<cdp_transport::Connection> &connection,
                                                       int timeout_milliseconds) {
    std::unique_ptr<ActivityTracker> tracker(new ActivityTracker());
    ActivityTracker *raw_tracker = tracker.get();
    try {
        std::set<std::string> methods(tracked_methods().begin(), tracked_methods().end());
        auto subscription = connection->subscribe(methods, [raw_tracker](const std::string &method, const json &params) {
            raw_tracker->handle_event(method, params);
        });
        {
            std::lock_guard<std::mutex> lock(tracker->subscriptions_mutex_);
            tracker->subscriptions_.push_back(subscription);
        }
        connection->invoke("Page.enable", json::object(), timeout_milliseconds);
        connection->invoke("Network.enable", json::object(), timeout_milliseconds);
    } catch (...) {
        tracker->dispose();
        throw;
    }
    debug_log::log("Activity tracking started");
    return tracker;
}

ActivityTracker::~ActivityTracker() {
    dispose();
}

void ActivityTracker::dispose() noexcept {
    std::vector<std::shared_ptr<cdp_transport::Subscription>> subscriptions;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions.swap(subscriptions_);
    }
    for (const auto &subscription : subscriptions) {
        subscription->unsubscribe();
    }
}

std::vector<Activity> ActivityTracker::activities() const {
    std::lock_guard<std::mutex> lock(activities_mutex_);
    std::vector<Activity> snapshot;
    snapshot.reserve(activities_.size());
    for (const auto &activity_entry : activities_) {
        snapshot.push_back(activity_entry.second);
    }
    return snapshot;
}

void ActivityTracker::handle_event(const std::string &method, const json &params) {
    if (method == kRequestWillBeSent) {
        request_will_be_sent(params);
    } else if (method == kResponseReceived || method == kLoadingFailed) {
        request_finished(params);
    } else if (method == kFrameStartedLoading) {
        frame_started_loading(params);
    }
}

void ActivityTracker::request_will_be_sent(const json &params) {
    Activity activity;
    activity.request_id = string_field(params, "requestId");
    activity.kind = kind_from_resource_type(string_field(params, "type"));
    activity.frame_id = string_field(params, "frameId");
    if (params.contains("request")) {
        activity.url = string_field(params["request"], "url");
        activity.method = string_field(params["request"], "method");
    }
    if (activity.request_id.empty() || activity.kind == ActivityKind::Other) {
        return;
    }
    debug_log::log("Recorded activity - HTTP request will be sent, request-id = " + activity.request_id +
                   " kind = " + kind_name(activity.kind) + " url = " + activity.url);
    std::lock_guard<std::mutex> lock(activities_mutex_);
    activities_[activity.request_id] = std::move(activity);
}

void ActivityTracker::request_finished(const json &params) {
    std::string request_id = string_field(params, "requestId");
    std::lock_guard<std::mutex> lock(activities_mutex_);
    // Responses can race frame reloads; unknown ids are ignored.
    if (activities_.erase(request_id) > 0) {
        debug_log::log("Recorded activity - HTTP request finished, request-id = " + request_id);
    }
}

void ActivityTracker::frame_started_loading(const json &params) {
    std::string frame_id = string_field(params, "frameId");
    debug_log::log("Recorded activity - frame started loading, frame-id = " + frame_id);
    std::lock_guard<std::mutex> lock(activities_mutex_);
    for (auto activity_iterator = activities_.begin(); activity_iterator != activities_.end();) {
        if (activity_iterator->second.frame_id == frame_id) {
            activity_iterator = activities_.erase(activity_iterator);
        } else {
            ++activity_iterator;
        }
    }
}

bool is_subset_of(const std::vector<Activity> &current, const std::vector<Activity> &baseline) {
    return new_activities(current, baseline).empty();
}

std::vector<Activity> new_activities(const std::vector<Activity> &current, const std::vector<Activity> &baseline) {
    std::set<std::string> baseline_ids;
    for (const auto &activity : baseline) {
        baseline_ids.insert(activity.request_id);
    }
    std::vector<Activity> result;
    std::copy_if(current.begin(), current.end(), std::back_inserter(result),
                 [&baseline_ids](const Activity &activity) { return baseline_ids.count(activity.request_id) == 0; });
    return result;
}

} // namespace activity_tracker
