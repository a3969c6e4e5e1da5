#include "browser/page_navigation.hpp"
#include "browser/driver_error.hpp"
#include "protocol/cdp_message.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>

namespace page_navigation {

static const char *kLifecycleEvent = "Page.lifecycleEvent";
static const char *kFrameNavigated = "Page.frameNavigated";
static const char *kNavigatedWithinDocument = "Page.navigatedWithinDocument";

// Slice length for the navigation wait, so a closed connection is noticed
// before the full timeout.
static const int kWaitSliceMilliseconds = 100;

static std::string string_field(const json &object, const char *key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

Page::Page(std::shared_ptr<cdp_transport::Connection> connection, int call_timeout_milliseconds)
    : connection_(std::move(connection)), call_timeout_milliseconds_(call_timeout_milliseconds) {}

std::unique_ptr<Page> Page::attach(const std::shared_ptr<cdp_transport::Connection> &connection,
                                   int call_timeout_milliseconds) {
    std::unique_ptr<Page> page(new Page(connection, call_timeout_milliseconds));

    // Get initial main frame.
    json frame_tree = connection->invoke("Page.getFrameTree", json::object(), call_timeout_milliseconds);
    if (frame_tree.contains("frameTree") && frame_tree["frameTree"].contains("frame")) {
        page->main_frame_id_ = string_field(frame_tree["frameTree"]["frame"], "id");
    }
    if (page->main_frame_id_.empty()) {
        throw driver_error::protocol_error(cdp_message::SERVER_ERROR, "Page.getFrameTree returned no main frame");
    }

    Page *raw_page = page.get();
    page->subscription_ = connection->subscribe(
        {kLifecycleEvent, kFrameNavigated},
        [raw_page](const std::string &method, const json &params) { raw_page->handle_event(method, params); });

    // The destructor removes the subscription if enabling fails.
    json lifecycle_params;
    lifecycle_params["enabled"] = true;
    connection->invoke("Page.enable", json::object(), call_timeout_milliseconds);
    connection->invoke("Page.setLifecycleEventsEnabled", lifecycle_params, call_timeout_milliseconds);

    debug_log::log("Page attached, main frame = " + page->main_frame_id_);
    return page;
}

Page::~Page() {
    detach();
}

void Page::detach() noexcept {
    std::shared_ptr<cdp_transport::Subscription> subscription;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        subscription.swap(subscription_);
    }
    if (subscription) {
        subscription->unsubscribe();
    }
}

std::string Page::main_frame_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return main_frame_id_;
}

std::set<std::string> Page::lifecycle_events() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return lifecycle_events_;
}

void Page::handle_event(const std::string &method, const json &params) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (method == kLifecycleEvent) {
        if (string_field(params, "frameId") != main_frame_id_) {
            return;
        }
        std::string name = string_field(params, "name");
        if (name == "init") {
            lifecycle_events_.clear();
        } else {
            lifecycle_events_.insert(name);
        }
    } else if (method == kFrameNavigated) {
        if (!params.contains("frame")) {
            return;
        }
        const json &frame = params["frame"];
        if (frame.contains("parentId") && !frame["parentId"].is_null()) {
            return;
        }
        std::string frame_id = string_field(frame, "id");
        if (!frame_id.empty() && frame_id != main_frame_id_) {
            debug_log::log("Main frame changed: " + main_frame_id_ + " -> " + frame_id);
            main_frame_id_ = frame_id;
            lifecycle_events_.clear();
        }
    }
}

void Page::navigate(const std::function<void()> &op, int timeout_milliseconds) {
    if (timeout_milliseconds < 0) {
        throw driver_error::usage_error("Navigation timeout must be a positive integer or zero");
    }

    struct LoadSignal {
        std::mutex mutex;
        std::condition_variable condition;
        bool loaded = false;
    };
    auto signal = std::make_shared<LoadSignal>();

    auto subscription = connection_->subscribe(
        {kLifecycleEvent, kNavigatedWithinDocument}, [this, signal](const std::string &method, const json &params) {
            std::string frame_id = string_field(params, "frameId");
            if (frame_id != main_frame_id()) {
                return;
            }
            if (method == kLifecycleEvent && string_field(params, "name") != "load") {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(signal->mutex);
                signal->loaded = true;
            }
            signal->condition.notify_all();
        });
    cdp_transport::ScopedSubscription subscription_guard(subscription);

    op();
    if (timeout_milliseconds == 0) {
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
    std::unique_lock<std::mutex> lock(signal->mutex);
    while (!signal->loaded) {
        if (!connection_->is_open()) {
            throw driver_error::connection_error("Chrome DevTools were closed while waiting for page load");
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw driver_error::timeout_error("page load of main frame " + main_frame_id(), "", nullptr);
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(std::chrono::milliseconds(kWaitSliceMilliseconds),
                                                                   deadline - now);
        signal->condition.wait_for(lock, slice);
    }
    debug_log::log("Navigation finished, main frame = " + main_frame_id());
}

void Page::navigate_to(const std::string &url, int timeout_milliseconds) {
    navigate(
        [this, &url]() {
            json navigate_params;
            navigate_params["url"] = url;
            json navigate_result = connection_->invoke("Page.navigate", navigate_params, call_timeout_milliseconds_);
            std::string error_text = string_field(navigate_result, "errorText");
            if (!error_text.empty()) {
                throw driver_error::protocol_error(cdp_message::SERVER_ERROR,
                                                   "Navigation to " + url + " failed: " + error_text);
            }
        },
        timeout_milliseconds);
}

NavigationHistory Page::history() {
    json history_response = connection_->invoke("Page.getNavigationHistory", json::object(), call_timeout_milliseconds_);
    if (!history_response.contains("currentIndex") || !history_response["currentIndex"].is_number_integer() ||
        !history_response.contains("entries") || !history_response["entries"].is_array()) {
        throw driver_error::protocol_error(cdp_message::SERVER_ERROR,
                                           "Page.getNavigationHistory returned unexpected response");
    }

    NavigationHistory result;
    result.current_index = history_response["currentIndex"].get<int>();
    for (const auto &entry : history_response["entries"]) {
        NavigationHistoryEntry history_entry;
        if (entry.contains("id") && entry["id"].is_number_integer()) {
            history_entry.id = entry["id"].get<int>();
        }
        history_entry.url = string_field(entry, "url");
        history_entry.title = string_field(entry, "title");
        result.entries.push_back(history_entry);
    }
    return result;
}

bool Page::navigate_to_history_offset(int offset, int timeout_milliseconds) {
    NavigationHistory navigation_history = history();
    int target_index = navigation_history.current_index + offset;
    if (target_index < 0 || target_index >= static_cast<int>(navigation_history.entries.size())) {
        debug_log::log(offset < 0 ? "No back history" : "No forward history");
        return false;
    }

    int entry_id = navigation_history.entries[target_index].id;
    navigate(
        [this, entry_id]() {
            json nav_params;
            nav_params["entryId"] = entry_id;
            connection_->invoke("Page.navigateToHistoryEntry", nav_params, call_timeout_milliseconds_);
        },
        timeout_milliseconds);
    return true;
}

bool Page::back(int timeout_milliseconds) {
    return navigate_to_history_offset(-1, timeout_milliseconds);
}

bool Page::forward(int timeout_milliseconds) {
    return navigate_to_history_offset(1, timeout_milliseconds);
}

void Page::reload(int timeout_milliseconds) {
    navigate([this]() { connection_->invoke("Page.reload", json::object(), call_timeout_milliseconds_); },
             timeout_milliseconds);
}

} // namespace page_navigation
