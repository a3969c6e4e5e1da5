#ifndef CDPSYNC_PAGE_NAVIGATION_HPP
#define CDPSYNC_PAGE_NAVIGATION_HPP

// Blocking page navigation.
// Tracks the main frame of one page and turns its asynchronous lifecycle
// events into calls that return once the new document has loaded.

#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "browser/cdp/cdp_transport.hpp"

namespace page_navigation {

using json = nlohmann::json;

// One entry in the page's navigation history (from Page.getNavigationHistory).
struct NavigationHistoryEntry {
    int id = 0;
    std::string url;
    std::string title;
};

struct NavigationHistory {
    int current_index = 0;
    std::vector<NavigationHistoryEntry> entries;
};

class Page {
public:
    // Read the initial main frame, start tracking lifecycle events and enable
    // them. call_timeout_milliseconds bounds each command sent by the page.
    static std::unique_ptr<Page> attach(const std::shared_ptr<cdp_transport::Connection> &connection,
                                        int call_timeout_milliseconds);

    ~Page();

    Page(const Page &) = delete;
    Page &operator=(const Page &) = delete;

    // Remove the lifecycle subscription. Safe to call more than once.
    void detach() noexcept;

    std::string main_frame_id() const;

    // Lifecycle events seen for the current main frame since its last "init".
    std::set<std::string> lifecycle_events() const;

    // Run op, then block until the main frame fires "load" or navigates within
    // the document. The listener is registered before op runs and removed on
    // every exit path. timeout_milliseconds == 0 runs op without waiting.
    // Throws TimeoutError when the deadline passes first.
    void navigate(const std::function<void()> &op, int timeout_milliseconds);

    // Page.navigate. A navigation the browser reports as failed (errorText)
    // throws ProtocolError.
    void navigate_to(const std::string &url, int timeout_milliseconds);

    // Return false without blocking when there is no entry in that direction.
    bool back(int timeout_milliseconds);
    bool forward(int timeout_milliseconds);

    void reload(int timeout_milliseconds);

    NavigationHistory history();

    // Apply one Page event. Called from the dispatch thread.
    void handle_event(const std::string &method, const json &params);

private:
    Page(std::shared_ptr<cdp_transport::Connection> connection, int call_timeout_milliseconds);

    bool navigate_to_history_offset(int offset, int timeout_milliseconds);

    std::shared_ptr<cdp_transport::Connection> connection_;
    int call_timeout_milliseconds_;

    mutable std::mutex state_mutex_;
    std::string main_frame_id_;
    std::set<std::string> lifecycle_events_;

    std::shared_ptr<cdp_transport::Subscription> subscription_;
};

} // namespace page_navigation

#endif // CDPSYNC_PAGE_NAVIGATION_HPP
