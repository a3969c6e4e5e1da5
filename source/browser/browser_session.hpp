#ifndef CDPSYNC_BROWSER_SESSION_HPP
#define CDPSYNC_BROWSER_SESSION_HPP

// One automated page: the connection, its navigation controller, activity
// tracker and handle registry, plus the settings every blocking call uses.
// Passed explicitly to the code that drives the page.

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "browser/activity_tracker.hpp"
#include "browser/cdp/cdp_transport.hpp"
#include "browser/js_runtime.hpp"
#include "browser/page_navigation.hpp"
#include "browser/remote_handle.hpp"
#include "browser/retry_engine.hpp"
#include "utils/settings.hpp"

namespace browser_session {

class BrowserSession {
public:
    // Connect to a page's DevTools WebSocket URL and set everything up.
    static std::unique_ptr<BrowserSession> open(const std::string &websocket_url, const settings::Settings &settings);

    // Same, over an already open connection. The session takes part ownership.
    static std::unique_ptr<BrowserSession> attach(std::shared_ptr<cdp_transport::Connection> connection,
                                                  const settings::Settings &settings);

    ~BrowserSession();

    BrowserSession(const BrowserSession &) = delete;
    BrowserSession &operator=(const BrowserSession &) = delete;

    const std::shared_ptr<cdp_transport::Connection> &connection() const { return connection_; }
    page_navigation::Page &page() { return *page_; }
    activity_tracker::ActivityTracker &tracker() { return *tracker_; }
    remote_handle::HandleRegistry &handles() { return *handles_; }
    const settings::Settings &session_settings() const { return settings_; }
    retry_engine::WaitOptions wait_options() const { return retry_engine::options_from(settings_); }

    // Run a page mutation and return once the network activity it caused has
    // finished.
    void run_mutation(const std::function<void()> &action);

    // Blocking navigation with the session's wait timeout.
    void navigate_to(const std::string &url);

    // Handle to the current document node.
    remote_handle::RemoteHandle document();

    // Exactly one node matching the CSS selector under from, or under the
    // document when from is null. Waits with the session's wait options.
    remote_handle::RemoteHandle find(const std::string &selector, const remote_handle::RemoteHandle *from = nullptr,
                                     std::optional<std::string> display_name = std::nullopt);

    // Every node matching the CSS selector right now; does not wait.
    std::vector<remote_handle::RemoteHandle> query(const std::string &selector,
                                                   const remote_handle::RemoteHandle *from = nullptr,
                                                   std::optional<std::string> display_name = std::nullopt);

    js_runtime::ExecutionTarget window() const { return js_runtime::ExecutionTarget::window(); }

    remote_handle::ResultValue exec_js(const js_runtime::ExecutionTarget &target, const std::string &code,
                                       const js_runtime::NamedArguments &arguments = {});
    remote_handle::ResultValue eval_js(const js_runtime::ExecutionTarget &target, const std::string &expression,
                                       const js_runtime::NamedArguments &arguments = {});

    // Release handles, stop tracking, detach the page and disconnect, in that
    // order. Safe to call more than once.
    void close() noexcept;

    bool is_closed() const { return closed_; }

private:
    BrowserSession(std::shared_ptr<cdp_transport::Connection> connection, const settings::Settings &settings);

    std::shared_ptr<cdp_transport::Connection> connection_;
    settings::Settings settings_;
    std::unique_ptr<page_navigation::Page> page_;
    std::unique_ptr<activity_tracker::ActivityTracker> tracker_;
    std::unique_ptr<remote_handle::HandleRegistry> handles_;
    bool closed_ = false;
};

} // namespace browser_session

#endif // CDPSYNC_BROWSER_SESSION_HPP
