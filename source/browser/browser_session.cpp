#include "browser/browser_session.hpp"
#include "browser/driver_error.hpp"
#include "protocol/cdp_message.hpp"
#include "utils/debug_log.hpp"

namespace browser_session {

using json = nlohmann::json;

BrowserSession::BrowserSession(std::shared_ptr<cdp_transport::Connection> connection,
                               const settings::Settings &settings)
    : connection_(std::move(connection)), settings_(settings) {}

std::unique_ptr<BrowserSession> BrowserSession::open(const std::string &websocket_url,
                                                     const settings::Settings &settings) {
    debug_log::log("Opening session: " + websocket_url);
    return attach(cdp_transport::connect(websocket_url, settings.connect_timeout_milliseconds), settings);
}

std::unique_ptr<BrowserSession> BrowserSession::attach(std::shared_ptr<cdp_transport::Connection> connection,
                                                       const settings::Settings &settings) {
    if (!connection) {
        throw driver_error::usage_error("Cannot attach a session without a connection");
    }
    // On failure the partially built session is closed by its destructor.
    std::unique_ptr<BrowserSession> session(new BrowserSession(std::move(connection), settings));
    const int call_timeout = settings.call_timeout_milliseconds;
    session->page_ = page_navigation::Page::attach(session->connection_, call_timeout);
    js_runtime::install_runtime(session->connection_, call_timeout);
    session->tracker_ = activity_tracker::ActivityTracker::init(session->connection_, call_timeout);
    session->handles_ = std::make_unique<remote_handle::HandleRegistry>(session->connection_, call_timeout);
    debug_log::log("Session ready, main frame = " + session->page_->main_frame_id());
    return session;
}

BrowserSession::~BrowserSession() {
    close();
}

void BrowserSession::run_mutation(const std::function<void()> &action) {
    retry_engine::settle_after(*tracker_, action, wait_options(), settings_.settle_grace_milliseconds);
}

void BrowserSession::navigate_to(const std::string &url) {
    page_->navigate_to(url, settings_.wait_timeout_milliseconds);
}

remote_handle::RemoteHandle BrowserSession::document() {
    json document_params;
    document_params["depth"] = 0;
    json response = connection_->invoke("DOM.getDocument", document_params, settings_.call_timeout_milliseconds);
    if (!response.contains("root") || !response["root"].contains("nodeId")) {
        throw driver_error::protocol_error(cdp_message::SERVER_ERROR, "DOM.getDocument returned no root node");
    }
    remote_handle::Lookup lookup;
    lookup.node_id = response["root"]["nodeId"].get<int>();
    std::optional<remote_handle::RemoteHandle> document_handle =
        handles_->wrap(lookup, nullptr, std::string("document"), std::nullopt);
    if (!document_handle) {
        throw driver_error::stale_handle_error("Document node could not be resolved");
    }
    return *document_handle;
}

remote_handle::RemoteHandle BrowserSession::find(const std::string &selector, const remote_handle::RemoteHandle *from,
                                                 std::optional<std::string> display_name) {
    if (from != nullptr) {
        return handles_->find(*from, selector, wait_options(), std::move(display_name));
    }
    return handles_->find(document(), selector, wait_options(), std::move(display_name));
}

std::vector<remote_handle::RemoteHandle> BrowserSession::query(const std::string &selector,
                                                               const remote_handle::RemoteHandle *from,
                                                               std::optional<std::string> display_name) {
    if (from != nullptr) {
        return handles_->query(*from, selector, std::move(display_name));
    }
    return handles_->query(document(), selector, std::move(display_name));
}

remote_handle::ResultValue BrowserSession::exec_js(const js_runtime::ExecutionTarget &target, const std::string &code,
                                                   const js_runtime::NamedArguments &arguments) {
    return js_runtime::exec_js(*handles_, target, code, arguments);
}

remote_handle::ResultValue BrowserSession::eval_js(const js_runtime::ExecutionTarget &target,
                                                   const std::string &expression,
                                                   const js_runtime::NamedArguments &arguments) {
    return js_runtime::eval_js(*handles_, target, expression, arguments);
}

void BrowserSession::close() noexcept {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (handles_ && connection_->is_open()) {
        try {
            handles_->release_all();
        } catch (const std::exception &error) {
            debug_log::warn(std::string("Could not release remote objects on close: ") + error.what());
        }
    }
    if (tracker_) {
        tracker_->dispose();
    }
    if (page_) {
        page_->detach();
    }
    // Joins the dispatch thread; no callback can reach the tracker or page
    // after this returns.
    connection_->disconnect();
    debug_log::log("Session closed");
}

} // namespace browser_session
