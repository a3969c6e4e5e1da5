// cdpsync cli
// Entry point: connect to one page's DevTools WebSocket, navigate it, and
// report what the page is doing.
//
// Usage: cdpsync_cli <ws://host:port/devtools/page/ID> [url]
// Report goes to stdout as JSON; logs go to stderr.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

#include "browser/browser_session.hpp"
#include "browser/driver_error.hpp"
#include "utils/debug_log.hpp"
#include "utils/settings.hpp"

using json = nlohmann::json;

static void print_usage() {
    std::cerr << "Usage: cdpsync_cli <websocket-url> [url]" << std::endl;
    std::cerr << "  websocket-url  DevTools page socket, e.g. ws://127.0.0.1:9222/devtools/page/<id>" << std::endl;
    std::cerr << "  url            page to load before reporting" << std::endl;
}

static json build_report(browser_session::BrowserSession &session) {
    json report;
    report["main_frame_id"] = session.page().main_frame_id();

    json lifecycle = json::array();
    for (const auto &event_name : session.page().lifecycle_events()) {
        lifecycle.push_back(event_name);
    }
    report["lifecycle_events"] = lifecycle;

    json activities = json::array();
    for (const auto &activity : session.tracker().activities()) {
        json activity_json;
        activity_json["request_id"] = activity.request_id;
        activity_json["kind"] = activity_tracker::kind_name(activity.kind);
        activity_json["method"] = activity.method;
        activity_json["url"] = activity.url;
        activities.push_back(activity_json);
    }
    report["outstanding_requests"] = activities;

    page_navigation::NavigationHistory history = session.page().history();
    json entries = json::array();
    for (const auto &entry : history.entries) {
        entries.push_back({{"id", entry.id}, {"url", entry.url}, {"title", entry.title}});
    }
    report["history"] = {{"current_index", history.current_index}, {"entries", entries}};

    remote_handle::RemoteHandle document = session.document();
    report["document"] = session.handles().describe(document);
    remote_handle::ResultValue title = session.eval_js(session.window(), "document.title");
    report["title"] = title.data;
    return report;
}

int main(int argc, char **argv) {
    std::cerr << "[cdpsync] cdpsync cli, build " << __DATE__ << " " << __TIME__ << std::endl;

    if (argc < 2 || argc > 3) {
        print_usage();
        return 2;
    }
    const std::string websocket_url = argv[1];
    settings::Settings session_settings = settings::from_environment();

    try {
        std::unique_ptr<browser_session::BrowserSession> session =
            browser_session::BrowserSession::open(websocket_url, session_settings);
        if (argc == 3) {
            const std::string target_url = argv[2];
            session->run_mutation([&session, &target_url]() { session->navigate_to(target_url); });
        }
        std::cout << build_report(*session).dump(2) << std::endl;
        session->close();
    } catch (const driver_error::DriverError &error) {
        std::cerr << "[cdpsync] " << driver_error::kind_name(error.kind()) << ": " << error.what() << std::endl;
        return 1;
    }
    return 0;
}
