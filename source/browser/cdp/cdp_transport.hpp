#ifndef CDPSYNC_CDP_TRANSPORT_HPP
#define CDPSYNC_CDP_TRANSPORT_HPP

// CDP (Chrome DevTools Protocol) transport.
// Owns one WebSocket session to a browser page, correlates outgoing commands
// with their responses, and fans unsolicited events out to subscribers on a
// dedicated dispatch thread so slow callbacks never block the socket reader.

#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "browser/cdp/message_socket.hpp"

namespace cdp_transport {

using json = nlohmann::json;

// Receives the event method and its params. Runs on the dispatch thread.
using EventCallback = std::function<void(const std::string &method, const json &params)>;

struct EventHub;

// A registered event callback. Removable idempotently, also from inside the
// callback itself; no delivery starts after unsubscribe() returns. Called from
// any thread but the dispatch thread, unsubscribe() also waits for a delivery
// of this subscription that is already running.
class Subscription {
public:
    void unsubscribe();
    bool is_active() const { return active_.load(); }
    const std::set<std::string> &methods() const { return methods_; }

private:
    friend class Connection;
    friend void deliver_event(const std::shared_ptr<Subscription> &subscription,
                              const std::string &method, const json &params);

    Subscription(std::weak_ptr<EventHub> hub, std::set<std::string> methods, EventCallback callback);

    std::weak_ptr<EventHub> hub_;
    std::set<std::string> methods_;
    EventCallback callback_;
    std::atomic<bool> active_{true};
    // Held by the dispatch thread while it checks active_ and runs callback_.
    std::mutex delivery_mutex_;
};

// Removes the subscription when the guard goes out of scope.
class ScopedSubscription {
public:
    explicit ScopedSubscription(std::shared_ptr<Subscription> subscription)
        : subscription_(std::move(subscription)) {}
    ~ScopedSubscription() {
        if (subscription_) {
            subscription_->unsubscribe();
        }
    }
    ScopedSubscription(const ScopedSubscription &) = delete;
    ScopedSubscription &operator=(const ScopedSubscription &) = delete;

private:
    std::shared_ptr<Subscription> subscription_;
};

class Connection : public std::enable_shared_from_this<Connection> {
public:
    // Take ownership of an established socket and start the dispatch thread.
    static std::shared_ptr<Connection> open(std::unique_ptr<MessageSocket> socket);

    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Send a command and block until its response arrives.
    // Returns the response's result object. Throws ProtocolError for a remote
    // error response, ConnectionError on timeout or when the connection closes
    // first. timeout_milliseconds <= 0 waits without a deadline.
    // A timed-out call is forgotten locally; its late response is dropped.
    json invoke(const std::string &method, const json &params, int timeout_milliseconds);

    // Register callback for every event whose method is in methods.
    // Callbacks for the same event run in registration order.
    std::shared_ptr<Subscription> subscribe(const std::set<std::string> &methods, EventCallback callback);

    // Same as subscription->unsubscribe().
    void unsubscribe(const std::shared_ptr<Subscription> &subscription);

    // Close the socket, fail every pending call with a closed error, drop all
    // listeners and stop the dispatch thread. Idempotent.
    void disconnect();

    bool is_open() const;

    // Number of calls currently waiting for a response.
    size_t pending_call_count() const;

    // Number of active subscriptions listening for method.
    size_t listener_count(const std::string &method) const;

private:
    // Completion slot for one outstanding command; resolved exactly once.
    struct PendingCall {
        bool completed = false;
        bool closed = false;
        json response;
    };

    explicit Connection(std::unique_ptr<MessageSocket> socket);

    void handle_message(const std::string &payload);
    void handle_socket_closed();
    void resolve_pending_as_closed();

    std::unique_ptr<MessageSocket> socket_;
    std::shared_ptr<EventHub> hub_;
    std::thread dispatch_thread_;

    mutable std::mutex pending_mutex_;
    std::condition_variable pending_condition_;
    std::map<int64_t, std::shared_ptr<PendingCall>> pending_calls_;
    int64_t next_message_id_ = 1;
    bool open_ = true;

    std::atomic<bool> disconnected_{false};
};

// Connect to a DevTools WebSocket URL (ws://host:port/devtools/page/<id>).
// Throws ConnectionError if the handshake fails or does not finish in time.
std::shared_ptr<Connection> connect(const std::string &websocket_url, int timeout_milliseconds);

} // namespace cdp_transport

#endif // CDPSYNC_CDP_TRANSPORT_HPP
