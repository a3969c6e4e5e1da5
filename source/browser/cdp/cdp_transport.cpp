#include "browser/cdp/cdp_transport.hpp"
#include "browser/cdp/lws_socket.hpp"
#include "browser/driver_error.hpp"
#include "protocol/cdp_message.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <utility>
#include <vector>

namespace cdp_transport {

// Event queue and listener table shared by the connection, its subscriptions
// and the dispatch thread. Kept separate from Connection so the dispatch
// thread never touches a destroyed connection.
struct EventHub {
    struct QueuedEvent {
        std::string method;
        json params;
    };

    std::mutex mutex;
    std::condition_variable condition;
    std::deque<QueuedEvent> queue;
    bool stopping = false;
    std::thread::id dispatch_thread_id;
    // Event method -> subscriptions in registration order.
    std::map<std::string, std::vector<std::shared_ptr<Subscription>>> listeners;
};

// --- Subscription ---

Subscription::Subscription(std::weak_ptr<EventHub> hub, std::set<std::string> methods, EventCallback callback)
    : hub_(std::move(hub)), methods_(std::move(methods)), callback_(std::move(callback)) {}

void Subscription::unsubscribe() {
    const bool was_active = active_.exchange(false);
    bool on_dispatch_thread = false;
    std::shared_ptr<EventHub> hub = hub_.lock();
    if (hub) {
        std::lock_guard<std::mutex> lock(hub->mutex);
        on_dispatch_thread = hub->dispatch_thread_id == std::this_thread::get_id();
        if (was_active) {
            for (const auto &method : methods_) {
                auto listener_iterator = hub->listeners.find(method);
                if (listener_iterator == hub->listeners.end()) {
                    continue;
                }
                auto &entries = listener_iterator->second;
                entries.erase(std::remove_if(entries.begin(), entries.end(),
                                             [this](const std::shared_ptr<Subscription> &entry) {
                                                 return entry.get() == this;
                                             }),
                              entries.end());
                if (entries.empty()) {
                    hub->listeners.erase(listener_iterator);
                }
            }
        }
    }
    if (!on_dispatch_thread) {
        // Wait out a callback of this subscription that is still running.
        std::lock_guard<std::mutex> delivery_lock(delivery_mutex_);
    }
}

void deliver_event(const std::shared_ptr<Subscription> &subscription,
                   const std::string &method, const json &params) {
    std::lock_guard<std::mutex> delivery_lock(subscription->delivery_mutex_);
    // Re-checked per delivery: an earlier callback for this same event may
    // have removed this subscription.
    if (!subscription->is_active()) {
        return;
    }
    try {
        subscription->callback_(method, params);
    } catch (const std::exception &error) {
        debug_log::warn("Error occurred while handling event, method = " + method + ": " + error.what());
    }
}

// --- Dispatch thread ---

static void run_dispatch_loop(std::shared_ptr<EventHub> hub) {
    {
        std::lock_guard<std::mutex> lock(hub->mutex);
        hub->dispatch_thread_id = std::this_thread::get_id();
    }
    debug_log::log("Event dispatch thread started.");
    for (;;) {
        EventHub::QueuedEvent event;
        std::vector<std::shared_ptr<Subscription>> targets;
        {
            std::unique_lock<std::mutex> lock(hub->mutex);
            hub->condition.wait(lock, [&hub]() { return hub->stopping || !hub->queue.empty(); });
            if (hub->stopping) {
                break;
            }
            event = std::move(hub->queue.front());
            hub->queue.pop_front();
            auto listener_iterator = hub->listeners.find(event.method);
            if (listener_iterator != hub->listeners.end()) {
                targets = listener_iterator->second;
            }
        }
        for (const auto &subscription : targets) {
            deliver_event(subscription, event.method, event.params);
        }
    }
    debug_log::log("Event dispatch thread stopped.");
}

// --- Connection ---

Connection::Connection(std::unique_ptr<MessageSocket> socket)
    : socket_(std::move(socket)), hub_(std::make_shared<EventHub>()) {}

std::shared_ptr<Connection> Connection::open(std::unique_ptr<MessageSocket> socket) {
    std::shared_ptr<Connection> connection(new Connection(std::move(socket)));
    connection->dispatch_thread_ = std::thread(run_dispatch_loop, connection->hub_);

    // The socket is owned by the connection and closed (reader joined) before
    // the connection is destroyed, so the raw pointer outlives every handler call.
    Connection *raw_connection = connection.get();
    connection->socket_->start(
        [raw_connection](const std::string &payload) { raw_connection->handle_message(payload); },
        [raw_connection]() { raw_connection->handle_socket_closed(); });
    return connection;
}

Connection::~Connection() {
    disconnect();
}

json Connection::invoke(const std::string &method, const json &params, int timeout_milliseconds) {
    if (method.empty()) {
        throw driver_error::usage_error("CDP method name must not be empty");
    }

    auto slot = std::make_shared<PendingCall>();
    int64_t message_id = 0;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!open_) {
            throw driver_error::connection_error("Not connected to CDP (method: " + method + ")");
        }
        message_id = next_message_id_++;
        pending_calls_[message_id] = slot;
    }

    std::string serialized_command;
    try {
        serialized_command = cdp_message::build_command(message_id, method, params).dump();
    } catch (const json::type_error &type_error) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_calls_.erase(message_id);
        }
        throw driver_error::usage_error("Could not serialize params for " + method + ": " + type_error.what());
    }

    if (!socket_->send_text(serialized_command)) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_calls_.erase(message_id);
        }
        throw driver_error::connection_error("Failed to send CDP command via WebSocket: " + method);
    }

    std::unique_lock<std::mutex> lock(pending_mutex_);
    auto is_completed = [&slot]() { return slot->completed; };
    if (timeout_milliseconds > 0) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
        if (!pending_condition_.wait_until(lock, deadline, is_completed)) {
            pending_calls_.erase(message_id);
            debug_log::log("invoke: abandoned id=" + std::to_string(message_id) + " method=" + method +
                           " after " + std::to_string(timeout_milliseconds) + " ms");
            throw driver_error::connection_error("Timed out waiting for CDP response to method: " + method);
        }
    } else {
        pending_condition_.wait(lock, is_completed);
    }
    lock.unlock();

    if (slot->closed) {
        throw driver_error::connection_error("Chrome DevTools were closed while waiting for " + method + " to complete");
    }
    if (cdp_message::has_error(slot->response)) {
        throw driver_error::protocol_error(cdp_message::get_error_code(slot->response),
                                           cdp_message::get_error_message(slot->response));
    }
    return cdp_message::get_result(slot->response);
}

std::shared_ptr<Subscription> Connection::subscribe(const std::set<std::string> &methods, EventCallback callback) {
    if (methods.empty() || !callback) {
        throw driver_error::usage_error("subscribe requires at least one method and a callback");
    }
    std::shared_ptr<Subscription> subscription(new Subscription(hub_, methods, std::move(callback)));
    std::lock_guard<std::mutex> lock(hub_->mutex);
    if (hub_->stopping) {
        throw driver_error::connection_error("Cannot subscribe on a closed CDP connection");
    }
    for (const auto &method : methods) {
        hub_->listeners[method].push_back(subscription);
    }
    return subscription;
}

void Connection::unsubscribe(const std::shared_ptr<Subscription> &subscription) {
    if (subscription) {
        subscription->unsubscribe();
    }
}

void Connection::disconnect() {
    if (disconnected_.exchange(true)) {
        return;
    }
    debug_log::log("disconnect(): closing CDP WebSocket.");
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        open_ = false;
    }

    socket_->close();
    resolve_pending_as_closed();

    {
        std::lock_guard<std::mutex> lock(hub_->mutex);
        hub_->stopping = true;
        hub_->queue.clear();
        for (auto &listener_entry : hub_->listeners) {
            for (auto &subscription : listener_entry.second) {
                subscription->active_.store(false);
            }
        }
        hub_->listeners.clear();
    }
    hub_->condition.notify_all();

    if (dispatch_thread_.joinable()) {
        if (dispatch_thread_.get_id() == std::this_thread::get_id()) {
            // disconnect() called from an event callback; the loop exits on its own.
            dispatch_thread_.detach();
        } else {
            dispatch_thread_.join();
        }
    }
    debug_log::log("disconnect() finished.");
}

bool Connection::is_open() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return open_;
}

size_t Connection::pending_call_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_calls_.size();
}

size_t Connection::listener_count(const std::string &method) const {
    std::lock_guard<std::mutex> lock(hub_->mutex);
    auto listener_iterator = hub_->listeners.find(method);
    return listener_iterator == hub_->listeners.end() ? 0 : listener_iterator->second.size();
}

void Connection::handle_message(const std::string &payload) {
    json message;
    try {
        message = json::parse(payload);
    } catch (const json::parse_error &parse_error) {
        debug_log::warn(std::string("Failed to parse CDP message: ") + parse_error.what() +
                        ", buffer content: " + payload.substr(0, 200));
        return;
    }

    if (cdp_message::is_response(message)) {
        int64_t message_id = cdp_message::get_id(message);
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto pending_iterator = pending_calls_.find(message_id);
        if (pending_iterator == pending_calls_.end()) {
            debug_log::log("Dropping response for untracked id=" + std::to_string(message_id));
            return;
        }
        pending_iterator->second->response = std::move(message);
        pending_iterator->second->completed = true;
        pending_calls_.erase(pending_iterator);
        pending_condition_.notify_all();
        return;
    }

    if (cdp_message::is_event(message)) {
        {
            std::lock_guard<std::mutex> lock(hub_->mutex);
            if (hub_->stopping) {
                return;
            }
            hub_->queue.push_back({cdp_message::get_method(message), cdp_message::get_params(message)});
        }
        hub_->condition.notify_one();
        return;
    }

    debug_log::warn("Ignoring CDP frame that is neither response nor event: " + payload.substr(0, 200));
}

void Connection::handle_socket_closed() {
    debug_log::log("CDP WebSocket closed by peer.");
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        open_ = false;
    }
    resolve_pending_as_closed();
}

void Connection::resolve_pending_as_closed() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto &pending_entry : pending_calls_) {
        pending_entry.second->closed = true;
        pending_entry.second->completed = true;
    }
    pending_calls_.clear();
    pending_condition_.notify_all();
}

std::shared_ptr<Connection> connect(const std::string &websocket_url, int timeout_milliseconds) {
    debug_log::log("connect() URL=" + websocket_url);
    std::unique_ptr<MessageSocket> socket = LwsSocket::connect(websocket_url, timeout_milliseconds);
    return Connection::open(std::move(socket));
}

} // namespace cdp_transport
