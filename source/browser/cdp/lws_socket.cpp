#include "browser/cdp/lws_socket.hpp"
#include "browser/driver_error.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <utility>

namespace cdp_transport {

// Forward declaration of the WebSocket callback.
static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length);

// WebSocket protocol definition for libwebsockets.
static const struct lws_protocols websocket_protocols[] = {
    {
        "cdp-protocol",
        websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;
    struct lws_context *context = lws_get_context(websocket_instance);
    auto *socket = context != nullptr ? static_cast<LwsSocket *>(lws_context_user(context)) : nullptr;
    if (socket == nullptr) {
        return 0;
    }
    return socket->handle_callback(websocket_instance, static_cast<int>(reason), incoming_data, incoming_length);
}

bool parse_websocket_url(const std::string &websocket_url, WebSocketAddress &out_address) {
    const std::string scheme = "ws://";
    if (websocket_url.compare(0, scheme.size(), scheme) != 0) {
        return false;
    }
    std::string url_without_scheme = websocket_url.substr(scheme.size());

    // Split host:port from path.
    WebSocketAddress address;
    std::string host_and_port;
    auto slash_position = url_without_scheme.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = url_without_scheme.substr(0, slash_position);
        address.path = url_without_scheme.substr(slash_position);
    } else {
        host_and_port = url_without_scheme;
    }
    if (host_and_port.empty()) {
        return false;
    }

    // Split host from port.
    auto colon_position = host_and_port.find(':');
    if (colon_position != std::string::npos) {
        address.host = host_and_port.substr(0, colon_position);
        std::string port_text = host_and_port.substr(colon_position + 1);
        if (address.host.empty() || port_text.empty() ||
            port_text.find_first_not_of("0123456789") != std::string::npos || port_text.size() > 5) {
            return false;
        }
        address.port = std::stoi(port_text);
        if (address.port <= 0 || address.port > 65535) {
            return false;
        }
    } else {
        address.host = host_and_port;
    }

    out_address = address;
    return true;
}

std::unique_ptr<LwsSocket> LwsSocket::connect(const std::string &websocket_url, int timeout_milliseconds) {
    WebSocketAddress address;
    if (!parse_websocket_url(websocket_url, address)) {
        throw driver_error::connection_error("Invalid DevTools WebSocket URL: " + websocket_url);
    }
    std::string host_header = address.host + ":" + std::to_string(address.port);

    std::unique_ptr<LwsSocket> socket(new LwsSocket());

    // Create libwebsockets context.
    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = socket.get();

    socket->websocket_context_ = lws_create_context(&context_info);
    if (socket->websocket_context_ == nullptr) {
        throw driver_error::connection_error("Failed to create libwebsockets context.");
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = socket->websocket_context_;
    connect_info.address = address.host.c_str();
    connect_info.port = address.port;
    connect_info.path = address.path.c_str();
    connect_info.host = host_header.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;

    debug_log::log("connect() host=" + address.host + " port=" + std::to_string(address.port) +
                   " path=" + address.path);
    socket->websocket_connection_ = lws_client_connect_via_info(&connect_info);
    if (socket->websocket_connection_ == nullptr) {
        socket->close();
        throw driver_error::connection_error("Failed to initiate CDP WebSocket connection to " + websocket_url);
    }

    socket->service_thread_ = std::thread(&LwsSocket::run_service_loop, socket.get());

    bool handshake_done = false;
    std::string failure_reason;
    {
        std::unique_lock<std::mutex> lock(socket->state_mutex_);
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_milliseconds);
        handshake_done = socket->state_condition_.wait_until(lock, deadline, [&socket]() {
            return socket->established_ || socket->connection_failed_;
        });
        if (socket->connection_failed_) {
            handshake_done = false;
            failure_reason = socket->failure_reason_;
        }
    }

    if (!handshake_done) {
        socket->close();
        if (!failure_reason.empty()) {
            throw driver_error::connection_error("CDP WebSocket connection failed: " + failure_reason);
        }
        throw driver_error::connection_error("Chrome Devtools Websocket connection timeout (after " +
                                             std::to_string(timeout_milliseconds) + " ms)");
    }
    debug_log::log("CDP WebSocket connected.");
    return socket;
}

LwsSocket::~LwsSocket() {
    close();
}

void LwsSocket::start(MessageHandler on_message, CloseHandler on_close) {
    std::vector<std::string> pending_messages;
    bool pending_close = false;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        on_message_ = std::move(on_message);
        on_close_ = std::move(on_close);
        pending_messages.swap(early_messages_);
        pending_close = early_close_;
    }
    for (auto &payload : pending_messages) {
        deliver_message(std::move(payload));
    }
    if (pending_close) {
        notify_closed();
    }
}

bool LwsSocket::send_text(const std::string &payload) {
    std::lock_guard<std::mutex> context_lock(context_mutex_);
    if (closed_.load() || websocket_context_ == nullptr) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(outgoing_mutex_);
        outgoing_messages_.push_back(payload);
    }
    // Wake the service thread; it requests a writeable callback.
    lws_cancel_service(websocket_context_);
    return true;
}

void LwsSocket::close() {
    if (stopping_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> context_lock(context_mutex_);
        closed_.store(true);
        if (websocket_context_ != nullptr) {
            lws_cancel_service(websocket_context_);
        }
    }
    if (service_thread_.joinable()) {
        service_thread_.join();
    }
    // send_text() sees closed_ under context_mutex_, so nothing else uses the
    // context once it is taken out here.
    struct lws_context *context = nullptr;
    {
        std::lock_guard<std::mutex> context_lock(context_mutex_);
        std::swap(context, websocket_context_);
        websocket_connection_ = nullptr;
    }
    if (context != nullptr) {
        lws_context_destroy(context);
        debug_log::log("close(): WebSocket context destroyed.");
    }
    notify_closed();
}

void LwsSocket::run_service_loop() {
    while (!stopping_.load()) {
        lws_service(websocket_context_, 50);
    }
}

void LwsSocket::deliver_message(std::string payload) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        if (!on_message_) {
            early_messages_.push_back(std::move(payload));
            return;
        }
        handler = on_message_;
    }
    handler(payload);
}

void LwsSocket::notify_closed() {
    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        if (!on_close_) {
            early_close_ = true;
            return;
        }
        handler = on_close_;
    }
    if (!close_notified_.exchange(true)) {
        handler();
    }
}

int LwsSocket::handle_callback(struct lws *websocket_instance, int reason, void *incoming_data,
                               size_t incoming_length) {
    switch (static_cast<enum lws_callback_reasons>(reason)) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED: {
        std::lock_guard<std::mutex> lock(state_mutex_);
        established_ = true;
        state_condition_.notify_all();
        break;
    }

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        // Accumulate fragments until the full message has been received.
        receive_buffer_.append(static_cast<const char *>(incoming_data), incoming_length);
        if (lws_is_final_fragment(websocket_instance) && lws_remaining_packet_payload(websocket_instance) == 0) {
            std::string payload;
            payload.swap(receive_buffer_);
            deliver_message(std::move(payload));
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_message = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
        debug_log::warn(std::string("CDP WebSocket connection error: ") + error_message);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            connection_failed_ = true;
            failure_reason_ = error_message;
            state_condition_.notify_all();
        }
        websocket_connection_ = nullptr;
        closed_.store(true);
        notify_closed();
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
        debug_log::log("CDP WebSocket closed.");
        websocket_connection_ = nullptr;
        closed_.store(true);
        notify_closed();
        break;

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        // Woken by send_text() or close(); ask for a writeable slot if needed.
        bool has_outgoing = false;
        {
            std::lock_guard<std::mutex> lock(outgoing_mutex_);
            has_outgoing = !outgoing_messages_.empty();
        }
        if (has_outgoing && websocket_connection_ != nullptr) {
            lws_callback_on_writable(websocket_connection_);
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_WRITEABLE: {
        std::string serialized_command;
        bool more_pending = false;
        {
            std::lock_guard<std::mutex> lock(outgoing_mutex_);
            if (outgoing_messages_.empty()) {
                break;
            }
            serialized_command = std::move(outgoing_messages_.front());
            outgoing_messages_.pop_front();
            more_pending = !outgoing_messages_.empty();
        }

        // libwebsockets requires LWS_PRE bytes of padding before the data.
        std::vector<unsigned char> send_buffer(LWS_PRE + serialized_command.size());
        memcpy(send_buffer.data() + LWS_PRE, serialized_command.data(), serialized_command.size());
        int bytes_written = lws_write(websocket_instance, send_buffer.data() + LWS_PRE,
                                      serialized_command.size(), LWS_WRITE_TEXT);
        if (bytes_written < 0) {
            debug_log::warn("Failed to write CDP frame; closing WebSocket.");
            return -1;
        }
        if (more_pending) {
            lws_callback_on_writable(websocket_instance);
        }
        break;
    }

    default:
        break;
    }

    return 0;
}

} // namespace cdp_transport
