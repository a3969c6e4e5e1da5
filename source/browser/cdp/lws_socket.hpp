#ifndef CDPSYNC_LWS_SOCKET_HPP
#define CDPSYNC_LWS_SOCKET_HPP

// libwebsockets client socket for the CDP transport.
// A service thread runs the lws event loop (the connection's reader);
// outgoing frames are queued and written from the writeable callback.

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "browser/cdp/message_socket.hpp"

struct lws_context;
struct lws;

namespace cdp_transport {

// Parsed ws://host:port/path. Port defaults to 9222, path to "/".
struct WebSocketAddress {
    std::string host = "127.0.0.1";
    int port = 9222;
    std::string path = "/";
};

// Returns false for anything that is not a ws:// URL with a valid port.
bool parse_websocket_url(const std::string &websocket_url, WebSocketAddress &out_address);

class LwsSocket : public MessageSocket {
public:
    // Open the socket and complete the handshake.
    // Throws ConnectionError on a bad URL, handshake failure or timeout.
    static std::unique_ptr<LwsSocket> connect(const std::string &websocket_url, int timeout_milliseconds);

    ~LwsSocket() override;

    void start(MessageHandler on_message, CloseHandler on_close) override;
    bool send_text(const std::string &payload) override;
    void close() override;

    // Entry point for the lws protocol callback.
    int handle_callback(struct lws *websocket_instance, int reason, void *incoming_data, size_t incoming_length);

private:
    LwsSocket() = default;

    void run_service_loop();
    void deliver_message(std::string payload);
    void notify_closed();

    // Guards websocket_context_ against close() while send_text() wakes the loop.
    std::mutex context_mutex_;
    struct lws_context *websocket_context_ = nullptr;
    struct lws *websocket_connection_ = nullptr;
    std::thread service_thread_;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> close_notified_{false};

    // Handshake state, guarded by state_mutex_.
    std::mutex state_mutex_;
    std::condition_variable state_condition_;
    bool established_ = false;
    bool connection_failed_ = false;
    std::string failure_reason_;

    std::mutex outgoing_mutex_;
    std::deque<std::string> outgoing_messages_;

    // Only touched on the service thread.
    std::string receive_buffer_;

    // Frames received before start() are held until handlers exist.
    std::mutex handler_mutex_;
    MessageHandler on_message_;
    CloseHandler on_close_;
    std::vector<std::string> early_messages_;
    bool early_close_ = false;
};

} // namespace cdp_transport

#endif // CDPSYNC_LWS_SOCKET_HPP
