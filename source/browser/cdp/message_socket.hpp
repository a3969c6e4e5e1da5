#ifndef CDPSYNC_MESSAGE_SOCKET_HPP
#define CDPSYNC_MESSAGE_SOCKET_HPP

// Text-frame socket interface used by the CDP transport.
// The production implementation is the libwebsockets client (lws_socket);
// tests plug in an in-process loopback.

#include <functional>
#include <string>

namespace cdp_transport {

class MessageSocket {
public:
    using MessageHandler = std::function<void(const std::string &payload)>;
    using CloseHandler = std::function<void()>;

    virtual ~MessageSocket() = default;

    // Begin delivering inbound frames. Handlers run on the socket's reader thread.
    // on_close fires at most once, when the peer or close() ends the session.
    virtual void start(MessageHandler on_message, CloseHandler on_close) = 0;

    // Queue one text frame. Returns false if the socket is already closed.
    virtual bool send_text(const std::string &payload) = 0;

    // Close the session and stop the reader. Idempotent.
    virtual void close() = 0;
};

} // namespace cdp_transport

#endif // CDPSYNC_MESSAGE_SOCKET_HPP
