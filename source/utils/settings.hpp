#ifndef CDPSYNC_SETTINGS_HPP
#define CDPSYNC_SETTINGS_HPP

// Numeric timing settings consumed by the transport, the retry engine and
// the navigation controller. Plain values; each session carries its own copy.

namespace settings {

struct Settings {
    // WebSocket handshake limit for connect().
    int connect_timeout_milliseconds = 10000;
    // Default limit for a single invoke() round trip.
    int call_timeout_milliseconds = 10000;
    // Default deadline for wait() / with_retry() and for navigation.
    int wait_timeout_milliseconds = 5000;
    // Sleep between retry attempts.
    int poll_interval_milliseconds = 50;
    // Pause after a mutation before checking network quiescence.
    int settle_grace_milliseconds = 100;
};

// Defaults overridden by CDPSYNC_CONNECT_TIMEOUT_MS, CDPSYNC_CALL_TIMEOUT_MS,
// CDPSYNC_WAIT_TIMEOUT_MS, CDPSYNC_POLL_INTERVAL_MS and CDPSYNC_SETTLE_GRACE_MS.
// Values that are not non-negative integers are ignored with a warning.
Settings from_environment();

// Parse a non-negative millisecond count. Returns false (and leaves
// out_milliseconds untouched) for empty, negative or non-numeric text.
bool parse_milliseconds(const char *text, int &out_milliseconds);

} // namespace settings

#endif // CDPSYNC_SETTINGS_HPP
