#include "utils/settings.hpp"
#include "utils/debug_log.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string>

namespace settings {

bool parse_milliseconds(const char *text, int &out_milliseconds) {
    if (text == nullptr || text[0] == '\0') {
        return false;
    }
    char *end_pointer = nullptr;
    errno = 0;
    long value = std::strtol(text, &end_pointer, 10);
    if (errno != 0 || end_pointer == text || *end_pointer != '\0') {
        return false;
    }
    if (value < 0 || value > INT_MAX) {
        return false;
    }
    out_milliseconds = static_cast<int>(value);
    return true;
}

static void apply_override(const char *variable_name, int &target) {
    const char *value = std::getenv(variable_name);
    if (value == nullptr) {
        return;
    }
    if (!parse_milliseconds(value, target)) {
        debug_log::warn(std::string("Ignoring ") + variable_name + "=" + value +
                        " (expected a non-negative integer of milliseconds).");
        return;
    }
    debug_log::log(std::string("settings: ") + variable_name + "=" + std::to_string(target));
}

Settings from_environment() {
    Settings result;
    apply_override("CDPSYNC_CONNECT_TIMEOUT_MS", result.connect_timeout_milliseconds);
    apply_override("CDPSYNC_CALL_TIMEOUT_MS", result.call_timeout_milliseconds);
    apply_override("CDPSYNC_WAIT_TIMEOUT_MS", result.wait_timeout_milliseconds);
    apply_override("CDPSYNC_POLL_INTERVAL_MS", result.poll_interval_milliseconds);
    apply_override("CDPSYNC_SETTLE_GRACE_MS", result.settle_grace_milliseconds);
    return result;
}

} // namespace settings
