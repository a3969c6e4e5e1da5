#ifndef CDPSYNC_DEBUG_LOG_HPP
#define CDPSYNC_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if CDPSYNC_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [cdpsync] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [cdpsync] prefix regardless of CDPSYNC_DEBUG.
// Used for conditions the caller cannot observe otherwise (swallowed callback
// exceptions, dropped frames, ignored settings).
void warn(const std::string &message);

} // namespace debug_log

#endif // CDPSYNC_DEBUG_LOG_HPP
