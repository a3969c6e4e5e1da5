#ifndef CDPSYNC_CDP_MESSAGE_HPP
#define CDPSYNC_CDP_MESSAGE_HPP

// CDP wire-frame helpers.
// Commands are {id, method, params}; responses are {id, result} or
// {id, error: {code, message}}; events are {method, params} without an id.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace cdp_message {

using json = nlohmann::json;

// Build a command frame. params is always present (an empty object when null).
json build_command(int64_t message_id, const std::string &method, const json &params);

// Build a response frame (used by loopback tests and tools that fake a browser).
json build_response(int64_t message_id, const json &result_payload);

// Build an error response frame.
json build_error_response(int64_t message_id, long error_code, const std::string &error_message);

// Build an event frame.
json build_event(const std::string &method, const json &params);

// True if the frame carries a non-null integral id (i.e. it answers a command).
bool is_response(const json &message);

// True if the frame has a method and no id.
bool is_event(const json &message);

// Correlation id of a response frame. Caller checks is_response() first.
int64_t get_id(const json &message);

// Method of an event/command frame. Returns empty if missing.
std::string get_method(const json &message);

// Params of an event/command frame. Returns empty object if missing.
json get_params(const json &message);

// Result payload of a response frame. Returns empty object if missing.
json get_result(const json &message);

// True if the response frame carries {error: {...}}.
bool has_error(const json &message);

// Remote error code and message. Defaults: -1 / "Unknown protocol error".
long get_error_code(const json &message);
std::string get_error_message(const json &message);

// Standard remote error code for server-side failures (stale node, bad object id...).
constexpr long SERVER_ERROR = -32000;

} // namespace cdp_message

#endif // CDPSYNC_CDP_MESSAGE_HPP
