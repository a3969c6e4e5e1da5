#include "protocol/cdp_message.hpp"

namespace cdp_message {

json build_command(int64_t message_id, const std::string &method, const json &params) {
    json command;
    command["id"] = message_id;
    command["method"] = method;
    command["params"] = params.is_null() ? json::object() : params;
    return command;
}

json build_response(int64_t message_id, const json &result_payload) {
    json response;
    response["id"] = message_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(int64_t message_id, long error_code, const std::string &error_message) {
    json response;
    response["id"] = message_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_event(const std::string &method, const json &params) {
    json event;
    event["method"] = method;
    event["params"] = params;
    return event;
}

bool is_response(const json &message) {
    return message.is_object() && message.contains("id") && message["id"].is_number_integer();
}

bool is_event(const json &message) {
    return message.is_object() && !is_response(message) &&
           message.contains("method") && message["method"].is_string();
}

int64_t get_id(const json &message) {
    return message["id"].get<int64_t>();
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

json get_result(const json &message) {
    if (message.contains("result") && !message["result"].is_null()) {
        return message["result"];
    }
    return json::object();
}

bool has_error(const json &message) {
    return message.contains("error") && !message["error"].is_null();
}

long get_error_code(const json &message) {
    if (has_error(message) && message["error"].is_object() && message["error"].contains("code") &&
        message["error"]["code"].is_number_integer()) {
        return message["error"]["code"].get<long>();
    }
    return -1;
}

std::string get_error_message(const json &message) {
    if (has_error(message) && message["error"].is_object() && message["error"].contains("message") &&
        message["error"]["message"].is_string()) {
        return message["error"]["message"].get<std::string>();
    }
    return "Unknown protocol error";
}

} // namespace cdp_message
