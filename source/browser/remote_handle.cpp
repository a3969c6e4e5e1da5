#include "browser/remote_handle.hpp"
#include "browser/driver_error.hpp"
#include "protocol/cdp_message.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

namespace remote_handle {

static const char *kInDocumentCheck = "function() { return this === document || !!this.parentNode; }";

static std::atomic<int> next_object_group_number{1};

// --- RemoteHandle ---

RemoteHandle::RemoteHandle(std::shared_ptr<cdp_transport::Connection> connection, std::string object_id,
                           std::optional<std::string> display_name, std::optional<std::string> selector)
    : connection_(std::move(connection)),
      object_id_(std::move(object_id)),
      display_name_(std::move(display_name)),
      selector_(std::move(selector)) {}

RemoteHandle RemoteHandle::with_display_name(const std::string &name) const {
    return RemoteHandle(connection_, object_id_, name, selector_);
}

bool RemoteHandle::same_object(const RemoteHandle &other) const {
    return connection_ == other.connection_ && object_id_ == other.object_id_;
}

std::string to_string(const RemoteHandle &handle) {
    std::ostringstream stream;
    stream << handle;
    return stream.str();
}

std::ostream &operator<<(std::ostream &stream, const RemoteHandle &handle) {
    stream << "#handle {:object-id " << json(handle.cached_object_id()).dump();
    if (handle.display_name()) {
        stream << " :name " << json(*handle.display_name()).dump();
    }
    if (handle.selector()) {
        stream << " :selector " << json(*handle.selector()).dump();
    }
    return stream << "}";
}

// --- Argument ---

Argument::Argument() : value_(nullptr) {}

Argument::Argument(json value) : value_(std::move(value)) {}

Argument::Argument(RemoteHandle handle)
    : type_(Type::Handle), handle_(std::make_shared<const RemoteHandle>(std::move(handle))), contains_handles_(true) {}

Argument make_object(std::vector<std::pair<std::string, Argument>> members) {
    Argument argument;
    argument.type_ = Argument::Type::Object;
    for (auto &member : members) {
        argument.contains_handles_ = argument.contains_handles_ || member.second.contains_handles();
        argument.keys_.push_back(std::move(member.first));
        argument.children_.push_back(std::move(member.second));
    }
    return argument;
}

Argument make_array(std::vector<Argument> elements) {
    Argument argument;
    argument.type_ = Argument::Type::Array;
    for (auto &element : elements) {
        argument.contains_handles_ = argument.contains_handles_ || element.contains_handles();
        argument.children_.push_back(std::move(element));
    }
    return argument;
}

// Plain JSON for a handle-free tree.
static json plain_value(const Argument &argument) {
    switch (argument.type()) {
    case Argument::Type::Value:
        return argument.value();
    case Argument::Type::Handle:
        return nullptr;
    case Argument::Type::Object: {
        json object = json::object();
        for (size_t index = 0; index < argument.children().size(); ++index) {
            object[argument.keys()[index]] = plain_value(argument.children()[index]);
        }
        return object;
    }
    case Argument::Type::Array: {
        json array = json::array();
        for (const auto &child : argument.children()) {
            array.push_back(plain_value(child));
        }
        return array;
    }
    }
    return nullptr;
}

std::string rebuild_prologue(const json &handle_paths) {
    if (!handle_paths.is_array() || handle_paths.empty()) {
        return "";
    }
    std::string prologue =
        "const __set = (root, path, value) => {"
        " if (path.length === 0) return value;"
        " let target = root;"
        " for (let i = 0; i < path.length - 1; i++) target = target[path[i]];"
        " target[path[path.length - 1]] = value;"
        " return root; };\n";
    for (size_t index = 0; index < handle_paths.size(); ++index) {
        prologue += "__args = __set(__args, " + handle_paths[index].dump() + ", __refs[" + std::to_string(index) + "]);\n";
    }
    return prologue;
}

// --- ResultValue ---

const RemoteHandle *ResultValue::handle_at(const std::string &pointer) const {
    for (const auto &entry : handles) {
        if (entry.first == pointer) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::string pointer_from_path(const json &path) {
    std::string pointer;
    for (const auto &segment : path) {
        std::string token = segment.is_string() ? segment.get<std::string>() : segment.dump();
        std::string escaped;
        for (char character : token) {
            if (character == '~') {
                escaped += "~0";
            } else if (character == '/') {
                escaped += "~1";
            } else {
                escaped += character;
            }
        }
        pointer += "/" + escaped;
    }
    return pointer;
}

bool is_stale_protocol_error(long code, const std::string &message) {
    if (code != cdp_message::SERVER_ERROR) {
        return false;
    }
    static const char *stale_messages[] = {
        "No node with given id found",
        "Node with given id does not belong to the document",
        "Could not find object with given id",
        "Cannot find context with specified id",
    };
    for (const char *stale_message : stale_messages) {
        if (message.find(stale_message) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// --- HandleRegistry ---

HandleRegistry::HandleRegistry(std::shared_ptr<cdp_transport::Connection> connection, int call_timeout_milliseconds)
    : connection_(std::move(connection)),
      call_timeout_milliseconds_(call_timeout_milliseconds),
      object_group_("cdpsync-" + std::to_string(next_object_group_number.fetch_add(1))) {}

json HandleRegistry::call(const std::string &method, const json &params) {
    try {
        return connection_->invoke(method, params, call_timeout_milliseconds_);
    } catch (const driver_error::DriverError &error) {
        if (error.kind() == driver_error::ErrorKind::Protocol) {
            std::string message = error.what();
            if (is_stale_protocol_error(error.code(), message)) {
                throw driver_error::stale_handle_error();
            }
        }
        throw;
    }
}

void HandleRegistry::check_owner(const RemoteHandle &handle) const {
    if (handle.connection() != connection_) {
        throw driver_error::usage_error("Remote handle " + to_string(handle) + " belongs to another connection");
    }
}

void HandleRegistry::check_in_document(const std::string &object_id) {
    json params;
    params["functionDeclaration"] = kInDocumentCheck;
    params["objectId"] = object_id;
    params["awaitPromise"] = false;
    params["returnByValue"] = true;
    json response = call("Runtime.callFunctionOn", params);
    if (response.contains("exceptionDetails")) {
        throw driver_error::stale_handle_error();
    }
    bool in_document = response.contains("result") && response["result"].contains("value") &&
                       response["result"]["value"].is_boolean() && response["result"]["value"].get<bool>();
    if (!in_document) {
        throw driver_error::stale_handle_error();
    }
}

std::optional<RemoteHandle> HandleRegistry::wrap(const Lookup &lookup, const RemoteHandle *context,
                                                 std::optional<std::string> display_name,
                                                 std::optional<std::string> selector) {
    if (context != nullptr) {
        check_owner(*context);
    }

    std::string object_id;
    if (lookup.object_id) {
        object_id = *lookup.object_id;
    } else if (lookup.backend_node_id || lookup.node_id) {
        json params;
        if (lookup.backend_node_id) {
            params["backendNodeId"] = *lookup.backend_node_id;
        } else {
            params["nodeId"] = *lookup.node_id;
        }
        params["objectGroup"] = object_group_;
        json response = call("DOM.resolveNode", params);
        if (!response.contains("object") || !response["object"].contains("objectId") ||
            !response["object"]["objectId"].is_string()) {
            throw driver_error::stale_handle_error();
        }
        object_id = response["object"]["objectId"].get<std::string>();
    } else {
        return std::nullopt;
    }

    std::optional<std::string> breadcrumb;
    std::vector<std::string> parts;
    if (context != nullptr && context->selector()) {
        parts.push_back(*context->selector());
    }
    if (selector) {
        parts.push_back(*selector);
    }
    for (const auto &part : parts) {
        breadcrumb = breadcrumb ? *breadcrumb + " " + part : part;
    }
    return RemoteHandle(connection_, object_id, std::move(display_name), std::move(breadcrumb));
}

int HandleRegistry::context_node_id(const RemoteHandle &from, const std::string &selector) {
    try {
        return get_node_id(from);
    } catch (const driver_error::DriverError &error) {
        if (error.kind() != driver_error::ErrorKind::StaleHandle) {
            throw;
        }
    }
    // A vanished scope does not come back; retrying would only burn the timeout.
    throw driver_error::DriverError(driver_error::ErrorKind::StaleHandle,
                                    "Could not query nodes with selector \"" + selector +
                                        "\" because context node " + to_string(from) + " does not exist anymore",
                                    false);
}

json HandleRegistry::query_node_ids(int context_node_id, const std::string &selector) {
    json params;
    params["nodeId"] = context_node_id;
    params["selector"] = selector;
    json response = call("DOM.querySelectorAll", params);
    if (!response.contains("nodeIds") || !response["nodeIds"].is_array()) {
        return json::array();
    }
    return response["nodeIds"];
}

std::vector<RemoteHandle> HandleRegistry::query(const RemoteHandle &from, const std::string &selector,
                                                std::optional<std::string> display_name) {
    check_owner(from);
    json node_ids = query_node_ids(context_node_id(from, selector), selector);
    std::vector<RemoteHandle> nodes;
    for (const auto &node_id : node_ids) {
        Lookup lookup;
        lookup.node_id = node_id.get<int>();
        try {
            std::optional<RemoteHandle> node = wrap(lookup, &from, display_name, selector);
            if (node) {
                nodes.push_back(*node);
            }
        } catch (const driver_error::DriverError &error) {
            if (error.kind() != driver_error::ErrorKind::StaleHandle) {
                throw;
            }
            debug_log::log("query: skipped node that disappeared, selector = " + selector);
        }
    }
    return nodes;
}

RemoteHandle HandleRegistry::find(const RemoteHandle &from, const std::string &selector,
                                  const retry_engine::WaitOptions &options, std::optional<std::string> display_name) {
    check_owner(from);
    std::string expression = "find \"" + selector + "\" from " + to_string(from);
    std::optional<RemoteHandle> node = retry_engine::wait(
        [&]() -> std::optional<RemoteHandle> {
            json node_ids = query_node_ids(context_node_id(from, selector), selector);
            if (node_ids.empty()) {
                return std::nullopt;
            }
            if (node_ids.size() > 1) {
                throw driver_error::usage_error("Found too many (" + std::to_string(node_ids.size()) +
                                                ") nodes with selector \"" + selector + "\" from " +
                                                to_string(from));
            }
            Lookup lookup;
            lookup.node_id = node_ids[0].get<int>();
            return wrap(lookup, &from, display_name, selector);
        },
        options, expression);
    return *node;
}

RemoteHandle HandleRegistry::adopt(const std::string &object_id, std::optional<std::string> display_name) {
    return RemoteHandle(connection_, object_id, std::move(display_name));
}

std::string HandleRegistry::get_object_id(const RemoteHandle &handle) {
    check_owner(handle);
    check_in_document(handle.cached_object_id());
    return handle.cached_object_id();
}

int HandleRegistry::get_node_id(const RemoteHandle &handle) {
    std::string object_id = get_object_id(handle);
    json params;
    params["objectId"] = object_id;
    json response = call("DOM.requestNode", params);
    if (!response.contains("nodeId") || !response["nodeId"].is_number_integer() || response["nodeId"].get<int>() == 0) {
        throw driver_error::stale_handle_error();
    }
    return response["nodeId"].get<int>();
}

std::string HandleRegistry::describe(const RemoteHandle &handle) noexcept {
    try {
        check_owner(handle);
        json params;
        params["objectId"] = handle.cached_object_id();
        json response = call("DOM.describeNode", params);
        const json &node = response.at("node");
        std::string tag_name = node.at("nodeName").get<std::string>();
        std::transform(tag_name.begin(), tag_name.end(), tag_name.begin(),
                       [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

        std::string element_id;
        std::string class_attribute;
        if (node.contains("attributes") && node["attributes"].is_array()) {
            const json &attributes = node["attributes"];
            for (size_t index = 0; index + 1 < attributes.size(); index += 2) {
                if (attributes[index] == "id") {
                    element_id = attributes[index + 1].get<std::string>();
                } else if (attributes[index] == "class") {
                    class_attribute = attributes[index + 1].get<std::string>();
                }
            }
        }

        std::string description = tag_name;
        if (!element_id.empty()) {
            description += "#" + element_id;
        }
        std::istringstream classes(class_attribute);
        std::string class_name;
        while (classes >> class_name) {
            description += "." + class_name;
        }
        return description;
    } catch (const driver_error::DriverError &error) {
        if (error.kind() == driver_error::ErrorKind::StaleHandle ||
            (error.kind() == driver_error::ErrorKind::Protocol && error.code() == cdp_message::SERVER_ERROR)) {
            return "stale";
        }
        return std::string("error: ") + error.what();
    } catch (const std::exception &error) {
        return std::string("error: ") + error.what();
    }
}

std::string HandleRegistry::name_of(const RemoteHandle &handle) noexcept {
    if (handle.display_name()) {
        return *handle.display_name();
    }
    if (handle.selector()) {
        return *handle.selector();
    }
    return describe(handle);
}

void HandleRegistry::release(const RemoteHandle &handle) {
    check_owner(handle);
    json params;
    params["objectId"] = handle.cached_object_id();
    try {
        call("Runtime.releaseObject", params);
    } catch (const driver_error::DriverError &error) {
        if (error.kind() != driver_error::ErrorKind::StaleHandle) {
            throw;
        }
        debug_log::log("release: object already gone, id=" + handle.cached_object_id());
    }
}

void HandleRegistry::release_all() {
    json params;
    params["objectGroup"] = object_group_;
    call("Runtime.releaseObjectGroup", params);
    debug_log::log("release_all: released object group " + object_group_);
}

void HandleRegistry::collect_handles(const Argument &argument, json &path, json &plain, MarshaledArguments &output) {
    switch (argument.type()) {
    case Argument::Type::Value:
        plain = argument.value();
        return;
    case Argument::Type::Handle: {
        json call_argument;
        call_argument["objectId"] = get_object_id(argument.handle());
        output.call_arguments.push_back(call_argument);
        output.handle_paths.push_back(path);
        plain = nullptr;
        return;
    }
    case Argument::Type::Object:
        plain = json::object();
        for (size_t index = 0; index < argument.children().size(); ++index) {
            const std::string &key = argument.keys()[index];
            path.push_back(key);
            collect_handles(argument.children()[index], path, plain[key], output);
            path.erase(path.size() - 1);
        }
        return;
    case Argument::Type::Array:
        plain = json::array();
        for (size_t index = 0; index < argument.children().size(); ++index) {
            path.push_back(index);
            plain.push_back(nullptr);
            collect_handles(argument.children()[index], path, plain[index], output);
            path.erase(path.size() - 1);
        }
        return;
    }
}

MarshaledArguments HandleRegistry::marshal_arguments(const Argument &arguments) {
    MarshaledArguments output;
    json value_argument;
    if (!arguments.contains_handles()) {
        value_argument["value"] = plain_value(arguments);
        output.call_arguments.push_back(value_argument);
        return output;
    }

    json path = json::array();
    json plain;
    // Slot 0 holds the plain tree; handle arguments are appended after it.
    output.call_arguments.push_back(json::object());
    collect_handles(arguments, path, plain, output);
    value_argument["value"] = plain;
    output.call_arguments[0] = value_argument;
    return output;
}

ResultValue HandleRegistry::unwrap_result(const json &remote_object) {
    ResultValue result;
    if (!remote_object.contains("objectId")) {
        // Primitive or returned by value: nothing to re-wrap.
        result.data = remote_object.contains("value") ? remote_object["value"] : json(nullptr);
        return result;
    }

    std::string envelope_id = remote_object["objectId"].get<std::string>();
    try {
        result = read_envelope(envelope_id);
    } catch (const json::exception &error) {
        release_envelope(envelope_id);
        throw driver_error::script_error(std::string("Malformed result envelope: ") + error.what());
    } catch (const driver_error::DriverError &) {
        release_envelope(envelope_id);
        throw;
    }
    release_envelope(envelope_id);
    return result;
}

ResultValue HandleRegistry::read_envelope(const std::string &envelope_id) {
    json params;
    params["objectId"] = envelope_id;
    params["ownProperties"] = true;
    json response = call("Runtime.getProperties", params);

    std::string serialized_data = "null";
    json reference_paths = json::array();
    std::map<std::string, std::string> reference_ids;
    if (response.contains("result") && response["result"].is_array()) {
        for (const auto &property : response["result"]) {
            if (!property.contains("name") || !property.contains("value")) {
                continue;
            }
            std::string name = property["name"].get<std::string>();
            const json &value = property["value"];
            if (name == "str" && value.contains("value") && value["value"].is_string()) {
                serialized_data = value["value"].get<std::string>();
            } else if (name == "refs" && value.contains("value") && value["value"].is_string()) {
                reference_paths = json::parse(value["value"].get<std::string>());
            } else if (name.compare(0, 4, "ref_") == 0 && value.contains("objectId")) {
                reference_ids[name] = value["objectId"].get<std::string>();
            }
        }
    }

    ResultValue result;
    result.data = json::parse(serialized_data);
    for (size_t index = 0; index < reference_paths.size(); ++index) {
        auto id_iterator = reference_ids.find("ref_" + std::to_string(index));
        if (id_iterator == reference_ids.end()) {
            throw driver_error::stale_handle_error("Remote result reference ref_" + std::to_string(index) +
                                                   " disappeared before it could be wrapped");
        }
        result.handles.emplace_back(pointer_from_path(reference_paths[index]),
                                    RemoteHandle(connection_, id_iterator->second));
    }
    return result;
}

void HandleRegistry::release_envelope(const std::string &envelope_id) noexcept {
    json release_params;
    release_params["objectId"] = envelope_id;
    try {
        call("Runtime.releaseObject", release_params);
    } catch (const driver_error::DriverError &error) {
        if (error.kind() != driver_error::ErrorKind::StaleHandle) {
            debug_log::warn(std::string("Could not release result envelope ") + envelope_id + ": " + error.what());
        }
    } catch (const std::exception &error) {
        debug_log::warn(std::string("Could not release result envelope ") + envelope_id + ": " + error.what());
    }
}

} // namespace remote_handle
