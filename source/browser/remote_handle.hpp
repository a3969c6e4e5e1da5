#ifndef CDPSYNC_REMOTE_HANDLE_HPP
#define CDPSYNC_REMOTE_HANDLE_HPP

// Remote handles: client-side references to browser-side DOM nodes and JS
// objects. A handle is an immutable value keyed by its CDP objectId. It is
// cached client-side, so every trusted use re-validates it against the page;
// a handle whose object is gone is stale forever and a fresh lookup must
// produce a new one.

#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "browser/cdp/cdp_transport.hpp"
#include "browser/retry_engine.hpp"

namespace remote_handle {

using json = nlohmann::json;

// How to find the remote object. objectId is the primary representation;
// backendNodeId and nodeId are resolved to an objectId, in that order.
struct Lookup {
    std::optional<std::string> object_id;
    std::optional<int> backend_node_id;
    std::optional<int> node_id;
};

class RemoteHandle {
public:
    RemoteHandle(std::shared_ptr<cdp_transport::Connection> connection, std::string object_id,
                 std::optional<std::string> display_name = std::nullopt,
                 std::optional<std::string> selector = std::nullopt);

    const std::shared_ptr<cdp_transport::Connection> &connection() const { return connection_; }

    // The cached id, without a liveness check. Use HandleRegistry::get_object_id
    // before sending it anywhere that trusts it.
    const std::string &cached_object_id() const { return object_id_; }

    const std::optional<std::string> &display_name() const { return display_name_; }
    const std::optional<std::string> &selector() const { return selector_; }

    // Renamed copy; the original is unchanged.
    RemoteHandle with_display_name(const std::string &name) const;

    bool same_object(const RemoteHandle &other) const;

private:
    std::shared_ptr<cdp_transport::Connection> connection_;
    std::string object_id_;
    std::optional<std::string> display_name_;
    std::optional<std::string> selector_;
};

// Offline representation: object id, name and selector. Never talks to the
// browser; use HandleRegistry::describe() for the tag/id/class form.
std::string to_string(const RemoteHandle &handle);
std::ostream &operator<<(std::ostream &stream, const RemoteHandle &handle);

// Call argument tree: plain JSON leaves and handles nested in objects/arrays.
class Argument {
public:
    enum class Type { Value, Handle, Object, Array };

    Argument();
    Argument(json value);
    Argument(RemoteHandle handle);

    Type type() const { return type_; }
    const json &value() const { return value_; }
    const RemoteHandle &handle() const { return *handle_; }
    const std::vector<std::string> &keys() const { return keys_; }
    const std::vector<Argument> &children() const { return children_; }

    // False for trees made only of plain JSON; marshaling skips the walk then.
    bool contains_handles() const { return contains_handles_; }

    friend Argument make_object(std::vector<std::pair<std::string, Argument>> members);
    friend Argument make_array(std::vector<Argument> elements);

private:
    Type type_ = Type::Value;
    json value_;
    std::shared_ptr<const RemoteHandle> handle_;
    std::vector<std::string> keys_;     // Object only, parallel to children_
    std::vector<Argument> children_;
    bool contains_handles_ = false;
};

Argument make_object(std::vector<std::pair<std::string, Argument>> members);
Argument make_array(std::vector<Argument> elements);

// CDP Runtime.CallArgument list for one marshaled argument tree.
// call_arguments[0] is {value: tree with handle positions nulled}; each
// following entry is {objectId} for the handle at handle_paths[i - 1].
struct MarshaledArguments {
    json call_arguments = json::array();
    json handle_paths = json::array(); // array of paths; each path an array of keys/indexes
};

// JS statements that put __refs[i] back at handle_paths[i] inside __args.
// Empty when there are no handles.
std::string rebuild_prologue(const json &handle_paths);

// Result of a page-side call: JSON data with null at every position that held
// a remote object, and the handles for those positions keyed by JSON pointer.
struct ResultValue {
    json data;
    std::vector<std::pair<std::string, RemoteHandle>> handles;

    // Handle at a JSON pointer such as "/items/0", or nullptr.
    const RemoteHandle *handle_at(const std::string &pointer) const;
};

// JSON pointer ("/a/0") for a path array (["a", 0]).
std::string pointer_from_path(const json &path);

// True for ProtocolErrors the browser raises for nodes/objects that are gone.
bool is_stale_protocol_error(long code, const std::string &message);

// Resolves, validates, describes, marshals and releases handles for one
// connection. All objects it resolves join one CDP object group, released
// together by release_all().
class HandleRegistry {
public:
    HandleRegistry(std::shared_ptr<cdp_transport::Connection> connection, int call_timeout_milliseconds);

    const std::shared_ptr<cdp_transport::Connection> &connection() const { return connection_; }
    const std::string &object_group() const { return object_group_; }
    int call_timeout_milliseconds() const { return call_timeout_milliseconds_; }

    // Produce a handle for lookup, or nullopt when lookup names nothing.
    // context (may be null) contributes its selector to the breadcrumb.
    // Throws StaleHandleError when the node no longer exists.
    std::optional<RemoteHandle> wrap(const Lookup &lookup, const RemoteHandle *context = nullptr,
                                     std::optional<std::string> display_name = std::nullopt,
                                     std::optional<std::string> selector = std::nullopt);

    // Nodes under from matching the CSS selector, in document order, without
    // waiting. Matches that disappear while being wrapped are skipped. Each
    // handle's breadcrumb is from's selector followed by selector.
    std::vector<RemoteHandle> query(const RemoteHandle &from, const std::string &selector,
                                    std::optional<std::string> display_name = std::nullopt);

    // Exactly one node under from matching the CSS selector. Polls until a
    // match appears or options.timeout_milliseconds pass (TimeoutError).
    // Several matches raise UsageError at once; an invalid selector raises
    // ProtocolError at once.
    RemoteHandle find(const RemoteHandle &from, const std::string &selector, const retry_engine::WaitOptions &options,
                      std::optional<std::string> display_name = std::nullopt);

    // Liveness round trip, then the id. Throws StaleHandleError.
    std::string get_object_id(const RemoteHandle &handle);
    int get_node_id(const RemoteHandle &handle);

    // "tag#id.class" for nodes; "stale" or "error: ..." instead of throwing.
    std::string describe(const RemoteHandle &handle) noexcept;

    // Display name, else selector, else describe().
    std::string name_of(const RemoteHandle &handle) noexcept;

    // Drop the browser-side reference. Releasing a stale handle is a no-op.
    void release(const RemoteHandle &handle);

    // Drop every object resolved through this registry.
    void release_all();

    // Substitute live objectIds for the handles in arguments.
    MarshaledArguments marshal_arguments(const Argument &arguments);

    // Turn a page-side call result back into JSON plus handles.
    // remote_object is the Runtime.RemoteObject returned by callFunctionOn:
    // either an inline value (fast path) or the {str, refs, ref_N} envelope
    // built by the page helper.
    ResultValue unwrap_result(const json &remote_object);

    // Wrap a raw objectId obtained elsewhere (e.g. Runtime.evaluate).
    RemoteHandle adopt(const std::string &object_id, std::optional<std::string> display_name = std::nullopt);

private:
    json call(const std::string &method, const json &params);
    void check_in_document(const std::string &object_id);
    void check_owner(const RemoteHandle &handle) const;
    int context_node_id(const RemoteHandle &from, const std::string &selector);
    json query_node_ids(int context_node_id, const std::string &selector);
    ResultValue read_envelope(const std::string &envelope_id);
    void release_envelope(const std::string &envelope_id) noexcept;
    void collect_handles(const Argument &argument, json &path, json &plain, MarshaledArguments &output);

    std::shared_ptr<cdp_transport::Connection> connection_;
    int call_timeout_milliseconds_;
    std::string object_group_;
};

} // namespace remote_handle

#endif // CDPSYNC_REMOTE_HANDLE_HPP
