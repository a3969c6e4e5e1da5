#ifndef CDPSYNC_JS_RUNTIME_HPP
#define CDPSYNC_JS_RUNTIME_HPP

// Page-side JavaScript execution.
// Code runs as the body of an async function bound to a node handle or to the
// window object. Named arguments may carry handles anywhere inside plain JSON;
// results come back as JSON with remote objects re-wrapped as handles.

#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "browser/cdp/cdp_transport.hpp"
#include "browser/remote_handle.hpp"

namespace js_runtime {

using json = nlohmann::json;

// Name of the helper object installed into every document.
constexpr const char *RUNTIME_GLOBAL = "__CDPSYNC__";

// The `this` of an executed snippet: the window object or one node handle.
class ExecutionTarget {
public:
    static ExecutionTarget window();
    static ExecutionTarget node(remote_handle::RemoteHandle handle);

    bool is_window() const { return !handle_.has_value(); }

    // Only valid when !is_window().
    const remote_handle::RemoteHandle &handle() const { return *handle_; }

private:
    ExecutionTarget() = default;

    std::optional<remote_handle::RemoteHandle> handle_;
};

using NamedArguments = std::vector<std::pair<std::string, remote_handle::Argument>>;

// JavaScript source of the page-side helper.
const std::string &runtime_source();

// Register the helper for every new document and evaluate it in the current one.
void install_runtime(const std::shared_ptr<cdp_transport::Connection> &connection, int timeout_milliseconds);

// Run code (a function body; use `return` to produce a value) with the named
// arguments bound as local constants. Throws ScriptError when the code throws
// or returns something that cannot be transferred, UsageError for argument
// names that are not JavaScript identifiers, StaleHandleError for dead handles.
remote_handle::ResultValue exec_js(remote_handle::HandleRegistry &registry, const ExecutionTarget &target,
                                   const std::string &code, const NamedArguments &arguments = {});

// exec_js of `return (expression);`.
remote_handle::ResultValue eval_js(remote_handle::HandleRegistry &registry, const ExecutionTarget &target,
                                   const std::string &expression, const NamedArguments &arguments = {});

// Builds the Runtime.callFunctionOn functionDeclaration for exec_js().
std::string build_function_declaration(const std::string &code, const std::vector<std::string> &argument_names,
                                       const json &handle_paths);

// True for names usable as `const <name>` in the generated wrapper.
bool is_valid_argument_name(const std::string &name);

} // namespace js_runtime

#endif // CDPSYNC_JS_RUNTIME_HPP
