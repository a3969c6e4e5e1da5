#include "browser/js_runtime.hpp"
#include "browser/driver_error.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>

namespace js_runtime {

// Serializes a value as JSON text, replacing every non-plain object (nodes,
// functions, class instances) with null and exposing it as ref_<n>, with its
// path recorded in refs.
static const char *kRuntimeSource = R"JS(
(function () {
  if (window.__CDPSYNC__) return;
  const isPlainObject = v => {
    if (v === null || typeof v !== "object") return false;
    const proto = Object.getPrototypeOf(v);
    return proto === Object.prototype || proto === null;
  };
  window.__CDPSYNC__ = {
    wrapResult: x => {
      const refs = [];
      const result = {};
      const stringify = (v, path) => {
        const t = typeof v;
        if (t === "number" || t === "string" || t === "boolean" || v === null) {
          return JSON.stringify(v);
        } else if (t === "undefined") {
          return "null";
        } else if (Array.isArray(v)) {
          return "[" + v.map((item, i) => stringify(item, path.concat([i]))).join(",") + "]";
        } else if (isPlainObject(v)) {
          return "{" + Object.keys(v).map(k => JSON.stringify(k) + ":" + stringify(v[k], path.concat([k]))).join(",") + "}";
        }
        result["ref_" + refs.length] = v;
        refs.push(path);
        return "null";
      };
      result.str = stringify(x, []);
      if (refs.length > 0) {
        result.refs = JSON.stringify(refs);
      }
      return result;
    }
  };
})();
)JS";

static const char *kReturnByValueFailure = "Object couldn't be returned by value";

ExecutionTarget ExecutionTarget::window() {
    return ExecutionTarget();
}

ExecutionTarget ExecutionTarget::node(remote_handle::RemoteHandle handle) {
    ExecutionTarget target;
    target.handle_ = std::move(handle);
    return target;
}

const std::string &runtime_source() {
    static const std::string source(kRuntimeSource);
    return source;
}

void install_runtime(const std::shared_ptr<cdp_transport::Connection> &connection, int timeout_milliseconds) {
    json script_params;
    script_params["source"] = runtime_source();
    connection->invoke("Page.addScriptToEvaluateOnNewDocument", script_params, timeout_milliseconds);

    json evaluate_params;
    evaluate_params["expression"] = runtime_source();
    json response = connection->invoke("Runtime.evaluate", evaluate_params, timeout_milliseconds);
    if (response.contains("exceptionDetails")) {
        debug_log::warn("Could not install page runtime into the current document");
    } else {
        debug_log::log("install_runtime: page runtime installed");
    }
}

bool is_valid_argument_name(const std::string &name) {
    if (name.empty()) {
        return false;
    }
    auto is_start = [](unsigned char character) {
        return std::isalpha(character) || character == '_' || character == '$';
    };
    if (!is_start(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    if (name.compare(0, 2, "__") == 0) {
        // Reserved for the generated wrapper.
        return false;
    }
    return std::all_of(name.begin() + 1, name.end(), [&is_start](char character) {
        unsigned char byte = static_cast<unsigned char>(character);
        return is_start(byte) || std::isdigit(byte);
    });
}

std::string build_function_declaration(const std::string &code, const std::vector<std::string> &argument_names,
                                       const json &handle_paths) {
    std::string declaration = "async function(__args, ...__refs) {\n";
    declaration += remote_handle::rebuild_prologue(handle_paths);
    for (const auto &name : argument_names) {
        declaration += "const " + name + " = __args[" + json(name).dump() + "];\n";
    }
    declaration += "const __value = await (async function() {\n" + code + "\n}).call(this);\n";
    declaration += "if (__value === null || (typeof __value !== \"object\" && typeof __value !== \"function\")) "
                   "return __value;\n";
    declaration += std::string("return window.") + RUNTIME_GLOBAL + ".wrapResult(__value);\n}";
    return declaration;
}

static std::string window_object_id(remote_handle::HandleRegistry &registry) {
    json params;
    params["expression"] = "window";
    params["objectGroup"] = registry.object_group();
    json response = registry.connection()->invoke("Runtime.evaluate", params, registry.call_timeout_milliseconds());
    if (!response.contains("result") || !response["result"].contains("objectId")) {
        throw driver_error::stale_handle_error("Could not resolve the window object of the current document");
    }
    return response["result"]["objectId"].get<std::string>();
}

static std::string exception_description(const json &exception_details) {
    if (exception_details.contains("exception") && exception_details["exception"].contains("description") &&
        exception_details["exception"]["description"].is_string()) {
        return exception_details["exception"]["description"].get<std::string>();
    }
    if (exception_details.contains("text") && exception_details["text"].is_string()) {
        return exception_details["text"].get<std::string>();
    }
    return exception_details.dump();
}

remote_handle::ResultValue exec_js(remote_handle::HandleRegistry &registry, const ExecutionTarget &target,
                                   const std::string &code, const NamedArguments &arguments) {
    NamedArguments sorted_arguments = arguments;
    std::sort(sorted_arguments.begin(), sorted_arguments.end(),
              [](const auto &left, const auto &right) { return left.first < right.first; });

    std::vector<std::string> argument_names;
    for (const auto &argument : sorted_arguments) {
        if (!is_valid_argument_name(argument.first)) {
            throw driver_error::usage_error("Call argument names must be JavaScript identifiers but got: " +
                                            argument.first);
        }
        if (!argument_names.empty() && argument_names.back() == argument.first) {
            throw driver_error::usage_error("Duplicate call argument name: " + argument.first);
        }
        argument_names.push_back(argument.first);
    }

    remote_handle::MarshaledArguments marshaled =
        registry.marshal_arguments(remote_handle::make_object(sorted_arguments));

    std::string object_id =
        target.is_window() ? window_object_id(registry) : registry.get_object_id(target.handle());

    json params;
    params["functionDeclaration"] = build_function_declaration(code, argument_names, marshaled.handle_paths);
    params["objectId"] = object_id;
    params["arguments"] = marshaled.call_arguments;
    params["awaitPromise"] = true;
    params["returnByValue"] = false;
    params["objectGroup"] = registry.object_group();

    json response;
    try {
        response = registry.connection()->invoke("Runtime.callFunctionOn", params,
                                                 registry.call_timeout_milliseconds());
    } catch (const driver_error::DriverError &error) {
        if (error.kind() == driver_error::ErrorKind::Protocol) {
            std::string message = error.what();
            if (message.find(kReturnByValueFailure) != std::string::npos) {
                throw driver_error::script_error("Only primitives, objects and arrays accepted as return value");
            }
            if (remote_handle::is_stale_protocol_error(error.code(), message)) {
                throw driver_error::stale_handle_error();
            }
        }
        throw;
    }

    if (response.contains("exceptionDetails")) {
        throw driver_error::script_error(exception_description(response["exceptionDetails"]));
    }
    if (!response.contains("result")) {
        return remote_handle::ResultValue{};
    }
    return registry.unwrap_result(response["result"]);
}

remote_handle::ResultValue eval_js(remote_handle::HandleRegistry &registry, const ExecutionTarget &target,
                                   const std::string &expression, const NamedArguments &arguments) {
    return exec_js(registry, target, "return (" + expression + ");", arguments);
}

} // namespace js_runtime
