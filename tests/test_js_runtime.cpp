// Tests for page-side JavaScript execution through Runtime.callFunctionOn.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

#include "browser/driver_error.hpp"
#include "browser/js_runtime.hpp"
#include "browser/remote_handle.hpp"
#include "loopback_socket.hpp"

using json = nlohmann::json;

namespace test_js_runtime {

static const int kCallTimeoutMilliseconds = 2000;

static bool report(bool success, const std::string &ok_message, const std::string &fail_message) {
    if (success) {
        std::cout << "  OK: " << ok_message << std::endl;
    } else {
        std::cout << "  FAIL: " << fail_message << std::endl;
    }
    return success;
}

static void window_available(test_support::LoopbackSocket &socket) {
    socket.set_result("Runtime.evaluate", json{{"result", {{"type", "object"}, {"objectId", "window-1"}}}});
}

// Test: Helper is registered for new documents and evaluated once now.
static bool test_install_runtime() {
    auto loopback = test_support::open_loopback(window_available);
    js_runtime::install_runtime(loopback.connection, kCallTimeoutMilliseconds);

    std::vector<json> registered = loopback.socket->sent_with_method("Page.addScriptToEvaluateOnNewDocument");
    std::vector<json> evaluated = loopback.socket->sent_with_method("Runtime.evaluate");
    bool success = registered.size() == 1 && evaluated.size() == 1 &&
                   registered[0]["params"]["source"] == js_runtime::runtime_source() &&
                   js_runtime::runtime_source().find("wrapResult") != std::string::npos;
    return report(success, "install_runtime registers and evaluates the helper", "helper was not installed");
}

// Test: Window-bound code with plain arguments returns its value.
static bool test_eval_on_window() {
    auto loopback = test_support::open_loopback([](test_support::LoopbackSocket &socket) {
        window_available(socket);
        socket.set_result("Runtime.callFunctionOn", json{{"result", {{"type", "number"}, {"value", 5}}}});
    });
    remote_handle::HandleRegistry registry(loopback.connection, kCallTimeoutMilliseconds);

    js_runtime::NamedArguments arguments = {{"b", remote_handle::Argument(json(3))},
                                            {"a", remote_handle::Argument(json(2))}};
    remote_handle::ResultValue result =
        js_runtime::eval_js(registry, js_runtime::ExecutionTarget::window(), "a + b", arguments);

    json call = loopback.socket->wait_for_sent("Runtime.callFunctionOn", 1, kCallTimeoutMilliseconds);
    std::string declaration = call["params"]["functionDeclaration"].get<std::string>();
    bool success = result.data == 5 && call["params"]["objectId"] == "window-1" &&
                   call["params"]["awaitPromise"] == true &&
                   call["params"]["arguments"][0]["value"] == json::parse(R"({"a":2,"b":3})") &&
                   declaration.find("return (a + b);") != std::string::npos &&
                   declaration.find("const a = __args[\"a\"];") < declaration.find("const b = __args[\"b\"];");
    return report(success, "eval_js binds named arguments and returns the value", "call was: " + call.dump());
}

// Test: A thrown exception becomes a fatal ScriptError with its description.
static bool test_exception_raises_script_error() {
    auto loopback = test_support::open_loopback([](test_support::LoopbackSocket &socket) {
        window_available(socket);
        json details;
        details["text"] = "Uncaught";
        details["exception"]["description"] = "ReferenceError: missing is not defined";
        socket.set_result("Runtime.callFunctionOn",
                          json{{"result", {{"type", "object"}, {"subtype", "error"}}}, {"exceptionDetails", details}});
    });
    remote_handle::HandleRegistry registry(loopback.connection, kCallTimeoutMilliseconds);

    bool success = false;
    try {
        js_runtime::exec_js(registry, js_runtime::ExecutionTarget::window(), "return missing;");
    } catch (const driver_error::DriverError &error) {
        success = error.kind() == driver_error::ErrorKind::Script && !error.retryable() &&
                  std::string(error.what()).find("ReferenceError: missing is not defined") != std::string::npos;
    }
    return report(success, "Page exception raises ScriptError", "ScriptError not raised");
}

// Test: Values that cannot be transferred raise ScriptError.
static bool test_unreturnable_value() {
    auto loopback = test_support::open_loopback([](test_support::LoopbackSocket &socket) {
        window_available(socket);
        socket.set_error("Runtime.callFunctionOn", -32000, "Object couldn't be returned by value");
    });
    remote_handle::HandleRegistry registry(loopback.connection, kCallTimeoutMilliseconds);

    bool success = false;
    try {
        js_runtime::exec_js(registry, js_runtime::ExecutionTarget::window(), "return window;");
    } catch (const driver_error::DriverError &error) {
        success = error.kind() == driver_error::ErrorKind::Script &&
                  std::string(error.what()).find("Only primitives, objects and arrays") != std::string::npos;
    }
    return report(success, "Unreturnable value raises ScriptError", "wrong error for unreturnable value");
}

// Test: Argument names must be plain identifiers.
static bool test_invalid_argument_names() {
    auto loopback = test_support::open_loopback(window_available);
    remote_handle::HandleRegistry registry(loopback.connection, kCallTimeoutMilliseconds);

    bool success = false;
    try {
        js_runtime::exec_js(registry, js_runtime::ExecutionTarget::window(), "return 1;",
                            {{"not valid", remote_handle::Argument(json(1))}});
    } catch (const driver_error::DriverError &error) {
        success = error.kind() == driver_error::ErrorKind::Usage;
    }
    success = success && js_runtime::is_valid_argument_name("node") && js_runtime::is_valid_argument_name("$el2") &&
              !js_runtime::is_valid_argument_name("2x") && !js_runtime::is_valid_argument_name("__args") &&
              loopback.socket->sent_with_method("Runtime.callFunctionOn").empty();
    return report(success, "Invalid argument names raise UsageError before sending", "argument names not validated");
}

// Test: Handle arguments are sent by objectId and rebuilt in the page.
static bool test_handle_argument_on_node_target() {
    auto loopback = test_support::open_loopback([](test_support::LoopbackSocket &socket) {
        socket.on_command("Runtime.callFunctionOn", [](test_support::LoopbackSocket &peer, const json &command) {
            // Liveness checks use returnByValue; the user call does not.
            if (command["params"]["returnByValue"] == true) {
                peer.reply(command, json{{"result", {{"type", "boolean"}, {"value", true}}}});
            } else {
                peer.reply(command, json{{"result", {{"type", "string"}, {"value", "ok"}}}});
            }
        });
    });
    remote_handle::HandleRegistry registry(loopback.connection, kCallTimeoutMilliseconds);
    remote_handle::RemoteHandle target = registry.adopt("obj-form");
    remote_handle::RemoteHandle input = registry.adopt("obj-input");

    remote_handle::ResultValue result =
        js_runtime::exec_js(registry, js_runtime::ExecutionTarget::node(target), "return 'ok';",
                            {{"opts", remote_handle::make_object({{"field", remote_handle::Argument(input)}})}});

    json user_call;
    for (const auto &call : loopback.socket->sent_with_method("Runtime.callFunctionOn")) {
        if (call["params"]["returnByValue"] == false) {
            user_call = call;
        }
    }
    std::string declaration = user_call["params"]["functionDeclaration"].get<std::string>();
    bool success = result.data == "ok" && user_call["params"]["objectId"] == "obj-form" &&
                   user_call["params"]["arguments"].size() == 2 &&
                   user_call["params"]["arguments"][1]["objectId"] == "obj-input" &&
                   declaration.find(R"(__set(__args, ["opts","field"], __refs[0]))") != std::string::npos;
    return report(success, "Handle arguments travel by objectId", "handle argument marshaling is wrong");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_install_runtime();
    all_passed &= test_eval_on_window();
    all_passed &= test_exception_raises_script_error();
    all_passed &= test_unreturnable_value();
    all_passed &= test_invalid_argument_names();
    all_passed &= test_handle_argument_on_node_target();
    return all_passed;
}

} // namespace test_js_runtime
