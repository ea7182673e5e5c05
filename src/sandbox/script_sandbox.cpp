#include "sandbox/script_sandbox.hpp"

#include <cstring>
#include <optional>
#include <regex>
#include <sstream>
#include <string>

#include "quickjs.h"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace hoya::sandbox {
namespace {

// Evaluates to a function taking the native writer; installs console.*.
constexpr const char* kConsoleShim = R"((function (write) {
    function render(args) {
        var parts = [];
        for (var i = 0; i < args.length; i++) {
            var value = args[i];
            if (typeof value === 'object' && value !== null) {
                try {
                    parts.push(JSON.stringify(value));
                } catch (e) {
                    parts.push(String(value));
                }
            } else {
                parts.push(String(value));
            }
        }
        return parts.join(' ');
    }
    function out() { write(0, render(arguments)); }
    function err() { write(1, render(arguments)); }
    globalThis.console = {
        log: out,
        info: out,
        debug: out,
        trace: out,
        warn: err,
        error: err
    };
}))";

constexpr const char* kTimeoutMessage = "script exceeded its execution time budget";

HostBridge* BridgeFrom(JSContext* ctx) {
    return static_cast<HostBridge*>(JS_GetContextOpaque(ctx));
}

// Returns nullopt (with the pending exception cleared) when the value cannot
// be converted, e.g. a Symbol.
std::optional<std::string> ToStdString(JSContext* ctx, JSValueConst value) {
    std::size_t length = 0;
    const char* text = JS_ToCStringLen(ctx, &length, value);
    if (!text) {
        JS_FreeValue(ctx, JS_GetException(ctx));
        return std::nullopt;
    }
    std::string result(text, length);
    JS_FreeCString(ctx, text);
    return result;
}

std::string GetStringProperty(JSContext* ctx, JSValueConst object, const char* name) {
    JSValue value = JS_GetPropertyStr(ctx, object, name);
    if (JS_IsException(value)) {
        JS_FreeValue(ctx, JS_GetException(ctx));
        return {};
    }
    std::string result;
    if (!JS_IsUndefined(value) && !JS_IsNull(value)) {
        result = ToStdString(ctx, value).value_or("");
    }
    JS_FreeValue(ctx, value);
    return result;
}

// JSON text of value, or nullopt with the exception left pending.
std::optional<nlohmann::json> ToJson(JSContext* ctx, JSValueConst value) {
    JSValue json = JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED);
    if (JS_IsException(json)) {
        return std::nullopt;
    }
    nlohmann::json parsed;
    if (JS_IsString(json)) {
        const auto text = ToStdString(ctx, json).value_or("null");
        parsed = nlohmann::json::parse(text, nullptr, false);
        if (parsed.is_discarded()) {
            parsed = nullptr;
        }
    }
    JS_FreeValue(ctx, json);
    return parsed;
}

std::string ValueToText(JSContext* ctx, JSValueConst value) {
    if (JS_IsObject(value) && !JS_IsFunction(ctx, value)) {
        JSValue json = JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED);
        if (JS_IsException(json)) {
            JS_FreeValue(ctx, JS_GetException(ctx));
        } else {
            std::optional<std::string> text;
            if (JS_IsString(json)) {
                text = ToStdString(ctx, json);
            }
            JS_FreeValue(ctx, json);
            if (text) {
                return *text;
            }
        }
    }
    return ToStdString(ctx, value).value_or("[unrepresentable value]");
}

void AddLocation(JSContext* ctx, JSValueConst exception, const std::string& stack,
                 nlohmann::json& details) {
    JSValue line = JS_GetPropertyStr(ctx, exception, "lineNumber");
    JSValue column = JS_GetPropertyStr(ctx, exception, "columnNumber");
    int32_t number = 0;
    if (JS_IsNumber(line) && JS_ToInt32(ctx, &number, line) == 0) {
        details["line"] = number;
        if (JS_IsNumber(column) && JS_ToInt32(ctx, &number, column) == 0) {
            details["column"] = number;
        }
    }
    JS_FreeValue(ctx, line);
    JS_FreeValue(ctx, column);
    if (details.contains("line")) {
        return;
    }

    // "    at script.js:3:14" or "    at foo (script.js:3)"
    static const std::regex kLocation(R"(:(\d+)(?::(\d+))?\)?\s*$)");
    std::istringstream lines(stack);
    std::string entry;
    while (std::getline(lines, entry)) {
        std::smatch match;
        if (std::regex_search(entry, match, kLocation)) {
            details["line"] = std::stoi(match[1].str());
            if (match[2].matched) {
                details["column"] = std::stoi(match[2].str());
            }
            return;
        }
    }
}

ExecutionError DescribeException(JSContext* ctx, JSValueConst exception, ErrorKind kind) {
    ExecutionError error{};
    error.kind = kind;
    nlohmann::json details = nlohmann::json::object();
    if (JS_IsError(ctx, exception)) {
        const auto name = GetStringProperty(ctx, exception, "name");
        const auto message = GetStringProperty(ctx, exception, "message");
        const auto stack = GetStringProperty(ctx, exception, "stack");
        error.message = name.empty() ? message : name + ": " + message;
        details["name"] = name;
        if (!stack.empty()) {
            details["stack"] = stack;
        }
        if (kind == ErrorKind::kSyntaxError) {
            AddLocation(ctx, exception, stack, details);
        }
        if (name == "InternalError" && message.find("out of memory") != std::string::npos) {
            error.kind = ErrorKind::kResourceLimitExceeded;
        }
    } else {
        error.message = "Uncaught " + ValueToText(ctx, exception);
        auto value = ToJson(ctx, exception);
        if (!value) {
            JS_FreeValue(ctx, JS_GetException(ctx));
        } else {
            details["value"] = *value;
        }
    }
    error.details = std::move(details);
    return error;
}

JSValue JsWrite(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* bridge = BridgeFrom(ctx);
    if (!bridge || argc < 2) {
        return JS_UNDEFINED;
    }
    int32_t stream = 0;
    if (JS_ToInt32(ctx, &stream, argv[0]) < 0) {
        return JS_EXCEPTION;
    }
    auto text = ToStdString(ctx, argv[1]).value_or("");
    text.push_back('\n');
    bridge->Write(stream == 1 ? Stream::kStderr : Stream::kStdout, text);
    return JS_UNDEFINED;
}

JSValue JsAppLog(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* bridge = BridgeFrom(ctx);
    if (!bridge) {
        return JS_UNDEFINED;
    }
    std::string level = "INFO";
    if (argc > 0 && !JS_IsUndefined(argv[0]) && !JS_IsNull(argv[0])) {
        level = ToStdString(ctx, argv[0]).value_or("INFO");
    }
    std::string message;
    if (argc > 1 && !JS_IsUndefined(argv[1])) {
        message = ToStdString(ctx, argv[1]).value_or("");
    }
    bridge->Log(level, message);
    return JS_UNDEFINED;
}

JSValue JsGetUnixtime(JSContext* ctx, JSValueConst, int, JSValueConst*) {
    auto* bridge = BridgeFrom(ctx);
    if (!bridge) {
        return JS_UNDEFINED;
    }
    return JS_NewInt64(ctx, bridge->CurrentUnixTime());
}

JSValue ThrowFetchError(JSContext* ctx, ErrorKind kind, const std::string& message) {
    JSValue error = JS_NewError(ctx);
    if (JS_IsException(error)) {
        return error;
    }
    JS_SetPropertyStr(ctx, error, "name", JS_NewString(ctx, ToString(kind)));
    JS_SetPropertyStr(ctx, error, "code", JS_NewString(ctx, ToString(kind)));
    JS_SetPropertyStr(ctx, error, "message", JS_NewStringLen(ctx, message.data(), message.size()));
    return JS_Throw(ctx, error);
}

// fetch(url[, options]) or fetch(options). Blocks until the bridge answers.
JSValue JsFetch(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* bridge = BridgeFrom(ctx);
    if (!bridge) {
        return JS_UNDEFINED;
    }
    if (argc < 1) {
        return JS_ThrowTypeError(ctx, "fetch requires a url or an options object");
    }

    nlohmann::json options = nlohmann::json::object();
    if (JS_IsString(argv[0])) {
        if (argc > 1 && JS_IsObject(argv[1])) {
            auto extra = ToJson(ctx, argv[1]);
            if (!extra) {
                return JS_EXCEPTION;
            }
            if (extra->is_object()) {
                options = std::move(*extra);
            }
        }
        options["url"] = ToStdString(ctx, argv[0]).value_or("");
    } else if (JS_IsObject(argv[0])) {
        auto parsed = ToJson(ctx, argv[0]);
        if (!parsed) {
            return JS_EXCEPTION;
        }
        options = std::move(*parsed);
    } else {
        return JS_ThrowTypeError(ctx, "fetch requires a url or an options object");
    }

    std::string error;
    const auto request = FetchRequestFromJson(options, error);
    if (!request) {
        return JS_ThrowTypeError(ctx, "%s", error.c_str());
    }

    const auto result = bridge->Fetch(*request);
    if (!result.Ok()) {
        return ThrowFetchError(ctx, result.error->kind, result.error->message);
    }
    auto json = FetchResultToJson(result);
    json.erase("error");
    const auto text = json.dump();
    return JS_ParseJSON(ctx, text.c_str(), text.size(), "<fetch>");
}

bool SetGlobalFunction(JSContext* ctx, JSValueConst global, const char* name,
                       JSCFunction* function, int length) {
    JSValue value = JS_NewCFunction(ctx, function, name, length);
    if (JS_IsException(value)) {
        return false;
    }
    return JS_SetPropertyStr(ctx, global, name, value) >= 0;
}

std::string ScriptName(const FetchedResource& resource) {
    const auto name = hoya::utils::UrlFileName(resource.source_url);
    return name.empty() ? std::string("<input>") : name;
}

}  // namespace

ScriptSandbox::ScriptSandbox(const hoya::config::SandboxConfig& config) {
    runtime_ = JS_NewRuntime();
    if (!runtime_) {
        return;
    }
    JS_SetMemoryLimit(runtime_, config.script_memory_limit_bytes);
    JS_SetMaxStackSize(runtime_, config.script_stack_bytes);
    JS_SetInterruptHandler(runtime_, &ScriptSandbox::InterruptHandler, this);
    context_ = JS_NewContext(runtime_);
}

ScriptSandbox::~ScriptSandbox() {
    if (context_) {
        JS_FreeContext(context_);
    }
    if (runtime_) {
        JS_FreeRuntime(runtime_);
    }
}

int ScriptSandbox::InterruptHandler(JSRuntime*, void* opaque) {
    return static_cast<ScriptSandbox*>(opaque)->interrupted_.load() ? 1 : 0;
}

void ScriptSandbox::Interrupt() {
    interrupted_.store(true);
}

SandboxResult ScriptSandbox::Execute(const FetchedResource& resource, HostBridge& bridge) {
    if (!runtime_ || !context_) {
        return Fail(ExecutionError{
            .kind = ErrorKind::kResourceLimitExceeded,
            .message = "failed to allocate a script runtime",
            .details = nullptr});
    }

    ExecutionError bind_error{};
    if (!Bind(bridge, bind_error)) {
        return Fail(std::move(bind_error));
    }

    state_.store(State::kExecuting);
    if (interrupted_.load()) {
        return Fail(ExecutionError{.kind = ErrorKind::kTimeout, .message = kTimeoutMessage, .details = nullptr});
    }

    const std::string source(resource.bytes.begin(), resource.bytes.end());
    if (hoya::utils::SanitizeUtf8(source) != source) {
        return Fail(ExecutionError{
            .kind = ErrorKind::kSyntaxError,
            .message = "script source is not valid UTF-8",
            .details = nullptr});
    }

    const auto filename = ScriptName(resource);
    JSValue compiled = JS_Eval(context_, source.c_str(), source.size(), filename.c_str(),
                               JS_EVAL_TYPE_GLOBAL | JS_EVAL_FLAG_COMPILE_ONLY);
    if (JS_IsException(compiled)) {
        return Fail(TakeException(ErrorKind::kSyntaxError));
    }

    JSValue value = JS_EvalFunction(context_, compiled);
    if (JS_IsException(value)) {
        return Fail(TakeException(ErrorKind::kRuntimeError));
    }

    // Run queued promise reactions so their output lands in the sink too.
    for (;;) {
        JSContext* job_context = nullptr;
        const int status = JS_ExecutePendingJob(runtime_, &job_context);
        if (status == 0) {
            break;
        }
        if (status < 0) {
            JS_FreeValue(context_, value);
            return Fail(TakeException(ErrorKind::kRuntimeError));
        }
    }

    auto text = ValueToText(context_, value);
    JS_FreeValue(context_, value);
    state_.store(State::kCompleted);
    return SandboxResult{.return_value = std::move(text), .error = std::nullopt};
}

bool ScriptSandbox::Bind(HostBridge& bridge, ExecutionError& error) {
    JS_SetContextOpaque(context_, &bridge);

    JSValue global = JS_GetGlobalObject(context_);
    const bool installed =
        SetGlobalFunction(context_, global, "app_log", &JsAppLog, 2) &&
        SetGlobalFunction(context_, global, "get_unixtime", &JsGetUnixtime, 0) &&
        SetGlobalFunction(context_, global, "fetch", &JsFetch, 2);
    JS_FreeValue(context_, global);
    if (!installed) {
        error = TakeException(ErrorKind::kRuntimeError);
        return false;
    }

    JSValue installer = JS_Eval(context_, kConsoleShim, std::strlen(kConsoleShim), "<console>",
                                JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(installer)) {
        error = TakeException(ErrorKind::kRuntimeError);
        return false;
    }
    JSValue writer = JS_NewCFunction(context_, &JsWrite, "write", 2);
    JSValue shim_result = JS_Call(context_, installer, JS_UNDEFINED, 1, &writer);
    JS_FreeValue(context_, writer);
    JS_FreeValue(context_, installer);
    if (JS_IsException(shim_result)) {
        error = TakeException(ErrorKind::kRuntimeError);
        return false;
    }
    JS_FreeValue(context_, shim_result);

    state_.store(State::kBound);
    return true;
}

SandboxResult ScriptSandbox::Fail(ExecutionError error) {
    state_.store(State::kFailed);
    hoya::utils::Log(hoya::utils::LogLevel::kDebug, "script",
                     std::string(ToString(error.kind)) + ": " + error.message);
    return SandboxResult{.return_value = std::nullopt, .error = std::move(error)};
}

ExecutionError ScriptSandbox::TakeException(ErrorKind kind) {
    JSValue exception = JS_GetException(context_);
    auto error = DescribeException(context_, exception, kind);
    JS_FreeValue(context_, exception);
    if (interrupted_.load()) {
        error.kind = ErrorKind::kTimeout;
        error.message = kTimeoutMessage;
    }
    return error;
}

}  // namespace hoya::sandbox
