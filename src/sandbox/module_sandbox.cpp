#include "sandbox/module_sandbox.hpp"

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "sandbox/guest_memory.hpp"
#include "utils/logging.hpp"
#include "wasmtime.h"

namespace hoya::sandbox {
namespace {

constexpr const char* kImportModule = "env";
constexpr const char* kMemoryExport = "memory";
constexpr const char* kEntryPoint = "_start";

template <typename T, auto Fn>
struct Deleter {
    void operator()(T* ptr) const { Fn(ptr); }
};

template <typename T, auto Fn>
using Handle = std::unique_ptr<T, Deleter<T, Fn>>;

using ErrorHandle = Handle<wasmtime_error_t, wasmtime_error_delete>;
using TrapHandle = Handle<wasm_trap_t, wasm_trap_delete>;

// Store data for one execution. Host calls reach the bridge through it.
struct HostState {
    HostBridge* bridge = nullptr;
    // Set by a host import that terminated the guest; wins over the trap text.
    std::optional<ExecutionError> violation;
};

std::string ErrorMessage(const wasmtime_error_t* error) {
    wasm_name_t message;
    wasmtime_error_message(error, &message);
    std::string text(message.data, message.size);
    wasm_byte_vec_delete(&message);
    return text;
}

std::string TrapMessage(const wasm_trap_t* trap) {
    wasm_message_t message{.size = 0, .data = nullptr};
    wasm_trap_message(trap, &message);
    std::string text(message.data, message.size);
    wasm_byte_vec_delete(&message);
    while (!text.empty() && text.back() == '\0') {
        text.pop_back();
    }
    return text;
}

const char* TrapCodeName(wasmtime_trap_code_t code) {
    switch (static_cast<wasmtime_trap_code_enum>(code)) {
        case WASMTIME_TRAP_CODE_STACK_OVERFLOW: return "STACK_OVERFLOW";
        case WASMTIME_TRAP_CODE_MEMORY_OUT_OF_BOUNDS: return "MEMORY_OUT_OF_BOUNDS";
        case WASMTIME_TRAP_CODE_HEAP_MISALIGNED: return "HEAP_MISALIGNED";
        case WASMTIME_TRAP_CODE_TABLE_OUT_OF_BOUNDS: return "TABLE_OUT_OF_BOUNDS";
        case WASMTIME_TRAP_CODE_INDIRECT_CALL_TO_NULL: return "INDIRECT_CALL_TO_NULL";
        case WASMTIME_TRAP_CODE_BAD_SIGNATURE: return "BAD_SIGNATURE";
        case WASMTIME_TRAP_CODE_INTEGER_OVERFLOW: return "INTEGER_OVERFLOW";
        case WASMTIME_TRAP_CODE_INTEGER_DIVISION_BY_ZERO: return "INTEGER_DIVISION_BY_ZERO";
        case WASMTIME_TRAP_CODE_BAD_CONVERSION_TO_INTEGER: return "BAD_CONVERSION_TO_INTEGER";
        case WASMTIME_TRAP_CODE_UNREACHABLE_CODE_REACHED: return "UNREACHABLE_CODE_REACHED";
        case WASMTIME_TRAP_CODE_INTERRUPT: return "INTERRUPT";
        default: return "UNKNOWN";
    }
}

ExecutionError MakeError(ErrorKind kind, std::string message, nlohmann::json details = nullptr) {
    return ExecutionError{.kind = kind, .message = std::move(message), .details = std::move(details)};
}

ExecutionError TimeoutError() {
    return MakeError(ErrorKind::kTimeout, "module exceeded its execution time budget");
}

ExecutionError TrapError(const HostState& state, const wasm_trap_t* trap, bool interrupted) {
    if (state.violation) {
        return *state.violation;
    }
    wasmtime_trap_code_t code = 0;
    const bool has_code = wasmtime_trap_code(trap, &code);
    if (interrupted || (has_code && code == WASMTIME_TRAP_CODE_INTERRUPT)) {
        return TimeoutError();
    }
    nlohmann::json details = nlohmann::json::object();
    if (has_code) {
        details["trapCode"] = TrapCodeName(code);
    }
    return MakeError(ErrorKind::kTrap, TrapMessage(trap), std::move(details));
}

HostState& StateOf(wasmtime_caller_t* caller) {
    return *static_cast<HostState*>(wasmtime_context_get_data(wasmtime_caller_context(caller)));
}

// Rebuilt on every call; memory.grow may have moved the buffer since the last one.
std::optional<GuestMemory> CallerMemory(wasmtime_caller_t* caller) {
    wasmtime_extern_t item;
    if (!wasmtime_caller_export_get(caller, kMemoryExport, std::char_traits<char>::length(kMemoryExport), &item)) {
        return std::nullopt;
    }
    if (item.kind != WASMTIME_EXTERN_MEMORY) {
        wasmtime_extern_delete(&item);
        return std::nullopt;
    }
    auto* context = wasmtime_caller_context(caller);
    return GuestMemory(wasmtime_memory_data(context, &item.of.memory),
                       wasmtime_memory_data_size(context, &item.of.memory));
}

wasm_trap_t* Terminate(HostState& state, ExecutionError error) {
    const auto message = error.message;
    state.violation = std::move(error);
    return wasmtime_trap_new(message.data(), message.size());
}

wasm_trap_t* MemoryMissing(HostState& state, const char* function) {
    return Terminate(state, MakeError(ErrorKind::kInvalidMemoryAccess,
                                      std::string(function) + ": guest memory is not accessible"));
}

wasm_trap_t* MemoryFault(HostState& state, const char* function, const GuestMemory& memory,
                         std::uint32_t ptr, std::uint32_t len) {
    return Terminate(state, MakeError(
        ErrorKind::kInvalidMemoryAccess,
        std::string(function) + ": out-of-bounds guest memory access (" + memory.Describe(ptr, len) + ")",
        {{"function", function}, {"ptr", ptr}, {"len", len}, {"memorySize", memory.Size()}}));
}

std::uint32_t ArgU32(const wasmtime_val_t* args, std::size_t index) {
    return static_cast<std::uint32_t>(args[index].of.i32);
}

wasm_trap_t* HostAppLog(void*, wasmtime_caller_t* caller, const wasmtime_val_t* args, std::size_t,
                        wasmtime_val_t*, std::size_t) {
    auto& state = StateOf(caller);
    auto memory = CallerMemory(caller);
    if (!memory) {
        return MemoryMissing(state, "app_log");
    }
    const auto level_ptr = ArgU32(args, 0);
    const auto level_len = ArgU32(args, 1);
    const auto message_ptr = ArgU32(args, 2);
    const auto message_len = ArgU32(args, 3);
    const auto level = memory->Read(level_ptr, level_len);
    if (!level) {
        return MemoryFault(state, "app_log", *memory, level_ptr, level_len);
    }
    const auto message = memory->Read(message_ptr, message_len);
    if (!message) {
        return MemoryFault(state, "app_log", *memory, message_ptr, message_len);
    }
    state.bridge->Log(std::string(*level), std::string(*message));
    return nullptr;
}

wasm_trap_t* HostGetUnixtime(void*, wasmtime_caller_t* caller, const wasmtime_val_t*, std::size_t,
                             wasmtime_val_t* results, std::size_t) {
    auto& state = StateOf(caller);
    results[0].kind = WASMTIME_I64;
    results[0].of.i64 = state.bridge->CurrentUnixTime();
    return nullptr;
}

// Writes the JSON response into [resp_ptr, resp_ptr + resp_max). Returns the
// byte count, or -(required length) with nothing written if it does not fit.
wasm_trap_t* HostFetch(void*, wasmtime_caller_t* caller, const wasmtime_val_t* args, std::size_t,
                       wasmtime_val_t* results, std::size_t) {
    auto& state = StateOf(caller);
    auto memory = CallerMemory(caller);
    if (!memory) {
        return MemoryMissing(state, "fetch");
    }
    const auto options_ptr = ArgU32(args, 0);
    const auto options_len = ArgU32(args, 1);
    const auto response_ptr = ArgU32(args, 2);
    const auto response_max = ArgU32(args, 3);
    if (!memory->Contains(options_ptr, options_len)) {
        return MemoryFault(state, "fetch", *memory, options_ptr, options_len);
    }
    if (!memory->Contains(response_ptr, response_max)) {
        return MemoryFault(state, "fetch", *memory, response_ptr, response_max);
    }

    const std::string options_text(*memory->Read(options_ptr, options_len));
    const auto options = nlohmann::json::parse(options_text, nullptr, false);
    std::string error;
    std::optional<FetchRequest> request;
    if (options.is_discarded()) {
        error = "fetch options are not valid JSON";
    } else {
        request = FetchRequestFromJson(options, error);
    }

    FetchResult result;
    if (request) {
        result = state.bridge->Fetch(*request);
    } else {
        result.error = FetchError{.kind = ErrorKind::kInvalidRequest, .message = error};
    }
    const auto text = FetchResultToJson(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    results[0].kind = WASMTIME_I32;
    if (text.size() > response_max) {
        constexpr auto kMax = static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());
        results[0].of.i32 = -static_cast<std::int32_t>(std::min(text.size(), kMax));
        return nullptr;
    }
    memory->Write(response_ptr, text);
    results[0].of.i32 = static_cast<std::int32_t>(text.size());
    return nullptr;
}

wasm_trap_t* Capture(wasmtime_caller_t* caller, const wasmtime_val_t* args, Stream stream,
                     const char* function) {
    auto& state = StateOf(caller);
    auto memory = CallerMemory(caller);
    if (!memory) {
        return MemoryMissing(state, function);
    }
    const auto ptr = ArgU32(args, 0);
    const auto len = ArgU32(args, 1);
    const auto bytes = memory->Read(ptr, len);
    if (!bytes) {
        return MemoryFault(state, function, *memory, ptr, len);
    }
    state.bridge->Write(stream, *bytes);
    return nullptr;
}

wasm_trap_t* HostCaptureStdout(void*, wasmtime_caller_t* caller, const wasmtime_val_t* args, std::size_t,
                               wasmtime_val_t*, std::size_t) {
    return Capture(caller, args, Stream::kStdout, "capture_stdout");
}

wasm_trap_t* HostCaptureStderr(void*, wasmtime_caller_t* caller, const wasmtime_val_t* args, std::size_t,
                               wasmtime_val_t*, std::size_t) {
    return Capture(caller, args, Stream::kStderr, "capture_stderr");
}

wasm_valtype_vec_t MakeValTypes(std::initializer_list<wasm_valkind_t> kinds) {
    wasm_valtype_vec_t types;
    wasm_valtype_vec_new_uninitialized(&types, kinds.size());
    std::size_t index = 0;
    for (const auto kind : kinds) {
        types.data[index++] = wasm_valtype_new(kind);
    }
    return types;
}

ErrorHandle DefineImport(wasmtime_linker_t* linker, const std::string& name,
                         std::initializer_list<wasm_valkind_t> params,
                         std::initializer_list<wasm_valkind_t> results,
                         wasmtime_func_callback_t callback) {
    auto inputs = MakeValTypes(params);
    auto outputs = MakeValTypes(results);
    // Takes ownership of inputs and outputs.
    Handle<wasm_functype_t, wasm_functype_delete> type(wasm_functype_new(&inputs, &outputs));
    return ErrorHandle(wasmtime_linker_define_func(
        linker,
        kImportModule, std::char_traits<char>::length(kImportModule),
        name.data(), name.size(),
        type.get(), callback, nullptr, nullptr));
}

ErrorHandle DefineImports(wasmtime_linker_t* linker) {
    const wasm_valkind_t i32 = WASM_I32;
    const wasm_valkind_t i64 = WASM_I64;
    if (auto error = DefineImport(linker, "app_log", {i32, i32, i32, i32}, {}, &HostAppLog)) {
        return error;
    }
    if (auto error = DefineImport(linker, "get_unixtime", {}, {i64}, &HostGetUnixtime)) {
        return error;
    }
    if (auto error = DefineImport(linker, "fetch", {i32, i32, i32, i32}, {i32}, &HostFetch)) {
        return error;
    }
    if (auto error = DefineImport(linker, "capture_stdout", {i32, i32}, {}, &HostCaptureStdout)) {
        return error;
    }
    return DefineImport(linker, "capture_stderr", {i32, i32}, {}, &HostCaptureStderr);
}

bool ExportsMemory(const wasmtime_module_t* module) {
    wasm_exporttype_vec_t exports;
    wasm_exporttype_vec_new_empty(&exports);
    wasmtime_module_exports(module, &exports);
    bool found = false;
    for (std::size_t i = 0; i < exports.size && !found; ++i) {
        const wasm_name_t* name = wasm_exporttype_name(exports.data[i]);
        const wasm_externtype_t* type = wasm_exporttype_type(exports.data[i]);
        found = wasm_externtype_kind(type) == WASM_EXTERN_MEMORY &&
                std::string_view(name->data, name->size) == kMemoryExport;
    }
    wasm_exporttype_vec_delete(&exports);
    return found;
}

}  // namespace

ModuleSandbox::ModuleSandbox(const hoya::config::SandboxConfig& config)
    : config_(config) {
    wasm_config_t* engine_config = wasm_config_new();
    if (!engine_config) {
        return;
    }
    wasmtime_config_epoch_interruption_set(engine_config, true);
    // The engine takes ownership of engine_config.
    engine_ = wasm_engine_new_with_config(engine_config);
}

ModuleSandbox::~ModuleSandbox() {
    if (engine_) {
        wasm_engine_delete(engine_);
    }
}

void ModuleSandbox::Interrupt() {
    interrupted_.store(true);
    if (engine_) {
        wasmtime_engine_increment_epoch(engine_);
    }
}

SandboxResult ModuleSandbox::Execute(const FetchedResource& resource, HostBridge& bridge) {
    if (!engine_) {
        return Fail(MakeError(ErrorKind::kResourceLimitExceeded, "failed to create a wasm engine"));
    }

    Handle<wasmtime_module_t, wasmtime_module_delete> module;
    {
        wasmtime_module_t* raw = nullptr;
        ErrorHandle error(wasmtime_module_new(engine_, resource.bytes.data(), resource.bytes.size(), &raw));
        if (error) {
            return Fail(MakeError(ErrorKind::kInstantiationError,
                                  "module failed to compile: " + ErrorMessage(error.get())));
        }
        module.reset(raw);
    }
    if (!ExportsMemory(module.get())) {
        return Fail(MakeError(ErrorKind::kInstantiationError,
                              "module does not export a linear memory named \"memory\""));
    }

    HostState state{.bridge = &bridge, .violation = std::nullopt};
    Handle<wasmtime_store_t, wasmtime_store_delete> store(wasmtime_store_new(engine_, &state, nullptr));
    wasmtime_store_limiter(store.get(), static_cast<std::int64_t>(config_.module_memory_limit_bytes),
                           -1, -1, -1, -1);
    wasmtime_context_t* context = wasmtime_store_context(store.get());
    wasmtime_context_set_epoch_deadline(context, 1);

    Handle<wasmtime_linker_t, wasmtime_linker_delete> linker(wasmtime_linker_new(engine_));
    if (auto error = DefineImports(linker.get())) {
        return Fail(MakeError(ErrorKind::kInstantiationError,
                              "failed to define host imports: " + ErrorMessage(error.get())));
    }

    // An epoch bump that landed before the deadline was armed would be missed.
    if (interrupted_.load()) {
        return Fail(TimeoutError());
    }

    wasmtime_instance_t instance;
    {
        wasm_trap_t* raw_trap = nullptr;
        ErrorHandle error(wasmtime_linker_instantiate(linker.get(), context, module.get(), &instance, &raw_trap));
        TrapHandle trap(raw_trap);
        if (trap) {
            return Fail(TrapError(state, trap.get(), interrupted_.load()));
        }
        if (error) {
            return Fail(MakeError(ErrorKind::kInstantiationError,
                                  "module failed to instantiate: " + ErrorMessage(error.get())));
        }
    }
    state_.store(State::kInstantiated);

    wasmtime_extern_t entry;
    if (!wasmtime_instance_export_get(context, &instance, kEntryPoint,
                                      std::char_traits<char>::length(kEntryPoint), &entry)) {
        state_.store(State::kCompleted);
        return SandboxResult{.return_value = "WASM module instantiated (no _start called or found)",
                             .error = std::nullopt};
    }
    if (entry.kind != WASMTIME_EXTERN_FUNC) {
        wasmtime_extern_delete(&entry);
        state_.store(State::kCompleted);
        return SandboxResult{.return_value = "WASM module instantiated (no _start called or found)",
                             .error = std::nullopt};
    }
    {
        Handle<wasm_functype_t, wasm_functype_delete> type(wasmtime_func_type(context, &entry.of.func));
        if (wasm_functype_params(type.get())->size != 0 || wasm_functype_results(type.get())->size != 0) {
            return Fail(MakeError(ErrorKind::kInstantiationError,
                                  "_start must take no parameters and return no results"));
        }
    }

    state_.store(State::kExecuting);
    wasm_trap_t* raw_trap = nullptr;
    ErrorHandle error(wasmtime_func_call(context, &entry.of.func, nullptr, 0, nullptr, 0, &raw_trap));
    TrapHandle trap(raw_trap);
    if (trap) {
        return Fail(TrapError(state, trap.get(), interrupted_.load()));
    }
    if (error) {
        if (state.violation) {
            return Fail(*state.violation);
        }
        if (interrupted_.load()) {
            return Fail(TimeoutError());
        }
        return Fail(MakeError(ErrorKind::kTrap, ErrorMessage(error.get())));
    }

    state_.store(State::kCompleted);
    return SandboxResult{.return_value = "WASM module executed (_start)", .error = std::nullopt};
}

SandboxResult ModuleSandbox::Fail(ExecutionError error) {
    state_.store(State::kFailed);
    hoya::utils::Log(hoya::utils::LogLevel::kDebug, "module",
                     std::string(ToString(error.kind)) + ": " + error.message);
    return SandboxResult{.return_value = std::nullopt, .error = std::move(error)};
}

}  // namespace hoya::sandbox
