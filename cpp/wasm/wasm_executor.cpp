#include "wasm/wasm_executor.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/io.h>
#include "executor/errors.hpp"

namespace wasm {

namespace {

static const constexpr char kWasmMagic[] = {'\0', 'a', 's', 'm'};
static const constexpr int64_t kPageSize = 64 * 1024;

struct StoreDeleter {
  void operator()(wasmtime_store_t* store) const {
    wasmtime_store_delete(store);
  }
};
struct ModuleDeleter {
  void operator()(wasmtime_module_t* module) const {
    wasmtime_module_delete(module);
  }
};
struct ErrorDeleter {
  void operator()(wasmtime_error_t* error) const {
    wasmtime_error_delete(error);
  }
};
struct TrapDeleter {
  void operator()(wasm_trap_t* trap) const { wasm_trap_delete(trap); }
};

using Store = std::unique_ptr<wasmtime_store_t, StoreDeleter>;
using Module = std::unique_ptr<wasmtime_module_t, ModuleDeleter>;
using Error = std::unique_ptr<wasmtime_error_t, ErrorDeleter>;
using Trap = std::unique_ptr<wasm_trap_t, TrapDeleter>;

std::string TakeMessage(wasm_byte_vec_t* message) {
  std::string text(message->data, message->size);
  wasm_byte_vec_delete(message);
  // Some versions include the terminator in the size.
  while (!text.empty() && text.back() == '\0') text.pop_back();
  return text;
}

std::string ErrorMessage(const Error& error) {
  wasm_name_t message;
  wasmtime_error_message(error.get(), &message);
  return TakeMessage(&message);
}

std::string TrapMessage(const Trap& trap) {
  wasm_message_t message;
  wasm_trap_message(trap.get(), &message);
  return TakeMessage(&message);
}

bool OutOfFuel(const Trap& trap) {
  wasmtime_trap_code_t code;
  return wasmtime_trap_code(trap.get(), &code) &&
         code == WASMTIME_TRAP_CODE_OUT_OF_FUEL;
}

bool Interrupted(const Trap& trap) {
  wasmtime_trap_code_t code;
  return wasmtime_trap_code(trap.get(), &code) &&
         code == WASMTIME_TRAP_CODE_INTERRUPT;
}

void Check(wasmtime_error_t* raw_error, const std::string& what) {
  if (raw_error == nullptr) return;
  Error error(raw_error);
  throw executor::infrastructure_error(what + ": " + ErrorMessage(error));
}

const char* ValKindName(wasm_valkind_t kind) {
  switch (kind) {
    case WASM_I32:
      return "i32";
    case WASM_I64:
      return "i64";
    case WASM_F32:
      return "f32";
    case WASM_F64:
      return "f64";
    default:
      return "reference";
  }
}

wasmtime_val_t ParseArg(const std::string& text, wasm_valkind_t kind) {
  wasmtime_val_t val;
  size_t used = 0;
  try {
    switch (kind) {
      case WASM_I32: {
        int64_t value = std::stoll(text, &used);
        if (value < std::numeric_limits<int32_t>::min() ||
            value > std::numeric_limits<uint32_t>::max()) {
          throw std::out_of_range(text);
        }
        val.kind = WASMTIME_I32;
        val.of.i32 = static_cast<int32_t>(value);
        break;
      }
      case WASM_I64:
        val.kind = WASMTIME_I64;
        val.of.i64 = std::stoll(text, &used);
        break;
      case WASM_F32:
        val.kind = WASMTIME_F32;
        val.of.f32 = std::stof(text, &used);
        break;
      case WASM_F64:
        val.kind = WASMTIME_F64;
        val.of.f64 = std::stod(text, &used);
        break;
      default:
        throw executor::infrastructure_error(
            "Reference parameters cannot be passed from the command line");
    }
  } catch (const std::logic_error&) {
    used = 0;
  }
  if (used == 0 || used != text.size()) {
    throw executor::infrastructure_error("Invalid " +
                                         std::string(ValKindName(kind)) +
                                         " argument: " + text);
  }
  return val;
}

std::string FormatValue(const wasmtime_val_t& val) {
  std::ostringstream out;
  switch (val.kind) {
    case WASMTIME_I32:
      out << val.of.i32;
      break;
    case WASMTIME_I64:
      out << val.of.i64;
      break;
    case WASMTIME_F32:
      out << val.of.f32;
      break;
    case WASMTIME_F64:
      out << val.of.f64;
      break;
    default:
      out << "<ref>";
  }
  return out.str();
}

std::string FormatResults(const std::vector<wasmtime_val_t>& values) {
  std::string text = "Results: [";
  for (size_t i = 0; i < values.size(); i++) {
    if (i) text += ", ";
    text += FormatValue(values[i]);
  }
  return text + "]";
}

executor::ExecutionResult CapabilityGap(executor::Language language) {
  std::string name = executor::LanguageName(language);
  executor::ExecutionResult result;
  result.success = false;
  result.stderr_text =
      name + " cannot run in the WebAssembly sandbox, which has no " + name +
      " runtime. Use the os or container execution environment for " + name +
      " code.";
  return result;
}


// Parameters and result count of the function a call is about to invoke.
struct Signature {
  std::vector<wasmtime_val_t> args;
  size_t results = 0;
};

// Checks that module exports function and that args fit its parameters,
// without instantiating the module.
Signature CheckCall(const wasmtime_module_t* module,
                    const std::string& function,
                    const std::vector<std::string>& args) {
  wasm_exporttype_vec_t exports;
  wasmtime_module_exports(module, &exports);
  KJ_DEFER(wasm_exporttype_vec_delete(&exports));
  for (size_t i = 0; i < exports.size; i++) {
    const wasm_name_t* name = wasm_exporttype_name(exports.data[i]);
    if (std::string(name->data, name->size) != function) continue;
    const wasm_functype_t* type = wasm_externtype_as_functype_const(
        wasm_exporttype_type(exports.data[i]));
    if (type == nullptr) {
      throw executor::infrastructure_error("Export '" + function +
                                           "' is not a function");
    }
    const wasm_valtype_vec_t* params = wasm_functype_params(type);
    if (params->size != args.size()) {
      throw executor::infrastructure_error(
          "Function '" + function + "' expects " +
          std::to_string(params->size) + " arguments, got " +
          std::to_string(args.size()));
    }
    Signature signature;
    for (size_t j = 0; j < args.size(); j++) {
      signature.args.push_back(
          ParseArg(args[j], wasm_valtype_kind(params->data[j])));
    }
    signature.results = wasm_functype_results(type)->size;
    return signature;
  }
  throw executor::infrastructure_error("Function '" + function +
                                       "' not found");
}

}  // namespace

struct WasmExecutor::Call {
  Engine engine;
  Module module;
  std::string function;
  Signature signature;
  uint32_t max_memory_pages = 0;
  uint64_t fuel = 0;
  std::chrono::milliseconds timeout{0};
  std::chrono::steady_clock::time_point start;

  std::atomic<bool> interrupted{false};
  // Written by the thread before it closes done_write.
  kj::Maybe<executor::ExecutionResult> result;
  kj::Maybe<std::string> error;

  kj::AutoCloseFd done_read;
  kj::AutoCloseFd done_write;
  kj::Own<kj::AsyncInputStream> done;
  kj::byte buffer[1] = {};
  std::thread thread;
  kj::Maybe<kj::Promise<void>> watchdog;

  // Makes the guest trap at its next epoch check. Safe from any thread.
  void Interrupt() {
    interrupted = true;
    wasm_engine_increment_epoch(engine.get());
  }

  // Instantiates the module and invokes the function. Runs on the thread.
  executor::ExecutionResult Run();

  executor::ExecutionResult Outcome(wasmtime_context_t* context,
                                    wasm_trap_t* raw_trap,
                                    wasmtime_error_t* raw_error,
                                    const std::vector<wasmtime_val_t>& results);

  ~Call() {
    watchdog = nullptr;
    if (thread.joinable()) {
      Interrupt();
      thread.join();
    }
  }
};

executor::ExecutionResult WasmExecutor::Call::Outcome(
    wasmtime_context_t* context, wasm_trap_t* raw_trap,
    wasmtime_error_t* raw_error, const std::vector<wasmtime_val_t>& results) {
  Trap trap(raw_trap);
  Error error(raw_error);
  uint64_t remaining = 0;
  Error fuel_error(wasmtime_context_get_fuel(context, &remaining));
  if (fuel_error) remaining = 0;
  std::string consumed = std::to_string(fuel - remaining);
  std::chrono::milliseconds duration = executor::ElapsedSince(start);

  std::string message;
  bool out_of_fuel = false;
  bool timed_out = false;
  if (trap) {
    message = TrapMessage(trap);
    out_of_fuel = OutOfFuel(trap);
    timed_out = Interrupted(trap);
  } else if (error) {
    message = ErrorMessage(error);
    out_of_fuel = message.find("fuel") != std::string::npos;
  } else {
    auto result = executor::ExecutionResult::Completed(
        0, FormatResults(results), "", duration);
    result.metadata["fuel_consumed"] = consumed;
    return result;
  }
  if (!out_of_fuel && interrupted) timed_out = true;

  executor::ExecutionResult result;
  if (out_of_fuel) {
    result = executor::ExecutionResult::TimedOut(
        "",
        "Execution exceeded its fuel budget of " + std::to_string(fuel) +
            " units",
        duration);
  } else if (timed_out) {
    result = executor::ExecutionResult::TimedOut(
        "",
        "Execution timed out after " + std::to_string(timeout.count()) + "ms",
        duration);
  } else {
    result = executor::ExecutionResult::Completed(1, "", message, duration);
  }
  result.metadata["fuel_consumed"] = consumed;
  return result;
}

executor::ExecutionResult WasmExecutor::Call::Run() {
  Store store(wasmtime_store_new(engine.get(), nullptr, nullptr));
  wasmtime_store_limiter(store.get(), max_memory_pages * kPageSize, -1, -1,
                         -1, -1);
  wasmtime_context_t* context = wasmtime_store_context(store.get());
  Check(wasmtime_context_set_fuel(context, fuel), "Failed to set fuel");
  // One tick past the current epoch: the first Interrupt makes it trap.
  wasmtime_context_set_epoch_deadline(context, 1);
  // Interrupted before the deadline was armed.
  if (interrupted) {
    auto result = executor::ExecutionResult::TimedOut(
        "",
        "Execution timed out after " + std::to_string(timeout.count()) + "ms",
        executor::ElapsedSince(start));
    result.metadata["fuel_consumed"] = "0";
    return result;
  }

  wasmtime_instance_t instance;
  wasm_trap_t* trap = nullptr;
  Check(wasmtime_instance_new(context, module.get(), nullptr, 0, &instance,
                              &trap),
        "Failed to instantiate module");
  // The start function trapped.
  if (trap != nullptr) return Outcome(context, trap, nullptr, {});

  wasmtime_extern_t item;
  if (!wasmtime_instance_export_get(context, &instance, function.data(),
                                    function.size(), &item)) {
    throw executor::infrastructure_error("Function '" + function +
                                         "' not found");
  }
  KJ_DEFER(wasmtime_extern_delete(&item));
  if (item.kind != WASMTIME_EXTERN_FUNC) {
    throw executor::infrastructure_error("Export '" + function +
                                         "' is not a function");
  }
  std::vector<wasmtime_val_t> results(signature.results);
  wasmtime_error_t* error = wasmtime_func_call(
      context, &item.of.func, signature.args.data(), signature.args.size(),
      results.data(), results.size(), &trap);
  return Outcome(context, trap, error, results);
}

WasmExecutor::WasmExecutor(const executor::SandboxConfig& config,
                           kj::AsyncIoContext& io)
    : executor::Executor(config.default_timeout),
      engine_(NewEngine()),
      max_memory_pages_(config.wasm.max_memory_pages),
      fuel_limit_(config.wasm.fuel_limit),
      low_level_(*io.lowLevelProvider),
      timer_(io.provider->getTimer()) {
  if (!engine_) {
    throw executor::configuration_error("Cannot create the wasmtime engine");
  }
  KJ_LOG(INFO, "WebAssembly engine ready", max_memory_pages_, fuel_limit_);
}

WasmExecutor::Engine WasmExecutor::NewEngine() {
  wasm_config_t* engine_config = wasm_config_new();
  KJ_ASSERT(engine_config != nullptr);
  wasmtime_config_consume_fuel_set(engine_config, true);
  wasmtime_config_epoch_interruption_set(engine_config, true);
  // The engine takes ownership of the config.
  return Engine(wasm_engine_new_with_config(engine_config));
}

std::vector<executor::Language> WasmExecutor::SupportedLanguages() const {
  return {executor::Language::PYTHON, executor::Language::JAVASCRIPT,
          executor::Language::WASM};
}

kj::Promise<bool> WasmExecutor::HealthCheck() {
  try {
    std::vector<uint8_t> binary = ToBinary("(module)");
    wasmtime_module_t* raw_module = nullptr;
    Check(wasmtime_module_new(engine_.get(), binary.data(), binary.size(),
                              &raw_module),
          "Failed to compile module");
    Module module(raw_module);
    return true;
  } catch (const executor::execution_error& e) {
    KJ_LOG(WARNING, "WebAssembly health check failed", e.what());
    return false;
  }
}

uint64_t WasmExecutor::FuelFor(std::chrono::milliseconds timeout) const {
  if (timeout.count() <= 0) return 0;
  uint64_t millis = timeout.count();
  if (millis > fuel_limit_ / 1000) return fuel_limit_;
  return millis * 1000;
}

std::vector<uint8_t> WasmExecutor::ToBinary(const std::string& module) {
  if (module.size() >= sizeof(kWasmMagic) &&
      memcmp(module.data(), kWasmMagic, sizeof(kWasmMagic)) == 0) {
    return std::vector<uint8_t>(module.begin(), module.end());
  }
  wasm_byte_vec_t binary;
  Check(wasmtime_wat2wasm(module.data(), module.size(), &binary),
        "Failed to parse WebAssembly text");
  std::vector<uint8_t> bytes(binary.data, binary.data + binary.size);
  wasm_byte_vec_delete(&binary);
  return bytes;
}

kj::Promise<executor::ExecutionResult> WasmExecutor::ExecuteModule(
    const std::string& module, const std::string& function,
    const std::vector<std::string>& args, std::chrono::milliseconds timeout) {
  auto call = kj::heap<Call>();
  Call* run = call.get();
  run->start = std::chrono::steady_clock::now();
  run->engine = NewEngine();
  if (!run->engine) {
    throw executor::infrastructure_error("Cannot create the wasmtime engine");
  }
  std::vector<uint8_t> binary = ToBinary(module);
  wasmtime_module_t* raw_module = nullptr;
  Check(wasmtime_module_new(run->engine.get(), binary.data(), binary.size(),
                            &raw_module),
        "Failed to compile module");
  run->module.reset(raw_module);
  run->function = function;
  run->signature = CheckCall(raw_module, function, args);
  run->max_memory_pages = max_memory_pages_;
  run->fuel = FuelFor(timeout);
  run->timeout = timeout;

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {  // NOLINT
    throw executor::infrastructure_error(std::string("pipe2: ") +
                                         strerror(errno));
  }
  run->done_read = kj::AutoCloseFd(fds[0]);
  run->done_write = kj::AutoCloseFd(fds[1]);
  run->done = low_level_.wrapInputFd(run->done_read.get());

  run->watchdog = timer_.afterDelay(timeout.count() * kj::MILLISECONDS)
                      .then([run]() {
                        KJ_LOG(INFO, "Interrupting", run->function);
                        run->Interrupt();
                      })
                      .eagerlyEvaluate(nullptr);

  KJ_LOG(INFO, "Calling", function, args.size(), run->fuel);
  run->thread = std::thread([run]() {
    try {
      run->result = run->Run();
    } catch (const std::exception& e) {
      run->error = std::string(e.what());
    }
    // EOF on done_read tells the event loop that the call is over.
    run->done_write = kj::AutoCloseFd();
  });

  return run->done->tryRead(run->buffer, 1, 1)
      .then([run](size_t) {
        run->thread.join();
        run->watchdog = nullptr;
        KJ_IF_MAYBE(message, run->error) {
          kj::throwFatalException(KJ_EXCEPTION(FAILED, message->c_str()));
        }
        return kj::mv(KJ_ASSERT_NONNULL(run->result));
      })
      .attach(kj::mv(call));
}

kj::Promise<executor::ExecutionResult> WasmExecutor::ExecuteInternal(
    const executor::ExecutionRequest& request) {
  switch (request.language) {
    case executor::Language::PYTHON:
    case executor::Language::JAVASCRIPT:
      KJ_LOG(INFO, "No WebAssembly runtime for",
             executor::LanguageName(request.language));
      return CapabilityGap(request.language);
    case executor::Language::WASM: {
      if (request.stdin_data != nullptr || !request.env.empty() ||
          request.working_dir != nullptr) {
        KJ_LOG(WARNING, "WebAssembly modules only receive code and args");
      }
      std::string function = "_start";
      std::vector<std::string> args;
      if (!request.args.empty()) {
        function = request.args[0];
        args.assign(request.args.begin() + 1, request.args.end());
      }
      return ExecuteModule(request.code, function, args, request.timeout);
    }
    default:
      throw executor::unsupported_input(
          executor::LanguageName(request.language) +
          " is not supported by the WebAssembly sandbox");
  }
}

}  // namespace wasm
