#ifndef WASM_WASM_EXECUTOR_HPP
#define WASM_WASM_EXECUTOR_HPP

#include <kj/async-io.h>
#include <kj/timer.h>
#include <wasmtime.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "executor/config.hpp"
#include "executor/executor.hpp"

namespace wasm {

// Runs WebAssembly modules inside an embedded wasmtime engine. Execution is
// bounded both by fuel and by the wall-clock timeout, and linear memory by a
// page ceiling. Modules get no imports, so they cannot reach the host at all.
//
// Every call gets its own engine and runs on its own thread. When the timeout
// expires the event loop interrupts the guest through the engine epoch.
class WasmExecutor : public executor::Executor {
 public:
  WasmExecutor(const executor::SandboxConfig& config, kj::AsyncIoContext& io);

  std::string Name() const override { return "wasm"; }
  std::vector<executor::Language> SupportedLanguages() const override;
  kj::Promise<bool> HealthCheck() override;

  // Calls function in the given module, which may be binary or text format.
  // args are converted according to the function's parameter types. Throws
  // infrastructure_error if the module cannot be compiled or the function
  // cannot be called with args. A module that fails to instantiate rejects
  // the returned promise.
  kj::Promise<executor::ExecutionResult> ExecuteModule(
      const std::string& module, const std::string& function,
      const std::vector<std::string>& args, std::chrono::milliseconds timeout);

  // Fuel given to a call with the given timeout.
  uint64_t FuelFor(std::chrono::milliseconds timeout) const;

 protected:
  kj::Promise<executor::ExecutionResult> ExecuteInternal(
      const executor::ExecutionRequest& request) override;

 private:
  struct EngineDeleter {
    void operator()(wasm_engine_t* engine) const { wasm_engine_delete(engine); }
  };

  // Converts text format to binary; binary modules are returned unchanged.
  static std::vector<uint8_t> ToBinary(const std::string& module);

  using Engine = std::unique_ptr<wasm_engine_t, EngineDeleter>;

  // A call in flight on its own thread.
  struct Call;

  // An engine metering fuel and checking the epoch deadline.
  static Engine NewEngine();

  // Used for health checks.
  Engine engine_;
  uint32_t max_memory_pages_;
  uint64_t fuel_limit_;
  kj::LowLevelAsyncIoProvider& low_level_;
  kj::Timer& timer_;
};

}  // namespace wasm

#endif
