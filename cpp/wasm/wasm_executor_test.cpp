#include "wasm/wasm_executor.hpp"

#include <kj/async-io.h>
#include "executor/errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

using executor::ExecutionRequest;
using executor::ExecutionResult;
using executor::Language;

const char* kAddModule = R"((module
  (func (export "add") (param i32 i32) (result i32)
    local.get 0
    local.get 1
    i32.add)
  (func (export "_start") (result i64)
    i64.const 7))
)";

const char* kLoopModule = R"((module
  (func (export "spin")
    (loop $forever
      br $forever)))
)";

const char* kTrapModule = R"((module
  (func (export "boom")
    unreachable))
)";

// Each iteration fills the whole 16MiB memory for a handful of fuel units.
const char* kFillModule = R"((module
  (memory 256)
  (func (export "fill")
    (local $i i32)
    (loop $again
      i32.const 0
      i32.const 0
      i32.const 16777216
      memory.fill
      local.get $i
      i32.const 1
      i32.add
      local.tee $i
      i32.const 10000
      i32.lt_u
      br_if $again)))
)";

const char* kGrowModule = R"((module
  (memory 1)
  (func (export "grow") (result i32)
    i32.const 1000
    memory.grow))
)";

class WasmExecutorTest : public ::testing::Test {
 protected:
  WasmExecutorTest() : io_(kj::setupAsyncIo()) {
    config_.execution_env = executor::ExecutionEnv::SANDBOX;
  }

  wasm::WasmExecutor& Executor() {
    if (executor_.get() == nullptr) {
      executor_ = kj::heap<wasm::WasmExecutor>(config_, io_);
    }
    return *executor_;
  }

  ExecutionResult RunModule(const std::string& module,
                            std::vector<std::string> args,
                            std::chrono::milliseconds timeout =
                                std::chrono::milliseconds(0)) {
    ExecutionRequest request(Language::WASM, module);
    request.args = std::move(args);
    request.timeout = timeout;
    return Executor().Execute(request).wait(io_.waitScope);
  }

  kj::AsyncIoContext io_;
  executor::SandboxConfig config_;
  kj::Own<wasm::WasmExecutor> executor_;
};

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, Supports) {
  EXPECT_EQ(Executor().Name(), "wasm");
  EXPECT_TRUE(Executor().Supports(Language::PYTHON));
  EXPECT_TRUE(Executor().Supports(Language::JAVASCRIPT));
  EXPECT_TRUE(Executor().Supports(Language::WASM));
  EXPECT_FALSE(Executor().Supports(Language::RUST));
  EXPECT_FALSE(Executor().Supports(Language::SHELL));
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, HealthCheck) {
  EXPECT_TRUE(Executor().HealthCheck().wait(io_.waitScope));
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, CallsFunction) {
  ExecutionResult result = RunModule(kAddModule, {"add", "40", "2"});
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.stdout_text, "Results: [42]");
  EXPECT_EQ(result.metadata.count("fuel_consumed"), 1);
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, DefaultsToStart) {
  ExecutionResult result = RunModule(kAddModule, {});
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.stdout_text, "Results: [7]");
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, FuelExhaustionIsTimeout) {
  ExecutionResult result =
      RunModule(kLoopModule, {"spin"}, std::chrono::milliseconds(100));
  EXPECT_TRUE(result.timed_out);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.exit_code == nullptr);
  EXPECT_THAT(result.stderr_text, HasSubstr("fuel"));
  EXPECT_LT(result.duration.count(), 10000);
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, FuelLimitCapsTimeout) {
  config_.wasm.fuel_limit = 5000;
  EXPECT_EQ(Executor().FuelFor(std::chrono::milliseconds(100)), 5000);
  EXPECT_EQ(Executor().FuelFor(std::chrono::milliseconds(2)), 2000);
  EXPECT_TRUE(RunModule(kLoopModule, {"spin"}, std::chrono::seconds(60))
                  .timed_out);
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, WallClockTimeout) {
  config_.wasm.fuel_limit = 1000000000;
  ExecutionResult result =
      RunModule(kFillModule, {"fill"}, std::chrono::milliseconds(200));
  EXPECT_TRUE(result.timed_out);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.exit_code == nullptr);
  EXPECT_THAT(result.stderr_text, HasSubstr("timed out after 200ms"));
  EXPECT_GE(result.duration.count(), 200);
  EXPECT_LT(result.duration.count(), 2000);
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, TimeoutIsRepeatable) {
  for (int i = 0; i < 3; i++) {
    ExecutionResult result =
        RunModule(kFillModule, {"fill"}, std::chrono::milliseconds(100));
    EXPECT_TRUE(result.timed_out) << i;
    EXPECT_LT(result.duration.count(), 2000) << i;
  }
  EXPECT_EQ(RunModule(kAddModule, {"add", "1", "2"}).stdout_text,
            "Results: [3]");
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, DurationWithinTimeout) {
  ExecutionResult result = RunModule(kAddModule, {"add", "40", "2"},
                                     std::chrono::milliseconds(1000));
  EXPECT_TRUE(result.success);
  EXPECT_LE(result.duration.count(), 1000 + 1000);
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, ConcurrentCalls) {
  ExecutionRequest slow(Language::WASM, kFillModule);
  slow.args = {"fill"};
  slow.timeout = std::chrono::milliseconds(300);
  ExecutionRequest fast(Language::WASM, kAddModule);
  fast.args = {"add", "2", "3"};
  auto slow_call = Executor().Execute(slow);
  ExecutionResult fast_result = Executor().Execute(fast).wait(io_.waitScope);
  EXPECT_EQ(fast_result.stdout_text, "Results: [5]");
  EXPECT_TRUE(slow_call.wait(io_.waitScope).timed_out);
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, DroppedCallIsInterrupted) {
  ExecutionRequest request(Language::WASM, kFillModule);
  request.args = {"fill"};
  request.timeout = std::chrono::seconds(60);
  auto start = std::chrono::steady_clock::now();
  {
    auto call = Executor().Execute(request);
    io_.provider->getTimer()
        .afterDelay(50 * kj::MILLISECONDS)
        .wait(io_.waitScope);
  }
  EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start)
                .count(),
            5000);
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, TrapIsFailure) {
  ExecutionResult result = RunModule(kTrapModule, {"boom"});
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.timed_out);
  KJ_IF_MAYBE(code, result.exit_code) { EXPECT_EQ(*code, 1); }
  else {
    FAIL() << "missing exit code";
  }
  EXPECT_THAT(result.stderr_text, HasSubstr("unreachable"));
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, MemoryCeiling) {
  config_.wasm.max_memory_pages = 16;
  ExecutionResult result = RunModule(kGrowModule, {"grow"});
  EXPECT_TRUE(result.success);
  // memory.grow returns -1 when the limiter refuses.
  EXPECT_EQ(result.stdout_text, "Results: [-1]");
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, BinaryModule) {
  // (module (func (export "f") (result i32) i32.const 5))
  const unsigned char bytes[] = {
      0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00, 0x01, 0x05, 0x01,
      0x60, 0x00, 0x01, 0x7f, 0x03, 0x02, 0x01, 0x00, 0x07, 0x05, 0x01,
      0x01, 0x66, 0x00, 0x00, 0x0a, 0x06, 0x01, 0x04, 0x00, 0x41, 0x05,
      0x0b};
  std::string module(reinterpret_cast<const char*>(bytes), sizeof(bytes));
  EXPECT_EQ(RunModule(module, {"f"}).stdout_text, "Results: [5]");
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, MissingExport) {
  EXPECT_THROW(RunModule(kAddModule, {"nope"}),  // NOLINT
               executor::infrastructure_error);
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, WrongArguments) {
  EXPECT_THROW(RunModule(kAddModule, {"add", "1"}),  // NOLINT
               executor::infrastructure_error);
  EXPECT_THROW(RunModule(kAddModule, {"add", "1", "two"}),  // NOLINT
               executor::infrastructure_error);
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, InvalidModule) {
  EXPECT_THROW(RunModule("(module (func", {}),  // NOLINT
               executor::infrastructure_error);
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, PythonCapabilityGap) {
  ExecutionResult result =
      Executor()
          .Execute(ExecutionRequest(Language::PYTHON, "print('hello')"))
          .wait(io_.waitScope);
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.stdout_text, "");
  EXPECT_THAT(result.stderr_text, HasSubstr("os or container"));
}

// NOLINTNEXTLINE
TEST_F(WasmExecutorTest, RustUnsupported) {
  EXPECT_THROW(  // NOLINT
      Executor()
          .Execute(ExecutionRequest(Language::RUST, "fn main() {}"))
          .wait(io_.waitScope),
      executor::unsupported_input);
}

}  // namespace
