#include "container/container_executor.hpp"

#include <kj/async-io.h>
#include <map>
#include "executor/errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

using container::ContainerExecutor;
using container::ContainerLogs;
using container::ContainerSpec;
using executor::ExecutionRequest;
using executor::ExecutionResult;
using executor::Language;

// In-memory runtime that records what the executor asks for.
class FakeRuntime : public container::ContainerRuntime {
 public:
  kj::Promise<void> Ping() override {
    if (fail_ping) return KJ_EXCEPTION(DISCONNECTED, "daemon unreachable");
    return kj::READY_NOW;
  }
  kj::Promise<bool> HasImage(const std::string& image) override {
    return has_image;
  }
  kj::Promise<void> PullImage(const std::string& image) override {
    pulled.push_back(image);
    return kj::READY_NOW;
  }
  kj::Promise<std::string> CreateContainer(const ContainerSpec& spec) override {
    std::string id = "id" + std::to_string(created.size());
    created.push_back(spec);
    live[id] = spec.name;
    return id;
  }
  kj::Promise<void> StartContainer(const std::string& id) override {
    if (fail_start) return KJ_EXCEPTION(FAILED, "cannot start");
    return kj::READY_NOW;
  }
  kj::Promise<int64_t> WaitContainer(const std::string& id) override {
    if (fail_wait) return KJ_EXCEPTION(DISCONNECTED, "wait interrupted");
    if (hang) return kj::NEVER_DONE;
    return exit_status;
  }
  kj::Promise<ContainerLogs> FetchLogs(const std::string& id) override {
    if (fail_logs) return KJ_EXCEPTION(FAILED, "log stream broken");
    return logs;
  }
  kj::Promise<void> RemoveContainer(const std::string& id) override {
    removed.push_back(id);
    live.erase(id);
    return kj::READY_NOW;
  }
  kj::Promise<std::vector<std::string>> ListContainers(
      const std::string& name_prefix) override {
    std::vector<std::string> names;
    for (const auto& kv : live) {
      if (kv.second.compare(0, name_prefix.size(), name_prefix) == 0) {
        names.push_back(kv.second);
      }
    }
    return names;
  }

  bool fail_ping = false;
  bool has_image = true;
  bool fail_start = false;
  bool fail_logs = false;
  bool fail_wait = false;
  bool hang = false;
  int64_t exit_status = 0;
  ContainerLogs logs;

  std::vector<std::string> pulled;
  std::vector<ContainerSpec> created;
  std::vector<std::string> removed;
  std::map<std::string, std::string> live;
};

class ContainerExecutorTest : public ::testing::Test {
 protected:
  ContainerExecutorTest() : io_(kj::setupAsyncIo()) {
    config_.execution_env = executor::ExecutionEnv::CONTAINER;
    auto runtime = kj::heap<FakeRuntime>();
    runtime_ = runtime.get();
    runtime_own_ = kj::mv(runtime);
  }

  ContainerExecutor& Executor() {
    if (!executor_) {
      executor_ = ContainerExecutor::Create(config_, kj::mv(runtime_own_),
                                            io_.provider->getTimer())
                      .wait(io_.waitScope);
    }
    return *executor_;
  }

  ExecutionResult Run(const ExecutionRequest& request) {
    return Executor().Execute(request).wait(io_.waitScope);
  }

  std::vector<std::string> Leftovers() {
    return runtime_->ListContainers(ContainerExecutor::kNamePrefix)
        .wait(io_.waitScope);
  }

  kj::AsyncIoContext io_;
  executor::SandboxConfig config_;
  FakeRuntime* runtime_;
  kj::Own<FakeRuntime> runtime_own_;
  std::unique_ptr<ContainerExecutor> executor_;
};

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, Completed) {
  runtime_->logs.stdout_text = "hello\n";
  ExecutionResult result =
      Run(ExecutionRequest(Language::PYTHON, "print('hello')"));
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.stdout_text, "hello\n");
  EXPECT_EQ(result.metadata["container_id"], "id0");
  EXPECT_EQ(result.metadata["container_status"], "exited");
  EXPECT_THAT(runtime_->removed, ElementsAre("id0"));
  EXPECT_THAT(Leftovers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, NonZeroExit) {
  runtime_->exit_status = 2;
  runtime_->logs.stderr_text = "Traceback\n";
  ExecutionResult result = Run(ExecutionRequest(Language::PYTHON, "x"));
  EXPECT_FALSE(result.success);
  KJ_IF_MAYBE(code, result.exit_code) { EXPECT_EQ(*code, 2); }
  else {
    FAIL() << "missing exit code";
  }
  EXPECT_EQ(result.stderr_text, "Traceback\n");
  EXPECT_THAT(Leftovers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, TimeoutRemovesContainer) {
  runtime_->hang = true;
  runtime_->logs.stdout_text = "partial";
  ExecutionRequest request(Language::SHELL, "sleep 100");
  request.timeout = std::chrono::milliseconds(100);
  ExecutionResult result = Run(request);
  EXPECT_TRUE(result.timed_out);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.exit_code == nullptr);
  EXPECT_EQ(result.stdout_text, "partial");
  EXPECT_THAT(result.stderr_text, HasSubstr("timed out after 100ms"));
  EXPECT_EQ(result.metadata["container_status"], "timed_out");
  EXPECT_GE(result.duration.count(), 100);
  EXPECT_THAT(Leftovers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, StartFailureRemovesContainer) {
  runtime_->fail_start = true;
  EXPECT_THROW(Run(ExecutionRequest(Language::SHELL, "true")),  // NOLINT
               kj::Exception);
  EXPECT_EQ(runtime_->created.size(), 1);
  EXPECT_THAT(runtime_->removed, ElementsAre("id0"));
  EXPECT_THAT(Leftovers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, WaitFailureRemovesContainer) {
  runtime_->fail_wait = true;
  EXPECT_THROW(Run(ExecutionRequest(Language::SHELL, "true")),  // NOLINT
               kj::Exception);
  EXPECT_THAT(runtime_->removed, ElementsAre("id0"));
  EXPECT_THAT(Leftovers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, TimeoutWithLogFailureRemoves) {
  runtime_->hang = true;
  runtime_->fail_logs = true;
  ExecutionRequest request(Language::SHELL, "sleep 100");
  request.timeout = std::chrono::milliseconds(100);
  ExecutionResult result = Run(request);
  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.stdout_text, "");
  EXPECT_THAT(result.stderr_text, HasSubstr("timed out after 100ms"));
  EXPECT_THAT(runtime_->removed, ElementsAre("id0"));
  EXPECT_THAT(Leftovers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, TimeoutIsRepeatable) {
  runtime_->hang = true;
  for (int i = 0; i < 3; i++) {
    ExecutionRequest request(Language::SHELL, "sleep 100");
    request.timeout = std::chrono::milliseconds(50);
    ExecutionResult result = Run(request);
    EXPECT_TRUE(result.timed_out) << i;
    EXPECT_GE(result.duration.count(), 50) << i;
    EXPECT_LT(result.duration.count(), 5000) << i;
  }
  EXPECT_EQ(runtime_->removed.size(), 3);
  EXPECT_THAT(Leftovers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, DurationWithinTimeout) {
  ExecutionRequest request(Language::SHELL, "true");
  request.timeout = std::chrono::milliseconds(1000);
  ExecutionResult result = Run(request);
  EXPECT_TRUE(result.success);
  EXPECT_LE(result.duration.count(), 1000 + 1000);
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, LogFailureStillRemoves) {
  runtime_->fail_logs = true;
  ExecutionResult result = Run(ExecutionRequest(Language::SHELL, "echo hi"));
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.stdout_text, "");
  EXPECT_EQ(result.stderr_text, "");
  EXPECT_THAT(Leftovers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, UnsupportedLanguageCreatesNothing) {
  EXPECT_FALSE(Executor().Supports(Language::WASM));
  EXPECT_THROW(Run(ExecutionRequest(Language::WASM, "(module)")),  // NOLINT
               executor::unsupported_input);
  EXPECT_THAT(runtime_->created, IsEmpty());
  EXPECT_THAT(Leftovers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, WorkingDirTraversal) {
  for (const char* dir : {"..", "../etc", "a/../../b", "/etc"}) {
    ExecutionRequest request(Language::SHELL, "pwd");
    request.working_dir = std::string(dir);
    EXPECT_THROW(Run(request), executor::sandbox_violation)  // NOLINT
        << dir;
  }
  EXPECT_THAT(runtime_->created, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, Spec) {
  config_.container.image = "node:20";
  config_.container.memory_limit = "256m";
  config_.container.cpu_limit = 0.5;
  config_.container.env["FROM_CONFIG"] = "1";
  config_.container.volumes.push_back({"/data", "/mnt/data", true});
  ExecutionRequest request(Language::JAVASCRIPT, "console.log(1)");
  request.env["FROM_REQUEST"] = "2";
  request.working_dir = std::string("src");
  request.args = {"--flag"};
  Run(request);

  ASSERT_EQ(runtime_->created.size(), 1);
  const ContainerSpec& spec = runtime_->created[0];
  EXPECT_THAT(spec.name, ::testing::StartsWith("codebox-exec-"));
  EXPECT_EQ(spec.image, "node:20");
  EXPECT_THAT(spec.cmd, ElementsAre("node", "-e", "console.log(1)", "--flag"));
  EXPECT_THAT(spec.env, Contains("FROM_CONFIG=1"));
  EXPECT_THAT(spec.env, Contains("FROM_REQUEST=2"));
  EXPECT_EQ(spec.working_dir, "/workspace/src");
  EXPECT_TRUE(spec.network_disabled);
  EXPECT_EQ(spec.network_mode, "none");
  EXPECT_EQ(spec.memory_bytes, 256LL * 1024 * 1024);
  EXPECT_EQ(spec.nano_cpus, 500000000);
  EXPECT_THAT(spec.binds, ElementsAre("/data:/mnt/data:ro"));
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, NamesAreUnique) {
  Run(ExecutionRequest(Language::SHELL, "true"));
  Run(ExecutionRequest(Language::SHELL, "true"));
  ASSERT_EQ(runtime_->created.size(), 2);
  EXPECT_NE(runtime_->created[0].name, runtime_->created[1].name);
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, CompiledLanguagesUseSourceVar) {
  Run(ExecutionRequest(Language::RUST, "fn main() {}"));
  const ContainerSpec& spec = runtime_->created[0];
  EXPECT_THAT(spec.env, Contains("CODEBOX_SOURCE=fn main() {}"));
  EXPECT_EQ(spec.cmd[0], "sh");
  EXPECT_THAT(spec.cmd[2], HasSubstr("rustc --edition=2021"));
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, StdinIsPiped) {
  ExecutionRequest request(Language::PYTHON, "print(input())");
  request.stdin_data = std::string("42");
  Run(request);
  const ContainerSpec& spec = runtime_->created[0];
  EXPECT_THAT(spec.env, Contains("CODEBOX_STDIN=42"));
  EXPECT_THAT(spec.cmd,
              ElementsAre("sh", "-c",
                          "data=$CODEBOX_STDIN; unset CODEBOX_STDIN; "
                          "printf '%s' \"$data\" | \"$@\"",
                          "sh", "python3", "-c", "print(input())"));
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, StdinThatCannotBePassedCreatesNothing) {
  ExecutionRequest with_nul(Language::PYTHON, "print(input())");
  with_nul.stdin_data = std::string("a\0b", 3);
  EXPECT_THROW(Run(with_nul), executor::unsupported_input);  // NOLINT
  ExecutionRequest huge(Language::PYTHON, "print(input())");
  huge.stdin_data = std::string(200 * 1024, 'x');
  EXPECT_THROW(Run(huge), executor::unsupported_input);  // NOLINT
  ExecutionRequest fits(Language::PYTHON, "print(input())");
  fits.stdin_data = std::string(100 * 1024, 'x');
  Run(fits);
  EXPECT_EQ(runtime_->created.size(), 1);
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, VariablesAreUnsetBeforeTheProgram) {
  EXPECT_THAT(ContainerExecutor::Command(Language::RUST, "x", {}, false)[2],
              HasSubstr("unset CODEBOX_SOURCE && rustc"));
  EXPECT_THAT(ContainerExecutor::Command(Language::GO, "x", {}, false)[2],
              HasSubstr("unset CODEBOX_SOURCE && exec go run"));
  EXPECT_THAT(ContainerExecutor::Command(Language::SHELL, "x", {}, true)[2],
              HasSubstr("unset CODEBOX_STDIN;"));
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, OutputTruncated) {
  config_.max_output_bytes = 4;
  runtime_->logs.stdout_text = "0123456789";
  ExecutionResult result = Run(ExecutionRequest(Language::SHELL, "true"));
  EXPECT_EQ(result.stdout_text, "0123");
  EXPECT_EQ(result.metadata["stdout_truncated"], "true");
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, PullsMissingImage) {
  runtime_->has_image = false;
  Executor();
  EXPECT_THAT(runtime_->pulled, ElementsAre("python:3.12-slim"));
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, PresentImageNotPulled) {
  Executor();
  EXPECT_THAT(runtime_->pulled, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, CreateFailsWithoutDaemon) {
  runtime_->fail_ping = true;
  EXPECT_THROW(Executor(), kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, HealthCheck) {
  EXPECT_TRUE(Executor().HealthCheck().wait(io_.waitScope));
  runtime_->fail_ping = true;
  EXPECT_FALSE(Executor().HealthCheck().wait(io_.waitScope));
}

// NOLINTNEXTLINE
TEST_F(ContainerExecutorTest, InvalidMemoryLimit) {
  config_.container.memory_limit = "lots";
  EXPECT_THROW(Executor(), executor::configuration_error);  // NOLINT
}

}  // namespace
