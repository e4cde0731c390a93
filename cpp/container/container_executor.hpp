#ifndef CONTAINER_CONTAINER_EXECUTOR_HPP
#define CONTAINER_CONTAINER_EXECUTOR_HPP

#include <kj/async.h>
#include <kj/timer.h>
#include <memory>
#include <string>
#include <vector>
#include "container/container_runtime.hpp"
#include "executor/config.hpp"
#include "executor/executor.hpp"

namespace container {

// Runs every request in a fresh container that is removed afterwards,
// whatever the outcome.
class ContainerExecutor : public executor::Executor {
 public:
  static const constexpr char* kNamePrefix = "codebox-exec-";

  // Checks that the runtime answers and that the image is available, pulling
  // it if needed. The returned promise fails if either is not the case.
  static kj::Promise<std::unique_ptr<ContainerExecutor>> Create(
      const executor::SandboxConfig& config, kj::Own<ContainerRuntime> runtime,
      kj::Timer& timer);

  ContainerExecutor(const executor::SandboxConfig& config,
                    kj::Own<ContainerRuntime> runtime, kj::Timer& timer);

  std::string Name() const override { return "container"; }
  std::vector<executor::Language> SupportedLanguages() const override;
  kj::Promise<bool> HealthCheck() override;

  // The container command running code with the given arguments. With
  // has_stdin the command reads CODEBOX_STDIN as its standard input.
  // Compiled languages read their source from CODEBOX_SOURCE. Both variables
  // are unset before the program itself starts.
  static std::vector<std::string> Command(executor::Language language,
                                          const std::string& code,
                                          const std::vector<std::string>& args,
                                          bool has_stdin);

  // Everything the container for request is created with. Throws
  // sandbox_violation if the working directory escapes the workdir.
  ContainerSpec BuildSpec(const executor::ExecutionRequest& request) const;

 protected:
  kj::Promise<executor::ExecutionResult> ExecuteInternal(
      const executor::ExecutionRequest& request) override;

 private:
  std::string ResolveWorkingDir(
      const kj::Maybe<std::string>& working_dir) const;

  executor::ContainerConfig config_;
  size_t max_output_bytes_;
  int64_t memory_bytes_;
  int64_t nano_cpus_;
  kj::Own<ContainerRuntime> runtime_;
  kj::Timer& timer_;
};

}  // namespace container

#endif
