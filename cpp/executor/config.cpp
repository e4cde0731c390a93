#include "executor/config.hpp"

#include <kj/debug.h>
#include <cstdlib>
#include "container/limits.hpp"
#include "executor/errors.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace executor {

ExecutionEnv ParseExecutionEnv(const std::string& name) {
  std::string lower = util::ToLower(name);
  if (lower == "os") return ExecutionEnv::OS;
  if (lower == "sandbox" || lower == "wasm") return ExecutionEnv::SANDBOX;
  if (lower == "container" || lower == "docker") {
    return ExecutionEnv::CONTAINER;
  }
  throw configuration_error("Invalid execution environment: " + name +
                            ". Valid: os, sandbox, container");
}

std::string ExecutionEnvName(ExecutionEnv env) {
  switch (env) {
    case ExecutionEnv::OS:
      return "os";
    case ExecutionEnv::SANDBOX:
      return "sandbox";
    case ExecutionEnv::CONTAINER:
      return "container";
  }
  return "unknown";
}

std::string SandboxConfig::DefaultRoot() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || home[0] == '\0') return "/tmp/codebox/workspace";
  return util::File::JoinPath(home, ".codebox/workspace");
}

void ValidateConfig(const SandboxConfig& config) {
  if (config.default_timeout.count() <= 0) {
    throw configuration_error("The default timeout must be positive");
  }
  if (config.max_output_bytes == 0) {
    throw configuration_error("The output limit must be positive");
  }
  switch (config.execution_env) {
    case ExecutionEnv::OS:
      if (config.root.empty()) {
        throw configuration_error("The sandbox root must not be empty");
      }
      if (!util::File::IsDirectory(config.root)) {
        KJ_LOG(WARNING, "The sandbox root does not exist, it will be created",
               config.root);
      }
      break;
    case ExecutionEnv::SANDBOX:
      if (config.wasm.max_memory_pages == 0) {
        throw configuration_error("The WebAssembly page limit must be positive");
      }
      if (config.wasm.fuel_limit == 0) {
        throw configuration_error("The WebAssembly fuel limit must be positive");
      }
      KJ_LOG(WARNING,
             "The WebAssembly environment cannot run python or javascript "
             "source, such requests will fail");
      break;
    case ExecutionEnv::CONTAINER:
      if (config.container.image.empty()) {
        throw configuration_error(
            "Container execution requires a non-empty image");
      }
      container::ParseMemoryLimit(config.container.memory_limit);
      container::CpuToNanoCpus(config.container.cpu_limit);
      if (config.container.workdir.empty() ||
          config.container.workdir[0] != '/') {
        throw configuration_error(
            "The container working directory must be an absolute path");
      }
      break;
  }
}

}  // namespace executor
