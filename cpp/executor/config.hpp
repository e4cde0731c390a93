#ifndef EXECUTOR_CONFIG_HPP
#define EXECUTOR_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "executor/execution.hpp"

namespace executor {

enum class ExecutionEnv { OS, SANDBOX, CONTAINER };

// Accepts os, sandbox (or wasm) and container (or docker), ignoring case.
// Throws configuration_error otherwise.
ExecutionEnv ParseExecutionEnv(const std::string& name);
std::string ExecutionEnvName(ExecutionEnv env);

struct VolumeMount {
  std::string host_path;
  std::string container_path;
  bool read_only = true;
};

struct ContainerConfig {
  std::string image = "python:3.12-slim";
  // "none" disables networking altogether.
  std::string network = "none";
  // Human readable, see container::ParseMemoryLimit.
  std::string memory_limit = "512m";
  // Fractional number of cores.
  double cpu_limit = 1.0;
  std::string socket_path = "/var/run/docker.sock";
  // Working directories of requests are resolved inside this directory.
  std::string workdir = "/workspace";
  std::map<std::string, std::string> env;
  std::vector<VolumeMount> volumes;
};

struct WasmConfig {
  // One page is 64KiB.
  uint32_t max_memory_pages = 256;
  // Upper bound of the fuel given to a single call.
  uint64_t fuel_limit = 1000000000;
};

struct SandboxConfig {
  ExecutionEnv execution_env = ExecutionEnv::SANDBOX;
  // Directory the OS sandbox confines working directories to.
  std::string root = DefaultRoot();
  std::chrono::milliseconds default_timeout = kDefaultTimeout;
  // Per stream.
  size_t max_output_bytes = 1024 * 1024;
  ContainerConfig container;
  WasmConfig wasm;

  // $HOME/.codebox/workspace, or /tmp/codebox/workspace without $HOME.
  static std::string DefaultRoot();
};

// Throws configuration_error if config cannot possibly work. Emits warnings
// for suspicious but valid settings.
void ValidateConfig(const SandboxConfig& config);

}  // namespace executor

#endif
