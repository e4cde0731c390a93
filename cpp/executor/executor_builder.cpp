#include "executor/executor_builder.hpp"

#include <kj/debug.h>
#include <memory>
#include "container/container_executor.hpp"
#include "container/docker_client.hpp"
#include "sandbox/os_sandbox.hpp"
#include "wasm/wasm_executor.hpp"

namespace executor {

kj::Promise<std::unique_ptr<Executor>> ExecutorBuilder::Build(
    const SandboxConfig& config, kj::AsyncIoContext& io) {
  ValidateConfig(config);
  KJ_LOG(INFO, "Building executor", ExecutionEnvName(config.execution_env));
  switch (config.execution_env) {
    case ExecutionEnv::OS:
      return std::unique_ptr<Executor>(
          std::make_unique<sandbox::OsSandbox>(config, io));
    case ExecutionEnv::SANDBOX:
      return std::unique_ptr<Executor>(
          std::make_unique<wasm::WasmExecutor>(config, io));
    case ExecutionEnv::CONTAINER:
      break;
  }

  kj::Timer& timer = io.provider->getTimer();
  SandboxConfig container_config = config;
  return container::DockerClient::Connect(io.provider->getNetwork(), timer,
                                          config.container.socket_path)
      .then([container_config, &timer](
                kj::Own<container::DockerClient>&& client) {
        return container::ContainerExecutor::Create(container_config,
                                                    kj::mv(client), timer);
      })
      .then(
          [](std::unique_ptr<container::ContainerExecutor>&& executor)
              -> std::unique_ptr<Executor> { return std::move(executor); },
          [](kj::Exception&& e) -> std::unique_ptr<Executor> {
            kj::throwFatalException(
                KJ_EXCEPTION(FAILED, "Cannot start the container backend: ",
                             e.getDescription()));
          });
}

}  // namespace executor
