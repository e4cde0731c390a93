#ifndef EXECUTOR_EXECUTOR_BUILDER_HPP
#define EXECUTOR_EXECUTOR_BUILDER_HPP

#include <kj/async-io.h>
#include <memory>
#include "executor/config.hpp"
#include "executor/executor.hpp"

namespace executor {

class ExecutorBuilder {
 public:
  // Validates config and creates the backend it selects. Invalid settings
  // and backends that cannot be constructed synchronously throw
  // configuration_error; the container backend, which has to talk to its
  // daemon first, rejects the returned promise instead.
  //
  // The os backend needs kj::UnixEventPort::captureChildExit() to have been
  // called before io was set up.
  static kj::Promise<std::unique_ptr<Executor>> Build(
      const SandboxConfig& config, kj::AsyncIoContext& io);
};

}  // namespace executor

#endif
