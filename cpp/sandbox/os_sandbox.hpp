#ifndef SANDBOX_OS_SANDBOX_HPP
#define SANDBOX_OS_SANDBOX_HPP

#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <string>
#include <vector>
#include "executor/config.hpp"
#include "executor/executor.hpp"

namespace sandbox {

// Runs code through an interpreter in a child process whose working
// directory is confined to the sandbox root. There is no kernel level
// isolation: the child has the same privileges as this process.
//
// kj::UnixEventPort::captureChildExit() must have been called before the
// event loop was created.
class OsSandbox : public executor::Executor {
 public:
  OsSandbox(const executor::SandboxConfig& config, kj::AsyncIoContext& io);

  std::string Name() const override { return "os"; }
  std::vector<executor::Language> SupportedLanguages() const override;
  kj::Promise<bool> HealthCheck() override;

  // Canonical path of the sandbox root.
  const std::string& Root() const { return root_; }

  // Resolves a working directory relative to the root, creating it if
  // needed. Throws sandbox_violation if it ends up outside the root, either
  // lexically or through symlinks.
  std::string ResolveWorkingDir(const kj::Maybe<std::string>& working_dir);

  // The interpreter command line that runs code, without looking it up in
  // PATH. Throws unsupported_input for languages without an inline form and
  // infrastructure_error if no TypeScript runtime is installed.
  static std::vector<std::string> InterpreterCommand(
      executor::Language language, const std::string& code);

 protected:
  kj::Promise<executor::ExecutionResult> ExecuteInternal(
      const executor::ExecutionRequest& request) override;

 private:
  struct Child {
    pid_t pid;
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
  };

  // Forks and execs binary. The child gets its own session, so that
  // killing -pid reaches every process it spawned.
  static Child Spawn(const std::string& binary,
                     const std::vector<std::string>& args,
                     const std::vector<std::string>& env,
                     const std::string& cwd);

  std::string root_;
  size_t max_output_bytes_;
  kj::LowLevelAsyncIoProvider& low_level_;
  kj::UnixEventPort& event_port_;
  kj::Timer& timer_;
};

}  // namespace sandbox

#endif
