#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <kj/async.h>
#include <chrono>
#include <string>
#include <vector>
#include "executor/execution.hpp"
#include "executor/language.hpp"

namespace executor {

// Common interface of the execution backends.
class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Name() const = 0;

  // Languages this executor accepts.
  virtual std::vector<Language> SupportedLanguages() const = 0;

  bool Supports(Language language) const;

  // Runs the request. A program that fails, crashes or times out produces a
  // result. Requests this backend cannot accept throw unsupported_input or
  // sandbox_violation before anything is started; failures of the backend
  // itself throw infrastructure_error, or reject the promise once the
  // execution is under way.
  kj::Promise<ExecutionResult> Execute(const ExecutionRequest& request)
      KJ_WARN_UNUSED_RESULT;

  // Cheap readiness probe, independent of any request.
  virtual kj::Promise<bool> HealthCheck() KJ_WARN_UNUSED_RESULT = 0;

  std::chrono::milliseconds DefaultTimeout() const { return default_timeout_; }

  explicit Executor(std::chrono::milliseconds default_timeout)
      : default_timeout_(default_timeout) {}
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;

 protected:
  // Called with a supported language and a non-zero timeout. request only
  // lives until this returns.
  virtual kj::Promise<ExecutionResult> ExecuteInternal(
      const ExecutionRequest& request) = 0;

 private:
  std::chrono::milliseconds default_timeout_;
};

}  // namespace executor

#endif
