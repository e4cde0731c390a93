#ifndef EXECUTOR_ERRORS_HPP
#define EXECUTOR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace executor {

enum class ErrorKind {
  UNSUPPORTED_INPUT,
  SANDBOX_VIOLATION,
  INFRASTRUCTURE,
  CONFIGURATION
};

const char* ErrorKindName(ErrorKind kind);

// Base class of the errors raised by executors. The program's own failures
// are never reported through these: they end up in the ExecutionResult.
class execution_error : public std::runtime_error {
 public:
  execution_error(ErrorKind kind, const std::string& msg)
      : std::runtime_error(msg), kind_(kind) {}
  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

// The backend cannot run the requested language, or the input cannot be
// interpreted at all. Raised before any resource is allocated.
class unsupported_input : public execution_error {
 public:
  explicit unsupported_input(const std::string& msg)
      : execution_error(ErrorKind::UNSUPPORTED_INPUT, msg) {}
};

// The requested working directory escapes the sandbox root.
class sandbox_violation : public execution_error {
 public:
  explicit sandbox_violation(const std::string& msg)
      : execution_error(ErrorKind::SANDBOX_VIOLATION, msg) {}
};

// The sandbox itself failed: cannot spawn, cannot reach the container
// daemon, cannot compile or instantiate a module.
class infrastructure_error : public execution_error {
 public:
  explicit infrastructure_error(const std::string& msg)
      : execution_error(ErrorKind::INFRASTRUCTURE, msg) {}
};

// Invalid configuration, or a backend that cannot be constructed with it.
class configuration_error : public execution_error {
 public:
  explicit configuration_error(const std::string& msg)
      : execution_error(ErrorKind::CONFIGURATION, msg) {}
};

}  // namespace executor

#endif
