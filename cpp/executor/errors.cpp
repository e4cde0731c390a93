#include "executor/errors.hpp"

namespace executor {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::UNSUPPORTED_INPUT:
      return "unsupported input";
    case ErrorKind::SANDBOX_VIOLATION:
      return "sandbox violation";
    case ErrorKind::INFRASTRUCTURE:
      return "infrastructure failure";
    case ErrorKind::CONFIGURATION:
      return "configuration error";
  }
  return "unknown error";
}

}  // namespace executor
