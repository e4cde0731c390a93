#include "executor/execution.hpp"

namespace executor {

std::string ExecutionResult::CombinedOutput() const {
  if (stdout_text.empty()) return stderr_text;
  if (stderr_text.empty()) return stdout_text;
  return stdout_text + "\n" + stderr_text;
}

ExecutionResult ExecutionResult::Completed(int32_t exit_code,
                                           std::string stdout_text,
                                           std::string stderr_text,
                                           std::chrono::milliseconds duration) {
  ExecutionResult result;
  result.success = exit_code == 0;
  result.exit_code = exit_code;
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  result.duration = duration;
  return result;
}

ExecutionResult ExecutionResult::TimedOut(std::string stdout_text,
                                          std::string stderr_text,
                                          std::chrono::milliseconds duration) {
  ExecutionResult result;
  result.timed_out = true;
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  result.duration = duration;
  return result;
}

std::chrono::milliseconds ElapsedSince(
    std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
}

}  // namespace executor
