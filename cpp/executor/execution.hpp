#ifndef EXECUTOR_EXECUTION_HPP
#define EXECUTOR_EXECUTION_HPP

#include <kj/common.h>
#include <chrono>
#include <map>
#include <string>
#include <vector>
#include "executor/language.hpp"

namespace executor {

static const constexpr std::chrono::milliseconds kDefaultTimeout{30000};

// One execution attempt. A zero timeout means "use the executor default".
struct ExecutionRequest {
  Language language;
  std::string code;
  std::chrono::milliseconds timeout{0};
  // Relative to the backend's sandbox root.
  kj::Maybe<std::string> working_dir;
  std::map<std::string, std::string> env;
  kj::Maybe<std::string> stdin_data;
  // Only used by the container and WebAssembly backends.
  std::vector<std::string> args;

  ExecutionRequest(Language language, std::string code)
      : language(language), code(std::move(code)) {}
};

// Outcome of a call that managed to run the code. A program that fails,
// crashes or times out still produces an ExecutionResult.
struct ExecutionResult {
  bool success = false;
  // Absent on timeout.
  kj::Maybe<int32_t> exit_code;
  std::string stdout_text;
  std::string stderr_text;
  std::chrono::milliseconds duration{0};
  bool timed_out = false;
  std::map<std::string, std::string> metadata;

  // stdout and stderr joined by a newline, skipping empty ones.
  std::string CombinedOutput() const;

  static ExecutionResult Completed(int32_t exit_code, std::string stdout_text,
                                   std::string stderr_text,
                                   std::chrono::milliseconds duration);
  static ExecutionResult TimedOut(std::string stdout_text,
                                  std::string stderr_text,
                                  std::chrono::milliseconds duration);
};

// Milliseconds elapsed since start on the steady clock.
std::chrono::milliseconds ElapsedSince(
    std::chrono::steady_clock::time_point start);

}  // namespace executor

#endif
