#ifndef EXECUTOR_RUN_CODE_HPP
#define EXECUTOR_RUN_CODE_HPP

#include <kj/async.h>
#include <string>
#include "executor/executor.hpp"

namespace executor {

struct RunReport {
  enum class Outcome { COMPLETED, FAILED, TIMED_OUT, SANDBOX_ERROR };

  Outcome outcome = Outcome::SANDBOX_ERROR;
  // Missing only for SANDBOX_ERROR.
  kj::Maybe<ExecutionResult> result;
  std::string message;
};

const char* OutcomeName(RunReport::Outcome outcome);

// Runs request to completion and classifies what happened. Never throws for
// errors raised by the executor: those become SANDBOX_ERROR reports.
RunReport RunCode(Executor& executor, const ExecutionRequest& request,
                  kj::WaitScope& wait_scope);

// Human readable rendering of a report.
std::string FormatReport(const RunReport& report);

// {"success": ..., "exit_code": ..., "stdout": ..., "stderr": ...,
//  "duration_ms": ..., "timed_out": ..., "metadata": {...}}
std::string ResultToJson(const ExecutionResult& result);

}  // namespace executor

#endif
