#include "executor/run_code.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include "executor/errors.hpp"

namespace executor {

namespace {

const char* kFailedMessage = "the code ran and failed";
const char* kSandboxErrorMessage = "the sandbox itself could not run your code";

void AppendSection(const char* title, const std::string& body,
                   std::string* text) {
  if (body.empty()) return;
  *text += title;
  *text += ":\n" + body;
  if (body.back() != '\n') *text += "\n";
}

capnp::Text::Reader AsText(const std::string& s) {
  return capnp::Text::Reader(s.data(), s.size());
}

}  // namespace

const char* OutcomeName(RunReport::Outcome outcome) {
  switch (outcome) {
    case RunReport::Outcome::COMPLETED:
      return "completed";
    case RunReport::Outcome::FAILED:
      return "failed";
    case RunReport::Outcome::TIMED_OUT:
      return "timed_out";
    case RunReport::Outcome::SANDBOX_ERROR:
      return "sandbox_error";
  }
  KJ_UNREACHABLE;
}

RunReport RunCode(Executor& executor, const ExecutionRequest& request,
                  kj::WaitScope& wait_scope) {
  RunReport report;
  try {
    ExecutionResult result = executor.Execute(request).wait(wait_scope);
    if (result.timed_out) {
      report.outcome = RunReport::Outcome::TIMED_OUT;
      report.message = "the code did not finish in time";
    } else if (result.success) {
      report.outcome = RunReport::Outcome::COMPLETED;
      report.message = "the code ran successfully";
    } else {
      report.outcome = RunReport::Outcome::FAILED;
      report.message = kFailedMessage;
    }
    report.result = kj::mv(result);
  } catch (const execution_error& e) {
    KJ_LOG(WARNING, executor.Name(), ErrorKindName(e.kind()), e.what());
    report.outcome = RunReport::Outcome::SANDBOX_ERROR;
    report.message = std::string(kSandboxErrorMessage) + " (" +
                     ErrorKindName(e.kind()) + "): " + e.what();
  } catch (const kj::Exception& e) {
    KJ_LOG(WARNING, executor.Name(), e.getDescription());
    report.outcome = RunReport::Outcome::SANDBOX_ERROR;
    report.message = std::string(kSandboxErrorMessage) + ": " +
                     e.getDescription().cStr();
  }
  return report;
}

std::string FormatReport(const RunReport& report) {
  std::string text = report.message + "\n";
  KJ_IF_MAYBE(result, report.result) {
    AppendSection("Output", result->stdout_text, &text);
    AppendSection("Errors", result->stderr_text, &text);
    if (result->timed_out) {
      text += "Execution timed out\n";
    } else {
      KJ_IF_MAYBE(code, result->exit_code) {
        text += "Exit code: " + std::to_string(*code) + "\n";
      }
    }
    text += "Time: " + std::to_string(result->duration.count()) + "ms\n";
  }
  return text;
}

std::string ResultToJson(const ExecutionResult& result) {
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnp::JsonValue>();
  auto fields = root.initObject(7);

  fields[0].setName("success");
  fields[0].initValue().setBoolean(result.success);
  fields[1].setName("exit_code");
  KJ_IF_MAYBE(code, result.exit_code) {
    fields[1].initValue().setNumber(*code);
  } else {
    fields[1].initValue().setNull();
  }
  fields[2].setName("stdout");
  fields[2].initValue().setString(AsText(result.stdout_text));
  fields[3].setName("stderr");
  fields[3].initValue().setString(AsText(result.stderr_text));
  fields[4].setName("duration_ms");
  fields[4].initValue().setNumber(result.duration.count());
  fields[5].setName("timed_out");
  fields[5].initValue().setBoolean(result.timed_out);

  fields[6].setName("metadata");
  auto metadata = fields[6].initValue().initObject(result.metadata.size());
  unsigned int i = 0;
  for (const auto& kv : result.metadata) {
    metadata[i].setName(AsText(kv.first));
    metadata[i].initValue().setString(AsText(kv.second));
    i++;
  }

  capnp::JsonCodec codec;
  return codec.encodeRaw(root.asReader()).cStr();
}

}  // namespace executor
