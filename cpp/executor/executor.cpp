#include "executor/executor.hpp"

#include <algorithm>
#include "executor/errors.hpp"

namespace executor {

bool Executor::Supports(Language language) const {
  std::vector<Language> languages = SupportedLanguages();
  return std::find(languages.begin(), languages.end(), language) !=
         languages.end();
}

kj::Promise<ExecutionResult> Executor::Execute(
    const ExecutionRequest& request) {
  if (!Supports(request.language)) {
    throw unsupported_input("Language " + LanguageName(request.language) +
                            " is not supported by the " + Name() +
                            " executor");
  }
  if (request.timeout.count() < 0) {
    throw unsupported_input("The timeout must not be negative");
  }
  if (request.timeout.count() == 0) {
    ExecutionRequest with_timeout = request;
    with_timeout.timeout = default_timeout_;
    return ExecuteInternal(with_timeout);
  }
  return ExecuteInternal(request);
}

}  // namespace executor
