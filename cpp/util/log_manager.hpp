#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <ostream>
#include "backward.hpp"

namespace util {

// Routes KJ_LOG output and kj exceptions to stderr (or Flags::log_file),
// colored when writing to a terminal. Flags::verbose lowers the threshold
// from WARNING to INFO and enables stack traces for exceptions.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext& context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
  bool colors_;
  backward::SignalHandling sh;  // Override kj's signal handling.
};
}  // namespace util

#endif
