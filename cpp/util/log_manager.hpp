#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <ostream>
#include <string>
#include "backward.hpp"

namespace util {

// Routes kj log messages to stderr, or to Flags::log_file when set. Lowers
// the kj log level to INFO when Flags::verbose is set. Installed for the
// lifetime of the object. Each line carries the pid.
// Colors are used only when logging to a terminal.
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
  std::string Paint(const char* color_code, const std::string& text) const;

  std::ostream& out;
  const bool color;
  backward::SignalHandling sh;  // Override kj's signal handling.
};
}  // namespace util

#endif
