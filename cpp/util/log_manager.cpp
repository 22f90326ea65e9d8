#include "util/log_manager.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <unistd.h>
#include <kj/debug.h>
#include "util/file.hpp"
#include "util/flags.hpp"

namespace util {
namespace {
std::ostream& ChooseOut() {
  if (Flags::log_file != "") {
    static std::ofstream of(Flags::log_file, std::ios::app);
    return of;
  } else {
    return std::cerr;
  }
}

static const constexpr char* log_msg[] = {"INFO", "WARNING", "ERROR", "FATAL",
                                          "DBG"};
static const constexpr char* colors[] = {"\e[0;32m", "\e[0;33m", "\e[0;31m",
                                         "\e[7;31m", "\e[0;35m"};
const constexpr char* reset_color = "\e[m";
const constexpr char* file_color = "\e[0;34m";
const constexpr char* date_color = "\e[0;36m";

constexpr bool strings_equal(char const* a, char const* b) {
  return *a == *b && (*a == '\0' || strings_equal(a + 1, b + 1));
}

#define CHECK_MSG(lvl)                                                   \
  static_assert(strings_equal(#lvl, log_msg[(int)kj::LogSeverity::lvl]), \
                #lvl " has a wrong log message!");

CHECK_MSG(INFO);
CHECK_MSG(WARNING);
CHECK_MSG(ERROR);
CHECK_MSG(FATAL);
CHECK_MSG(DBG);

}  // namespace

void LogManager::PrintStackTrace() {
  if (!::kj::_::Debug::shouldLog(kj::LogSeverity::INFO)) return;
  backward::StackTrace s;
  s.load_here();
  backward::Printer p;
  p.color_mode =
      color ? backward::ColorMode::always : backward::ColorMode::never;
  p.print(s, out);
}

void LogManager::onRecoverableException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::WARNING, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onRecoverableException(kj::mv(exception));
}

void LogManager::onFatalException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::FATAL, exception.getFile(), exception.getLine(),
             0, kj::heapString(exception.getDescription()));
  PrintStackTrace();
  next.onFatalException(kj::mv(exception));
}

LogManager::LogManager(kj::ProcessContext& context)
    : out(ChooseOut()),
      color(Flags::log_file.empty() && isatty(STDERR_FILENO)) {
  if (!out) {
    context.exitError("Invalid log file provided!");
  }
  if (Flags::verbose) {
    ::kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
  }
}

std::string LogManager::Paint(const char* color_code,
                              const std::string& text) const {
  if (!color) return text;
  return color_code + text + reset_color;
}

void LogManager::logMessage(kj::LogSeverity severity, const char* file,
                            int line, int contextDepth, kj::String&& text) {
  std::time_t t = std::time(nullptr);
  std::tm tm = {};
  localtime_r(&t, &tm);
  std::ostringstream date;
  date << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  std::ostringstream msg;
  msg << Paint(date_color, date.str()) << " "
      << Paint(colors[(int)severity],
               std::string(1, log_msg[(int)severity][0]))
      << " " << getpid() << " ";
  // Padding is computed on the visible text only.
  std::string location =
      util::File::BaseName(file) + ":" + std::to_string(line);
  if (location.size() < 30) location.resize(30, ' ');
  msg << Paint(file_color, location) << " "
      << std::string(contextDepth * 2, ' ') << text.cStr() << "\n";
  out << msg.str() << std::flush;
}
}  // namespace util
