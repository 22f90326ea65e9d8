#ifndef FRONTEND_RUN_HPP
#define FRONTEND_RUN_HPP
#include <cstdint>
#include <string>

#include <kj/main.h>

namespace frontend {

// "run" subcommand: executes a source file and relays its output and exit
// status.
class RunMain {
 public:
  // Exit status when the execution timed out, as timeout(1) does.
  static const constexpr int kTimeoutStatus = 124;

  explicit RunMain(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string code_file;
  std::string stdin_file;
  int64_t timeout_millis = 0;
};

}  // namespace frontend
#endif
