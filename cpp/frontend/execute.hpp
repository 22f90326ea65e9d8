#ifndef FRONTEND_EXECUTE_HPP
#define FRONTEND_EXECUTE_HPP
#include <kj/main.h>

namespace frontend {

// "execute" subcommand: reads one ExecutionRequest from stdin and writes the
// ExecutionResult to stdout.
class ExecuteMain {
 public:
  explicit ExecuteMain(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  bool binary = false;
};

}  // namespace frontend
#endif
