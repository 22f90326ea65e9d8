#include "frontend/execute.hpp"
#include "frontend/run.hpp"
#include "util/flags.hpp"
#include "util/version.hpp"

class WasiExecMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit WasiExecMain(kj::ProcessContext& context)
      : context(context), em(&context), rm(&context) {
    // Command line options override the environment.
    Flags::LoadFromEnvironment();
  }
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "wasi-exec (" + util::version + ")",
                           "Runs untrusted Python snippets in a WASI runtime")
        .addSubCommand("execute", KJ_BIND_METHOD(em, getMain),
                       "run one ExecutionRequest read from stdin")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "run a source file and relay its output")
        .build();
  }

 private:
  kj::ProcessContext& context;
  frontend::ExecuteMain em;
  frontend::RunMain rm;
};

KJ_MAIN(WasiExecMain);
