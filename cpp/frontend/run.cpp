#include "frontend/run.hpp"
#include <unistd.h>
#include <cstdlib>
#include <system_error>

#include <kj/debug.h>

#include "frontend/codec.hpp"
#include "frontend/options.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace frontend {
kj::MainBuilder::Validity RunMain::Run() {
  util::LogManager log_manager(context);
  config::Config config = LoadConfigOrExit(context);

  sandbox::ExecutionRequest request;
  try {
    if (code_file.empty() || code_file == "-") {
      request.code = util::File::ReadFd(STDIN_FILENO);
    } else {
      request.code = util::File::Read(code_file);
    }
    if (!stdin_file.empty()) {
      request.has_stdin = true;
      request.stdin_data = util::File::Read(stdin_file);
    }
  } catch (const std::system_error& e) {
    return kj::str(e.what());
  }
  request.timeout_millis = ClampTimeout(timeout_millis, config);

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create(config);
  sandbox::ExecutionResult result;
  std::string error_msg;
  if (!sb->Execute(request, &result, &error_msg)) {
    context.exitError(kj::str("Failed to start: ", error_msg.c_str()));
  }

  util::File::WriteFd(STDOUT_FILENO, result.stdout_data);
  util::File::WriteFd(STDERR_FILENO, result.stderr_data);
  if (result.stdout_truncated) KJ_LOG(WARNING, "stdout was truncated");
  if (result.stderr_truncated) KJ_LOG(WARNING, "stderr was truncated");
  KJ_LOG(INFO, "Execution finished", result.duration_millis);

  if (result.timed_out) {
    util::File::WriteFd(STDERR_FILENO,
                        "Timed out after " +
                            std::to_string(request.timeout_millis) + " ms\n");
    exit(kTimeoutStatus);
  }
  if (result.exit_code != 0) {
    // Shells report a death by signal N as 128 + N.
    exit(result.exit_code > 0 ? result.exit_code : 128 - result.exit_code);
  }
  return true;
}

kj::MainFunc RunMain::getMain() {
  kj::MainBuilder builder(context, "wasi-exec run (" + util::version + ")",
                          "Runs a Python source file in the isolated runtime, "
                          "relaying its output and exit status");
  return AddConfigOptions(builder)
      .addOptionWithArg({'t', "timeout"}, util::setInt(timeout_millis), "<MS>",
                        "Wall-clock timeout of the execution")
      .addOptionWithArg({'i', "stdin"}, util::setString(stdin_file), "<FILE>",
                        "File fed to the standard input of the program")
      .expectOptionalArg("<FILE>", util::setString(code_file))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace frontend
