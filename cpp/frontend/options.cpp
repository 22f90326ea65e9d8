#include "frontend/options.hpp"

#include <kj/debug.h>
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace frontend {

kj::MainBuilder& AddConfigOptions(kj::MainBuilder& builder) {  // NOLINT
  return builder
      .addOptionWithArg({'r', "runtime"}, util::setString(Flags::runtime),
                        "<RUNTIME>",
                        "Runtime CLI to use, by name or path "
                        "(PYTHON_WASM_RUNTIME, default: wasmtime)")
      .addOptionWithArg({'m', "module"}, util::setString(Flags::module_path),
                        "<PYTHON_WASM>",
                        "Path of the interpreter module (PYTHON_WASM_PATH)")
      .addOptionWithArg({"runtime-args"}, util::setString(Flags::runtime_args),
                        "<ARGS>",
                        "Extra runtime options, split like a shell would "
                        "(PYTHON_WASM_RUNTIME_ARGS)")
      .addOption({"no-isolated"}, util::clearBool(Flags::isolated),
                 "Do not run the interpreter in isolated mode (-I)")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(Flags::temp_directory), "<DIR>",
                        "Path where the working directories should be created")
      .addOptionWithArg({"max-timeout"},
                        util::setInt(Flags::max_timeout_millis), "<MS>",
                        "Maximum timeout of an execution (MAX_EXEC_TIMEOUT_MS)")
      .addOptionWithArg({"default-timeout"},
                        util::setInt(Flags::default_timeout_millis), "<MS>",
                        "Timeout of executions that do not specify one")
      .addOptionWithArg({"max-output"}, util::setInt(Flags::max_output_bytes),
                        "<BYTES>",
                        "Bytes of stdout and of stderr kept for each execution "
                        "(MAX_OUTPUT_BYTES)")
      .addOptionWithArg({"cpu-limit"}, util::setInt(Flags::cpu_time_limit_sec),
                        "<SEC>",
                        "CPU time limit, 0 for none (CPU_TIME_LIMIT_SEC)")
      .addOptionWithArg({"memory-limit"}, util::setInt(Flags::memory_limit_mb),
                        "<MB>",
                        "Address space limit, 0 for none (MEMORY_LIMIT_MB)")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages too");
}

config::Config LoadConfigOrExit(kj::ProcessContext& context) {  // NOLINT
  try {
    return config::Load();
  } catch (const kj::Exception& e) {
    context.exitError(kj::str("Invalid configuration: ", e.getDescription()));
  }
}

}  // namespace frontend
