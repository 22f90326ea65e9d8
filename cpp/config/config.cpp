#include "config/config.hpp"

#include <cstdlib>
#include <system_error>

#include <kj/debug.h>
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace config {

namespace {
const constexpr char* kDefaultRuntime = "wasmtime";
const constexpr char kWasmMagic[] = {'\0', 'a', 's', 'm'};

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> FallbackRuntimePaths() {
  std::vector<std::string> paths = {"/opt/homebrew/bin/wasmtime",
                                    "/usr/local/bin/wasmtime"};
  const char* home = std::getenv("HOME");
  if (home != nullptr && home[0] != '\0') {
    paths.push_back(util::File::JoinPath(home, ".wasmtime/bin/wasmtime"));
    paths.push_back(util::File::JoinPath(home, ".cargo/bin/wasmtime"));
  }
  return paths;
}
}  // namespace

std::string ResolveRuntime(const std::string& runtime) {
  std::string path = util::which(runtime);
  if (!path.empty()) return path;
  if (!runtime.empty() && runtime != kDefaultRuntime) {
    KJ_LOG(WARNING, "Runtime not found, falling back to wasmtime",
           runtime.c_str());
  }
  path = util::which(kDefaultRuntime);
  if (!path.empty()) return path;
  for (const std::string& candidate : FallbackRuntimePaths()) {
    if (util::File::IsExecutable(candidate)) return candidate;
  }
  return "";
}

void CheckModule(const std::string& path) {
  KJ_REQUIRE(!path.empty(),
             "PYTHON_WASM_PATH (or --module) must point to python.wasm");
  KJ_REQUIRE(util::File::Exists(path), "WASM module not found", path.c_str());
  KJ_REQUIRE(!util::File::IsDirectory(path),
             "The WASM module path must point to a WebAssembly binary, but a "
             "directory was provided",
             path.c_str());
  std::string magic;
  try {
    magic = util::File::ReadPrefix(path, sizeof(kWasmMagic));
  } catch (const std::system_error& e) {
    KJ_FAIL_REQUIRE("Unable to read the WASM module", path.c_str(),
                    e.what());
  }
  bool is_wasm = magic.size() == sizeof(kWasmMagic) &&
                 magic.compare(0, magic.size(), kWasmMagic,
                               sizeof(kWasmMagic)) == 0;
  KJ_REQUIRE(is_wasm,
             "The module must be a valid WebAssembly binary (magic '\\0asm'); "
             "check that it points to python.wasm and not to the runtime",
             path.c_str());
}

void CheckRuntimeArgs(const std::vector<std::string>& args) {
  for (const std::string& arg : args) {
    bool preopens = arg == "--dir" || StartsWith(arg, "--dir=") ||
                    arg == "--mapdir" || StartsWith(arg, "--mapdir=");
    KJ_REQUIRE(!preopens,
               "Runtime arguments must not preopen host directories",
               arg.c_str());
  }
}

Config Load() {
  Config config;

  config.runtime_path = ResolveRuntime(Flags::runtime);
  KJ_REQUIRE(!config.runtime_path.empty(),
             "WASM runtime binary not found; set PYTHON_WASM_RUNTIME (or "
             "--runtime) to the runtime CLI, e.g. wasmtime",
             Flags::runtime.c_str());

  CheckModule(Flags::module_path);
  config.module_path = util::File::Absolute(Flags::module_path);

  config.runtime_args = util::shellSplit(Flags::runtime_args);
  CheckRuntimeArgs(config.runtime_args);
  config.isolated = Flags::isolated;

  KJ_REQUIRE(!Flags::temp_directory.empty(), "Empty temporary directory");
  config.temp_directory = util::File::Absolute(Flags::temp_directory);

  KJ_REQUIRE(Flags::max_timeout_millis > 0, "Maximum timeout must be positive",
             Flags::max_timeout_millis);
  KJ_REQUIRE(Flags::default_timeout_millis > 0,
             "Default timeout must be positive", Flags::default_timeout_millis);
  KJ_REQUIRE(Flags::max_output_bytes > 0, "Output limit must be positive",
             Flags::max_output_bytes);
  KJ_REQUIRE(Flags::cpu_time_limit_sec >= 0, "Negative CPU time limit",
             Flags::cpu_time_limit_sec);
  KJ_REQUIRE(Flags::memory_limit_mb >= 0, "Negative memory limit",
             Flags::memory_limit_mb);
  config.max_timeout_millis = Flags::max_timeout_millis;
  config.default_timeout_millis = Flags::default_timeout_millis;
  config.max_output_bytes = Flags::max_output_bytes;
  config.cpu_time_limit_sec = Flags::cpu_time_limit_sec;
  config.memory_limit_mb = Flags::memory_limit_mb;

  KJ_LOG(INFO, "Configuration loaded", config.runtime_path.c_str(),
         config.module_path.c_str(), config.isolated, config.max_timeout_millis,
         config.max_output_bytes);
  return config;
}

}  // namespace config
