#ifndef CONFIG_CONFIG_HPP
#define CONFIG_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace config {

// Settings of the isolated runtime and of the execution limits. Built once at
// startup by Load() and never modified afterwards.
struct Config {
  // Absolute path of the runtime CLI (e.g. wasmtime).
  std::string runtime_path;
  // Absolute path of the interpreter module (python.wasm).
  std::string module_path;
  // Extra runtime options, inserted before the module.
  std::vector<std::string> runtime_args;
  // Whether to pass -I to the interpreter.
  bool isolated = true;
  // Where per-execution working directories are created.
  std::string temp_directory = "/tmp";

  int64_t max_timeout_millis = 5000;
  int64_t default_timeout_millis = 2000;
  size_t max_output_bytes = 1000000;
  int64_t cpu_time_limit_sec = 2;
  int64_t memory_limit_mb = 256;
};

// Builds a Config from Flags, resolving the runtime and checking the module.
// Throws a kj::Exception describing the problem if the configuration is not
// usable.
Config Load();

// Looks up the runtime executable: the given name or path first, then
// wasmtime in $PATH and in the usual installation directories. Returns an
// empty string if nothing is found.
std::string ResolveRuntime(const std::string& runtime);

// Throws a kj::Exception unless path names a WebAssembly binary.
void CheckModule(const std::string& path);

// Throws a kj::Exception if args would preopen a host directory.
void CheckRuntimeArgs(const std::vector<std::string>& args);

}  // namespace config

#endif
