#include "util/flags.hpp"

#include <cstdlib>

#include <kj/debug.h>
#include "util/misc.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

std::string Flags::runtime = "wasmtime";
std::string Flags::module_path;
std::string Flags::runtime_args;
bool Flags::isolated = true;
std::string Flags::temp_directory = "/tmp";

int64_t Flags::max_timeout_millis = 5000;
int64_t Flags::default_timeout_millis = 2000;
int64_t Flags::max_output_bytes = 1000000;
int64_t Flags::cpu_time_limit_sec = 2;
int64_t Flags::memory_limit_mb = 256;

namespace {
void ReadString(const char* name, std::string* var) {
  const char* value = std::getenv(name);
  if (value != nullptr && value[0] != '\0') *var = value;
}

void ReadInt(const char* name, int64_t* var) {
  const char* value = std::getenv(name);
  if (value == nullptr) return;
  if (!util::parseInt(value, var)) {
    KJ_LOG(WARNING, "Ignoring malformed integer", name, value);
  }
}
}  // namespace

void Flags::LoadFromEnvironment() {
  ReadString("TMPDIR", &temp_directory);
  ReadString("PYTHON_WASM_RUNTIME", &runtime);
  ReadString("PYTHON_WASM_PATH", &module_path);
  ReadString("PYTHON_WASM_RUNTIME_ARGS", &runtime_args);

  const char* force_isolated = std::getenv("PYTHON_WASM_FORCE_ISOLATED");
  const char* disable_isolated = std::getenv("PYTHON_WASM_DISABLE_ISOLATED");
  if (force_isolated != nullptr) {
    isolated = std::string(force_isolated) == "1";
  } else if (disable_isolated != nullptr) {
    isolated = std::string(disable_isolated) != "1";
  }

  ReadInt("MAX_EXEC_TIMEOUT_MS", &max_timeout_millis);
  ReadInt("MAX_OUTPUT_BYTES", &max_output_bytes);
  ReadInt("CPU_TIME_LIMIT_SEC", &cpu_time_limit_sec);
  ReadInt("MEMORY_LIMIT_MB", &memory_limit_mb);
}
