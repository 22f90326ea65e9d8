#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

// Raw option values, as read from the environment and the command line. They
// are only read by config::Load, which turns them into an immutable
// config::Config.
struct Flags {
  // Logging
  static std::string log_file;
  static bool verbose;

  // Isolated runtime
  static std::string runtime;
  static std::string module_path;
  static std::string runtime_args;
  static bool isolated;
  static std::string temp_directory;

  // Limits
  static int64_t max_timeout_millis;
  static int64_t default_timeout_millis;
  static int64_t max_output_bytes;
  static int64_t cpu_time_limit_sec;
  static int64_t memory_limit_mb;

  // Seeds the values above from the environment variables of the process.
  // Malformed integers keep their default.
  static void LoadFromEnvironment();
};

#endif
