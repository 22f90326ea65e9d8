#ifndef SANDBOX_RESOURCE_LIMITS_HPP
#define SANDBOX_RESOURCE_LIMITS_HPP

#include <cstdint>
#include <vector>
#include "config/config.hpp"

namespace sandbox {

enum class LimitKind : int32_t {
  CPU_SECONDS,
  ADDRESS_SPACE_BYTES,
  FILE_SIZE_BYTES,
  OPEN_FILES,
  PROCESSES,
  CORE_BYTES,
};

struct ResourceLimit {
  LimitKind kind;
  uint64_t value;
};

static const constexpr uint64_t kFileSizeLimitBytes = 16 * 1024 * 1024;
static const constexpr uint64_t kOpenFilesLimit = 64;
static const constexpr uint64_t kProcessesLimit = 64;

// Limits to apply to every child. CPU time and address space are left out
// when the configuration sets them to 0.
std::vector<ResourceLimit> BuildLimits(const config::Config& config);

// Sets both the soft and the hard limit. Returns 0 on success, ENOSYS if the
// platform has no such limit, or the errno of setrlimit. Async-signal-safe,
// so it can be called between fork and exec.
int ApplyLimit(const ResourceLimit& limit);

// Human readable name of the limit, e.g. "RLIMIT_CPU".
const char* LimitName(LimitKind kind);

}  // namespace sandbox

#endif
