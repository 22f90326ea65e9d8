#include "sandbox/resource_limits.hpp"

#include <sys/resource.h>
#include <cerrno>

namespace sandbox {

namespace {
// glibc declares the resources as an enum in C++.
using resource_t = decltype(RLIMIT_CPU);

// Returns false for limits the platform does not define.
bool Resource(LimitKind kind, resource_t* resource) {
  switch (kind) {
    case LimitKind::CPU_SECONDS:
      *resource = RLIMIT_CPU;
      return true;
    case LimitKind::ADDRESS_SPACE_BYTES:
#ifdef RLIMIT_AS
      *resource = RLIMIT_AS;
      return true;
#else
      return false;
#endif
    case LimitKind::FILE_SIZE_BYTES:
      *resource = RLIMIT_FSIZE;
      return true;
    case LimitKind::OPEN_FILES:
      *resource = RLIMIT_NOFILE;
      return true;
    case LimitKind::PROCESSES:
#ifdef RLIMIT_NPROC
      *resource = RLIMIT_NPROC;
      return true;
#else
      return false;
#endif
    case LimitKind::CORE_BYTES:
      *resource = RLIMIT_CORE;
      return true;
  }
  return false;
}
}  // namespace

std::vector<ResourceLimit> BuildLimits(const config::Config& config) {
  std::vector<ResourceLimit> limits;
  if (config.cpu_time_limit_sec > 0) {
    limits.push_back({LimitKind::CPU_SECONDS,
                      static_cast<uint64_t>(config.cpu_time_limit_sec)});
  }
  if (config.memory_limit_mb > 0) {
    limits.push_back(
        {LimitKind::ADDRESS_SPACE_BYTES,
         static_cast<uint64_t>(config.memory_limit_mb) * 1024 * 1024});
  }
  limits.push_back({LimitKind::FILE_SIZE_BYTES, kFileSizeLimitBytes});
  limits.push_back({LimitKind::OPEN_FILES, kOpenFilesLimit});
  limits.push_back({LimitKind::PROCESSES, kProcessesLimit});
  limits.push_back({LimitKind::CORE_BYTES, 0});
  return limits;
}

int ApplyLimit(const ResourceLimit& limit) {
  resource_t resource;
  if (!Resource(limit.kind, &resource)) return ENOSYS;
  struct rlimit rlim {};
  rlim.rlim_cur = limit.value;
  rlim.rlim_max = limit.value;
  if (setrlimit(resource, &rlim) < 0) {
    return errno;
  }
  return 0;
}

const char* LimitName(LimitKind kind) {
  switch (kind) {
    case LimitKind::CPU_SECONDS:
      return "RLIMIT_CPU";
    case LimitKind::ADDRESS_SPACE_BYTES:
      return "RLIMIT_AS";
    case LimitKind::FILE_SIZE_BYTES:
      return "RLIMIT_FSIZE";
    case LimitKind::OPEN_FILES:
      return "RLIMIT_NOFILE";
    case LimitKind::PROCESSES:
      return "RLIMIT_NPROC";
    case LimitKind::CORE_BYTES:
      return "RLIMIT_CORE";
  }
  return "unknown";
}

}  // namespace sandbox
