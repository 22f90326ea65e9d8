#include "sandbox/resource_limits.hpp"
#include <sys/resource.h>
#include <unistd.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ExitedWithCode;
using ::testing::StrEq;

using namespace sandbox;  // NOLINT

std::vector<LimitKind> Kinds(const std::vector<ResourceLimit>& limits) {
  std::vector<LimitKind> kinds;
  for (const ResourceLimit& limit : limits) kinds.push_back(limit.kind);
  return kinds;
}

// NOLINTNEXTLINE
TEST(ResourceLimitsTest, BuildLimits) {
  config::Config config;
  config.cpu_time_limit_sec = 3;
  config.memory_limit_mb = 128;
  std::vector<ResourceLimit> limits = BuildLimits(config);
  ASSERT_EQ(limits.size(), 6u);
  EXPECT_EQ(limits[0].kind, LimitKind::CPU_SECONDS);
  EXPECT_EQ(limits[0].value, 3u);
  EXPECT_EQ(limits[1].kind, LimitKind::ADDRESS_SPACE_BYTES);
  EXPECT_EQ(limits[1].value, 128u * 1024 * 1024);
  EXPECT_EQ(limits[2].kind, LimitKind::FILE_SIZE_BYTES);
  EXPECT_EQ(limits[2].value, kFileSizeLimitBytes);
  EXPECT_EQ(limits[3].kind, LimitKind::OPEN_FILES);
  EXPECT_EQ(limits[4].kind, LimitKind::PROCESSES);
  EXPECT_EQ(limits[5].kind, LimitKind::CORE_BYTES);
  EXPECT_EQ(limits[5].value, 0u);
}

// NOLINTNEXTLINE
TEST(ResourceLimitsTest, UnconfiguredLimitsAreLeftOut) {
  config::Config config;
  config.cpu_time_limit_sec = 0;
  config.memory_limit_mb = 0;
  EXPECT_THAT(Kinds(BuildLimits(config)),
              ::testing::ElementsAre(
                  LimitKind::FILE_SIZE_BYTES, LimitKind::OPEN_FILES,
                  LimitKind::PROCESSES, LimitKind::CORE_BYTES));
}

// NOLINTNEXTLINE
TEST(ResourceLimitsTest, LimitName) {
  EXPECT_THAT(LimitName(LimitKind::CPU_SECONDS), StrEq("RLIMIT_CPU"));
  EXPECT_THAT(LimitName(LimitKind::ADDRESS_SPACE_BYTES), StrEq("RLIMIT_AS"));
  EXPECT_THAT(LimitName(LimitKind::CORE_BYTES), StrEq("RLIMIT_CORE"));
}

// The limits are applied in a child, so that the test process keeps its own.
// NOLINTNEXTLINE
TEST(ResourceLimitsTest, ApplyLimit) {
  EXPECT_EXIT(
      {
        if (ApplyLimit({LimitKind::OPEN_FILES, 32}) != 0) _exit(1);
        struct rlimit rlim {};
        if (getrlimit(RLIMIT_NOFILE, &rlim) != 0) _exit(2);
        _exit(rlim.rlim_cur == 32 && rlim.rlim_max == 32 ? 0 : 3);
      },
      ExitedWithCode(0), "");
}

// NOLINTNEXTLINE
TEST(ResourceLimitsTest, ApplyCoreLimit) {
  EXPECT_EXIT(
      {
        if (ApplyLimit({LimitKind::CORE_BYTES, 0}) != 0) _exit(1);
        struct rlimit rlim {};
        if (getrlimit(RLIMIT_CORE, &rlim) != 0) _exit(2);
        _exit(rlim.rlim_cur == 0 ? 0 : 3);
      },
      ExitedWithCode(0), "");
}

}  // namespace
