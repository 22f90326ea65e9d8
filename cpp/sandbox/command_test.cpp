#include "sandbox/command.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Not;

config::Config TestConfig() {
  config::Config config;
  config.runtime_path = "/usr/bin/wasmtime";
  config.module_path = "/opt/python.wasm";
  return config;
}

// NOLINTNEXTLINE
TEST(CommandTest, Default) {
  EXPECT_THAT(
      sandbox::BuildCommand(TestConfig(), "print('hi')"),
      ElementsAre("/usr/bin/wasmtime", "run", "--env", "PYTHONUNBUFFERED=1",
                  "--env", "PYTHONDONTWRITEBYTECODE=1", "/opt/python.wasm",
                  "-I", "-c", "print('hi')"));
}

// NOLINTNEXTLINE
TEST(CommandTest, NotIsolated) {
  config::Config config = TestConfig();
  config.isolated = false;
  EXPECT_THAT(sandbox::BuildCommand(config, ""),
              ElementsAre("/usr/bin/wasmtime", "run", "--env",
                          "PYTHONUNBUFFERED=1", "--env",
                          "PYTHONDONTWRITEBYTECODE=1", "/opt/python.wasm",
                          "-c", ""));
}

// NOLINTNEXTLINE
TEST(CommandTest, RuntimeArgsBeforeModule) {
  config::Config config = TestConfig();
  config.runtime_args = {"-W", "max-memory-size=1048576"};
  EXPECT_THAT(sandbox::BuildCommand(config, "pass"),
              ElementsAre("/usr/bin/wasmtime", "run", "-W",
                          "max-memory-size=1048576", "--env",
                          "PYTHONUNBUFFERED=1", "--env",
                          "PYTHONDONTWRITEBYTECODE=1", "/opt/python.wasm",
                          "-I", "-c", "pass"));
}

// NOLINTNEXTLINE
TEST(CommandTest, EnvNotDuplicated) {
  config::Config config = TestConfig();
  config.runtime_args = {"--env", "PYTHONUNBUFFERED=0",
                         "--env=PYTHONDONTWRITEBYTECODE="};
  EXPECT_THAT(sandbox::BuildCommand(config, "pass"),
              ElementsAre("/usr/bin/wasmtime", "run", "--env",
                          "PYTHONUNBUFFERED=0",
                          "--env=PYTHONDONTWRITEBYTECODE=",
                          "/opt/python.wasm", "-I", "-c", "pass"));
}

// NOLINTNEXTLINE
TEST(CommandTest, NoPreopenedDirectory) {
  std::vector<std::string> cmd =
      sandbox::BuildCommand(TestConfig(), "import os; os.listdir('/')");
  EXPECT_THAT(cmd, Not(Contains("--dir")));
  EXPECT_THAT(cmd, Not(Contains("--mapdir")));
}

// NOLINTNEXTLINE
TEST(CommandTest, EnvNames) {
  EXPECT_THAT(sandbox::EnvNames({}), IsEmpty());
  EXPECT_THAT(sandbox::EnvNames({"--env", "A=1", "-W", "fuel=1", "--env=B",
                                 "--env"}),
              ElementsAre("A", "B"));
}

}  // namespace
