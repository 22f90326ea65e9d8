#include <cstdlib>
#include <memory>
#include <string>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "config/config.hpp"
#include "sandbox/sandbox.hpp"
#include "util/flags.hpp"

// Runs real Python code. Needs PYTHON_WASM_PATH (and a wasmtime binary) in
// the environment, and is skipped otherwise.

namespace {

using ::testing::HasSubstr;

using namespace sandbox;  // NOLINT

class WasmTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* module = std::getenv("PYTHON_WASM_PATH");
    if (module == nullptr || module[0] == '\0') {
      GTEST_SKIP() << "PYTHON_WASM_PATH is not set";
    }
    Flags::LoadFromEnvironment();
    sandbox_ = Sandbox::Create(config::Load());
  }

  ExecutionResult Run(const std::string& code, int64_t timeout_millis = 5000,
                      const char* stdin_data = nullptr) {
    ExecutionRequest request;
    request.code = code;
    request.timeout_millis = timeout_millis;
    if (stdin_data != nullptr) {
      request.has_stdin = true;
      request.stdin_data = stdin_data;
    }
    ExecutionResult result;
    std::string error_msg;
    EXPECT_TRUE(sandbox_->Execute(request, &result, &error_msg)) << error_msg;
    return result;
  }

  std::unique_ptr<Sandbox> sandbox_;
};

// NOLINTNEXTLINE
TEST_F(WasmTest, HelloWorld) {
  ExecutionResult result = Run("print('hello')");
  EXPECT_EQ(result.stdout_data, "hello\n");
  EXPECT_EQ(result.stderr_data, "");
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_FALSE(result.timed_out);
}

// NOLINTNEXTLINE
TEST_F(WasmTest, UncaughtException) {
  ExecutionResult result = Run("1/0");
  EXPECT_TRUE(result.has_exit_code);
  EXPECT_NE(result.exit_code, 0);
  EXPECT_THAT(result.stderr_data, HasSubstr("ZeroDivisionError"));
}

// NOLINTNEXTLINE
TEST_F(WasmTest, Stdin) {
  ExecutionResult result =
      Run("a, b = map(int, input().split()); print(a + b)", 5000, "3 4\n");
  EXPECT_EQ(result.stdout_data, "7\n");
}

// NOLINTNEXTLINE
TEST_F(WasmTest, InfiniteLoop) {
  ExecutionResult result = Run("while True: pass", 1000);
  EXPECT_TRUE(result.timed_out);
  EXPECT_FALSE(result.has_exit_code);
}

// NOLINTNEXTLINE
TEST_F(WasmTest, NoHostFilesystem) {
  ExecutionResult result = Run("print(open('/etc/passwd').read())");
  EXPECT_NE(result.exit_code, 0);
  EXPECT_THAT(result.stdout_data, ::testing::Not(HasSubstr("root:")));
}

}  // namespace
