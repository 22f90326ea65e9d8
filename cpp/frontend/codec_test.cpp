#include "frontend/codec.hpp"
#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/encoding.h>
#include "sandbox/output_buffer.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

config::Config TestConfig() {
  config::Config config;
  config.max_timeout_millis = 5000;
  config.default_timeout_millis = 2000;
  return config;
}

// NOLINTNEXTLINE
TEST(CodecTest, ClampTimeout) {
  config::Config config = TestConfig();
  EXPECT_EQ(frontend::ClampTimeout(0, config), 2000);
  EXPECT_EQ(frontend::ClampTimeout(300, config), 300);
  EXPECT_EQ(frontend::ClampTimeout(5000, config), 5000);
  EXPECT_EQ(frontend::ClampTimeout(100000, config), 5000);
  EXPECT_EQ(frontend::ClampTimeout(-7, config), 1);
}

// NOLINTNEXTLINE
TEST(CodecTest, DefaultAboveMaximum) {
  config::Config config = TestConfig();
  config.max_timeout_millis = 1000;
  EXPECT_EQ(frontend::ClampTimeout(0, config), 1000);
}

// NOLINTNEXTLINE
TEST(CodecTest, FromCapnp) {
  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::ExecutionRequest>();
  builder.setCode("print(input())");
  builder.setStdin("42\n");
  builder.setTimeoutMs(300);
  sandbox::ExecutionRequest request =
      frontend::FromCapnp(builder.asReader(), TestConfig());
  EXPECT_EQ(request.code, "print(input())");
  EXPECT_TRUE(request.has_stdin);
  EXPECT_EQ(request.stdin_data, "42\n");
  EXPECT_EQ(request.timeout_millis, 300);
}

// NOLINTNEXTLINE
TEST(CodecTest, FromCapnpWithoutStdin) {
  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::ExecutionRequest>();
  builder.setCode("");
  sandbox::ExecutionRequest request =
      frontend::FromCapnp(builder.asReader(), TestConfig());
  EXPECT_EQ(request.code, "");
  EXPECT_FALSE(request.has_stdin);
  EXPECT_EQ(request.timeout_millis, 2000);
}

// NOLINTNEXTLINE
TEST(CodecTest, FromJson) {
  capnp::JsonCodec codec;
  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::ExecutionRequest>();
  codec.decode(
      kj::StringPtr(R"({"code": "print(1)", "stdin": "", "timeoutMs": 100000})"),
      builder);
  sandbox::ExecutionRequest request =
      frontend::FromCapnp(builder.asReader(), TestConfig());
  EXPECT_EQ(request.code, "print(1)");
  EXPECT_TRUE(request.has_stdin);
  EXPECT_EQ(request.stdin_data, "");
  EXPECT_EQ(request.timeout_millis, 5000);
}

// NOLINTNEXTLINE
TEST(CodecTest, ToCapnp) {
  sandbox::ExecutionResult result;
  result.stdout_data = "7\n";
  result.stderr_data = "warning\n";
  result.stderr_truncated = true;
  result.has_exit_code = true;
  result.exit_code = -11;
  result.duration_millis = 42;
  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::ExecutionResult>();
  frontend::ToCapnp(result, builder);
  auto reader = builder.asReader();
  EXPECT_EQ(reader.getStdout(), "7\n");
  EXPECT_EQ(reader.getStderr(), "warning\n");
  EXPECT_FALSE(reader.getStdoutTruncated());
  EXPECT_TRUE(reader.getStderrTruncated());
  ASSERT_EQ(reader.which(), capnproto::ExecutionResult::EXIT_CODE);
  EXPECT_EQ(reader.getExitCode(), -11);
  EXPECT_FALSE(reader.getTimedOut());
  EXPECT_EQ(reader.getDurationMs(), 42);
}

// NOLINTNEXTLINE
TEST(CodecTest, ToCapnpTimedOut) {
  sandbox::ExecutionResult result;
  result.timed_out = true;
  result.duration_millis = 2001;
  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::ExecutionResult>();
  frontend::ToCapnp(result, builder);
  EXPECT_EQ(builder.which(), capnproto::ExecutionResult::NO_EXIT_CODE);
  EXPECT_TRUE(builder.getTimedOut());

  capnp::JsonCodec codec;
  std::string json = codec.encode(builder.asReader()).cStr();
  EXPECT_THAT(json, HasSubstr("\"timedOut\":true"));
  EXPECT_THAT(json, HasSubstr("\"noExitCode\""));
  EXPECT_THAT(json, HasSubstr("\"durationMs\":2001"));
}

// NOLINTNEXTLINE
TEST(CodecTest, ToJsonTruncatedText) {
  sandbox::OutputBuffer stdout_buffer(1001);
  for (int i = 0; i < 1000; i++) stdout_buffer.Append("\xc3\xa9", 2);
  sandbox::OutputBuffer stderr_buffer(100);
  stderr_buffer.Append("bad \xff\xfe\n", 7);
  sandbox::ExecutionResult result;
  result.stdout_truncated = stdout_buffer.Truncated();
  result.stdout_data = stdout_buffer.ReleaseText();
  result.stderr_data = stderr_buffer.ReleaseText();
  result.has_exit_code = true;

  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::ExecutionResult>();
  frontend::ToCapnp(result, builder);
  capnp::JsonCodec codec;
  kj::String json = codec.encode(builder.asReader());
  EXPECT_FALSE(kj::encodeUtf16(json.asArray()).hadErrors);

  capnp::MallocMessageBuilder decoded;
  auto decoded_builder = decoded.initRoot<capnproto::ExecutionResult>();
  codec.decode(json.asArray(), decoded_builder);
  auto reader = decoded_builder.asReader();
  EXPECT_EQ(reader.getStdout().size(), 1000u);
  EXPECT_TRUE(reader.getStdoutTruncated());
  EXPECT_EQ(std::string(reader.getStderr().cStr()),
            "bad \xef\xbf\xbd\xef\xbf\xbd\n");
}

}  // namespace
