#include "sandbox/output_buffer.hpp"
#include "gtest/gtest.h"

namespace {

using sandbox::OutputBuffer;

// NOLINTNEXTLINE
TEST(OutputBufferTest, UnderCapacity) {
  OutputBuffer buffer(10);
  buffer.Append("abc", 3);
  buffer.Append("de", 2);
  EXPECT_EQ(buffer.Data(), "abcde");
  EXPECT_FALSE(buffer.Truncated());
}

// NOLINTNEXTLINE
TEST(OutputBufferTest, ExactlyCapacity) {
  OutputBuffer buffer(5);
  buffer.Append("abc", 3);
  buffer.Append("de", 2);
  EXPECT_EQ(buffer.Data(), "abcde");
  EXPECT_FALSE(buffer.Truncated());
}

// NOLINTNEXTLINE
TEST(OutputBufferTest, OverCapacity) {
  OutputBuffer buffer(4);
  buffer.Append("abc", 3);
  buffer.Append("defg", 4);
  buffer.Append("hi", 2);
  EXPECT_EQ(buffer.Data(), "abcd");
  EXPECT_TRUE(buffer.Truncated());
  EXPECT_EQ(buffer.Discarded(), 5u);
}

// NOLINTNEXTLINE
TEST(OutputBufferTest, BinaryData) {
  OutputBuffer buffer(8);
  buffer.Append("a\0b\xff", 4);
  EXPECT_EQ(buffer.Data(), std::string("a\0b\xff", 4));
  EXPECT_EQ(buffer.Release(), std::string("a\0b\xff", 4));
}

// NOLINTNEXTLINE
TEST(OutputBufferTest, TextCutInsideCodePoint) {
  OutputBuffer buffer(1001);
  for (int i = 0; i < 1000; i++) buffer.Append("\xc3\xa9", 2);
  EXPECT_TRUE(buffer.Truncated());
  std::string text = buffer.ReleaseText();
  EXPECT_EQ(text.size(), 1000u);
  EXPECT_EQ(text.substr(text.size() - 2), "\xc3\xa9");
}

// NOLINTNEXTLINE
TEST(OutputBufferTest, TextMalformed) {
  OutputBuffer buffer(100);
  buffer.Append("ok\xff\xc3", 4);
  EXPECT_FALSE(buffer.Truncated());
  EXPECT_EQ(buffer.ReleaseText(), "ok\xef\xbf\xbd\xef\xbf\xbd");
}

}  // namespace
