#ifndef SANDBOX_OUTPUT_BUFFER_HPP
#define SANDBOX_OUTPUT_BUFFER_HPP

#include <cstddef>
#include <string>
#include <utility>

namespace sandbox {

// Accumulates the bytes of one output stream up to a fixed capacity. Bytes
// beyond the capacity are counted and dropped, so that the producer can be
// drained until it closes the stream.
class OutputBuffer {
 public:
  explicit OutputBuffer(size_t capacity) : capacity_(capacity) {}

  void Append(const char* data, size_t len);

  const std::string& Data() const { return data_; }
  std::string Release() { return std::move(data_); }
  // Same as Release, but returns valid UTF-8: a code point cut by the
  // capacity is dropped, and malformed sequences become U+FFFD.
  std::string ReleaseText();

  // True if more than capacity bytes were appended.
  bool Truncated() const { return discarded_ > 0; }
  size_t Discarded() const { return discarded_; }

 private:
  size_t capacity_;
  size_t discarded_ = 0;
  std::string data_;
};

}  // namespace sandbox

#endif
