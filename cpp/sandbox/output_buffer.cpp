#include "sandbox/output_buffer.hpp"

#include <algorithm>

#include "util/misc.hpp"

namespace sandbox {

void OutputBuffer::Append(const char* data, size_t len) {
  size_t keep = std::min(len, capacity_ - data_.size());
  data_.append(data, keep);
  discarded_ += len - keep;
}

std::string OutputBuffer::ReleaseText() {
  if (Truncated()) data_.resize(util::utf8CompletePrefix(data_));
  return util::toValidUtf8(Release());
}

}  // namespace sandbox
