#include "frontend/codec.hpp"

#include <algorithm>
#include <limits>

namespace frontend {

int64_t ClampTimeout(int64_t requested_millis, const config::Config& config) {
  int64_t timeout =
      requested_millis == 0 ? config.default_timeout_millis : requested_millis;
  return std::max<int64_t>(1, std::min(timeout, config.max_timeout_millis));
}

sandbox::ExecutionRequest FromCapnp(capnproto::ExecutionRequest::Reader reader,
                                    const config::Config& config) {
  sandbox::ExecutionRequest request;
  capnp::Text::Reader code = reader.getCode();
  request.code.assign(code.cStr(), code.size());
  request.has_stdin = reader.hasStdin();
  if (request.has_stdin) {
    capnp::Text::Reader data = reader.getStdin();
    request.stdin_data.assign(data.cStr(), data.size());
  }
  request.timeout_millis = ClampTimeout(reader.getTimeoutMs(), config);
  return request;
}

void ToCapnp(const sandbox::ExecutionResult& result,
             capnproto::ExecutionResult::Builder builder) {
  builder.setStdout(
      capnp::Text::Reader(result.stdout_data.data(), result.stdout_data.size()));
  builder.setStderr(
      capnp::Text::Reader(result.stderr_data.data(), result.stderr_data.size()));
  builder.setStdoutTruncated(result.stdout_truncated);
  builder.setStderrTruncated(result.stderr_truncated);
  if (result.has_exit_code) {
    builder.setExitCode(result.exit_code);
  } else {
    builder.setNoExitCode();
  }
  builder.setTimedOut(result.timed_out);
  builder.setDurationMs(static_cast<int32_t>(std::min<int64_t>(
      result.duration_millis, std::numeric_limits<int32_t>::max())));
}

}  // namespace frontend
