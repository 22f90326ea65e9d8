#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "config/config.hpp"

namespace sandbox {

// What to execute.
struct ExecutionRequest {
  std::string code;
  // When false, the child's stdin is closed right away.
  bool has_stdin = false;
  std::string stdin_data;
  // Wall-clock timeout, already clamped by the caller.
  int64_t timeout_millis = 0;
};

// Results of the execution.
struct ExecutionResult {
  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  // Unset when the child was killed for exceeding its timeout.
  bool has_exit_code = false;
  // Exit status, or minus the number of the signal that killed the child.
  int32_t exit_code = 0;
  bool timed_out = false;
  int64_t duration_millis = 0;
};

// Sandbox interface. Instances only hold the immutable configuration, so
// Execute can be called from several threads at the same time.
class Sandbox {
 public:
  static std::unique_ptr<Sandbox> Create(const config::Config& config);

  // Runs the code in the isolated runtime. Returns true if the program was
  // started, and sets fields in result. Otherwise, returns false and sets
  // error_msg.
  bool Execute(const ExecutionRequest& request, ExecutionResult* result,
               std::string* error_msg) {
    *result = ExecutionResult();
    return ExecuteInternal(request, result, error_msg);
  }

  // Constructor and destructors
  virtual ~Sandbox() = default;
  explicit Sandbox(const config::Config& config) : config_(config) {}
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

 protected:
  virtual bool ExecuteInternal(const ExecutionRequest& request,
                               ExecutionResult* result,
                               std::string* error_msg) = 0;

  const config::Config config_;
};

}  // namespace sandbox

#endif
