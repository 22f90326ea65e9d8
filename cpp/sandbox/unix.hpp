#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/types.h>
#include <chrono>
#include <string>
#include <vector>

#include <kj/io.h>
#include "sandbox/output_buffer.hpp"
#include "sandbox/resource_limits.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs the isolated runtime as a child process of the current one.
class Unix : public Sandbox {
 public:
  explicit Unix(const config::Config& config) : Sandbox(config) {}

  // Grace period for draining the output pipes after the child exited, in
  // case a descendant still holds them open.
  static const constexpr int64_t kDrainGraceMillis = 250;
  // Poll interval used to watch the child when pidfd_open is unavailable.
  static const constexpr int64_t kPollTickMillis = 10;

 protected:
  bool ExecuteInternal(const ExecutionRequest& request, ExecutionResult* result,
                       std::string* error_msg) override;

 private:
  class Execution;
};

// State of a single call to Execute. Owns the child process: if it is
// destroyed before the child was reaped, the child is killed and reaped.
class Unix::Execution {
 public:
  Execution(const config::Config& config, const ExecutionRequest& request,
            const std::string& cwd);
  ~Execution();
  KJ_DISALLOW_COPY(Execution);

  bool Run(ExecutionResult* result, std::string* error_msg);

 private:
  using clock = std::chrono::steady_clock;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates the child process and saves its PID in child_pid_.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process. It must not allocate
  // memory.
  [[noreturn]] void Child();

  // Reads the reports of the child until it calls exec. Returns false and
  // sets error_msg if the child could not start the runtime.
  bool CheckChild(std::string* error_msg);

  // Feeds stdin and collects the output until the child exits or the deadline
  // passes. Then kills what is left of the process group and reaps the child.
  void Wait(ExecutionResult* result);

  void ReadOutput(kj::AutoCloseFd* fd, OutputBuffer* buffer);
  // One non-blocking read of each stream that is still open.
  void ReadRemainingOutput();
  void WriteInput();
  void Kill();
  void Reap();

  const config::Config& config_;
  const ExecutionRequest& request_;

  // Prepared before fork, read by the child.
  std::vector<std::string> command_;
  std::vector<char*> argv_;
  std::vector<ResourceLimit> limits_;
  std::string cwd_;

  kj::AutoCloseFd stdin_fds_[2];
  kj::AutoCloseFd stdout_fds_[2];
  kj::AutoCloseFd stderr_fds_[2];
  kj::AutoCloseFd error_fds_[2];
  kj::AutoCloseFd pidfd_;

  pid_t child_pid_ = 0;
  // The child terminated, but stays a zombie until Reap, so that its process
  // group cannot be reused before the group is killed.
  bool exited_ = false;
  bool reaped_ = false;
  int child_status_ = 0;
  size_t stdin_offset_ = 0;
  clock::time_point start_;

  OutputBuffer stdout_;
  OutputBuffer stderr_;
};

}  // namespace sandbox

#endif
