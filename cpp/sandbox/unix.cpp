#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <kj/debug.h>
#include "sandbox/command.hpp"
#include "util/file.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr size_t kReadBufSize = 64 * 1024;
// Bounds the time spent on a single wake-up, so that a child flooding its
// output cannot delay the deadline check.
static const constexpr int kMaxReadsPerWakeup = 16;

std::string ErrorString(const char* prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  return std::string(prefix) + ": " + mystrerror(err, buf, kStrErrorBufSize);
}

// What the child was doing when it failed.
enum class Stage : int32_t {
  SETSID,
  SIGNALS,
  REDIRECT_STDIN,
  REDIRECT_STDOUT,
  REDIRECT_STDERR,
  CHDIR,
  EXEC,
};

const char* StageName(Stage stage) {
  switch (stage) {
    case Stage::SETSID:
      return "setsid";
    case Stage::SIGNALS:
      return "sigprocmask";
    case Stage::REDIRECT_STDIN:
      return "redir stdin";
    case Stage::REDIRECT_STDOUT:
      return "redir stdout";
    case Stage::REDIRECT_STDERR:
      return "redir stderr";
    case Stage::CHDIR:
      return "chdir";
    case Stage::EXEC:
      return "exec";
  }
  return "child";
}

// Written by the child on the error pipe. Smaller than PIPE_BUF, so each
// report is written atomically.
struct ChildReport {
  // 0 for a resource limit that could not be applied, 1 if the child gave up.
  int32_t fatal;
  // A Stage if fatal, a LimitKind otherwise.
  int32_t what;
  int32_t error;
};

bool MakePipe(kj::AutoCloseFd* fds, std::string* error_msg) {
  int raw[2] = {-1, -1};
#ifdef __APPLE__
  if (pipe(raw) == -1) {  // NOLINT
    *error_msg = ErrorString("pipe", errno);
    return false;
  }
  fds[0] = kj::AutoCloseFd(raw[0]);
  fds[1] = kj::AutoCloseFd(raw[1]);
  if (fcntl(raw[0], F_SETFD, FD_CLOEXEC) == -1 ||  // NOLINT
      fcntl(raw[1], F_SETFD, FD_CLOEXEC) == -1) {  // NOLINT
    *error_msg = ErrorString("fcntl", errno);
    return false;
  }
#else
  if (pipe2(raw, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = ErrorString("pipe2", errno);
    return false;
  }
  fds[0] = kj::AutoCloseFd(raw[0]);
  fds[1] = kj::AutoCloseFd(raw[1]);
#endif
  return true;
}

bool SetNonBlocking(int fd, std::string* error_msg) {
  int flags = fcntl(fd, F_GETFL);  // NOLINT
  if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {  // NOLINT
    *error_msg = ErrorString("fcntl", errno);
    return false;
  }
  return true;
}

// Returns -1 if the kernel cannot give a file descriptor for the process.
int PidfdOpen(pid_t pid) {
#ifdef SYS_pidfd_open
  return static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
#else
  errno = ENOSYS;
  return -1;
#endif
}

// Blocks SIGPIPE in the calling thread while alive, so that writing to a
// closed stdin pipe fails with EPIPE instead of killing the process.
class SigpipeBlocker {
 public:
  SigpipeBlocker() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGPIPE);
    int err = pthread_sigmask(SIG_BLOCK, &set, &old_);
    if (err != 0) KJ_FAIL_SYSCALL("pthread_sigmask", err);
  }
  ~SigpipeBlocker() {
    int err = pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    if (err != 0) KJ_LOG(ERROR, "Unable to restore the signal mask", err);
  }
  KJ_DISALLOW_COPY(SigpipeBlocker);

 private:
  sigset_t old_;
};

// Consumes the SIGPIPE generated by a failed write, if any.
void ConsumeSigpipe() {
  sigset_t pending;
  if (sigpending(&pending) == -1 || !sigismember(&pending, SIGPIPE)) return;
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGPIPE);
  int sig = 0;
  int err = sigwait(&set, &sig);
  if (err != 0) KJ_LOG(WARNING, "Unable to consume SIGPIPE", err);
}

int64_t MillisBetween(std::chrono::steady_clock::time_point from,
                      std::chrono::steady_clock::time_point to) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from)
      .count();
}
}  // namespace

namespace sandbox {

std::unique_ptr<Sandbox> Sandbox::Create(const config::Config& config) {
  return std::make_unique<Unix>(config);
}

bool Unix::ExecuteInternal(const ExecutionRequest& request,
                           ExecutionResult* result, std::string* error_msg) {
  std::unique_ptr<util::TempDir> cwd;
  try {
    cwd = std::make_unique<util::TempDir>(config_.temp_directory);
  } catch (const std::system_error& e) {
    *error_msg = e.what();
    return false;
  }
  // Destroyed before cwd, so the child is gone when the directory is removed.
  Execution execution(config_, request, cwd->Path());
  return execution.Run(result, error_msg);
}

Unix::Execution::Execution(const config::Config& config,
                           const ExecutionRequest& request,
                           const std::string& cwd)
    : config_(config),
      request_(request),
      command_(BuildCommand(config, request.code)),
      limits_(BuildLimits(config)),
      cwd_(cwd),
      stdout_(config.max_output_bytes),
      stderr_(config.max_output_bytes) {
  for (std::string& arg : command_) argv_.push_back(&arg[0]);
  argv_.push_back(nullptr);
}

Unix::Execution::~Execution() {
  if (child_pid_ > 0 && !reaped_) {
    Kill();
    Reap();
  }
}

bool Unix::Execution::Run(ExecutionResult* result, std::string* error_msg) {
  if (!Setup(error_msg)) return false;
  start_ = clock::now();
  if (!DoFork(error_msg)) return false;
  if (!CheckChild(error_msg)) return false;
  Wait(result);
  return true;
}

bool Unix::Execution::Setup(std::string* error_msg) {
  if (!MakePipe(stdin_fds_, error_msg)) return false;
  if (!MakePipe(stdout_fds_, error_msg)) return false;
  if (!MakePipe(stderr_fds_, error_msg)) return false;
  if (!MakePipe(error_fds_, error_msg)) return false;
  // Only the parent ends: the child gets blocking standard streams.
  return SetNonBlocking(stdin_fds_[1].get(), error_msg) &&
         SetNonBlocking(stdout_fds_[0].get(), error_msg) &&
         SetNonBlocking(stderr_fds_[0].get(), error_msg);
}

bool Unix::Execution::DoFork(std::string* error_msg) {
  pid_t fork_result = fork();
  if (fork_result == -1) {
    *error_msg = ErrorString("fork", errno);
    return false;
  }
  if (fork_result == 0) Child();
  child_pid_ = fork_result;

  stdin_fds_[0] = kj::AutoCloseFd();
  stdout_fds_[1] = kj::AutoCloseFd();
  stderr_fds_[1] = kj::AutoCloseFd();
  error_fds_[1] = kj::AutoCloseFd();

  pidfd_ = kj::AutoCloseFd(PidfdOpen(child_pid_));
  if (pidfd_.get() < 0) {
    KJ_LOG(INFO, "pidfd_open failed, polling for the exit of the child",
           errno);
  }
  if (!request_.has_stdin || request_.stdin_data.empty()) {
    stdin_fds_[1] = kj::AutoCloseFd();
  }
  return true;
}

void Unix::Execution::Child() {
  auto report = [this](bool fatal, int32_t what, int err) {
    ChildReport r{fatal ? 1 : 0, what, err};
    while (write(error_fds_[1].get(), &r, sizeof(r)) == -1 && errno == EINTR) {
    }
  };
  auto die = [&report](Stage stage, int err) {
    report(true, static_cast<int32_t>(stage), err);
    _Exit(1);
  };

  // New session and process group, so that the timeout can kill the whole
  // group and Ctrl-C in the terminal does not reach the child.
  if (setsid() == -1) die(Stage::SETSID, errno);

  // The calling thread may block or ignore signals; the runtime should not
  // inherit that.
  sigset_t empty;
  sigemptyset(&empty);
  if (sigprocmask(SIG_SETMASK, &empty, nullptr) == -1) {
    die(Stage::SIGNALS, errno);
  }
  if (signal(SIGPIPE, SIG_DFL) == SIG_ERR) die(Stage::SIGNALS, errno);

  // Handle I/O redirection.
  auto redirect = [&die](int fd, int target, Stage stage) {
    if (fd == target) {
      if (fcntl(fd, F_SETFD, 0) == -1) die(stage, errno);  // NOLINT
    } else if (dup2(fd, target) == -1) {
      die(stage, errno);
    }
  };
  redirect(stdin_fds_[0].get(), STDIN_FILENO, Stage::REDIRECT_STDIN);
  redirect(stdout_fds_[1].get(), STDOUT_FILENO, Stage::REDIRECT_STDOUT);
  redirect(stderr_fds_[1].get(), STDERR_FILENO, Stage::REDIRECT_STDERR);

  if (chdir(cwd_.c_str()) == -1) die(Stage::CHDIR, errno);

  // Set resource limits. Failures are reported, but do not stop the child.
  for (const ResourceLimit& limit : limits_) {
    int err = ApplyLimit(limit);
    if (err != 0) report(false, static_cast<int32_t>(limit.kind), err);
  }

  execv(argv_[0], argv_.data());
  die(Stage::EXEC, errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Execution::CheckChild(std::string* error_msg) {
  ChildReport report{};
  while (true) {
    ssize_t len = read(error_fds_[0].get(), &report, sizeof(report));
    if (len == -1 && errno == EINTR) continue;
    if (len == -1) KJ_FAIL_SYSCALL("read", errno);
    // The pipe is closed on exec.
    if (len == 0) break;
    KJ_ASSERT(len == static_cast<ssize_t>(sizeof(report)),
              "Truncated report from the child", len);
    if (report.fatal == 0) {
      char buf[kStrErrorBufSize] = {};
      KJ_LOG(WARNING, "Resource limit not applied",
             LimitName(static_cast<LimitKind>(report.what)),
             mystrerror(report.error, buf, kStrErrorBufSize));
      continue;
    }
    Reap();
    *error_msg =
        ErrorString(StageName(static_cast<Stage>(report.what)), report.error);
    return false;
  }
  error_fds_[0] = kj::AutoCloseFd();
  return true;
}

void Unix::Execution::Wait(ExecutionResult* result) {
  SigpipeBlocker sigpipe_blocker;
  const clock::time_point deadline = clock::time_point(
      start_ + std::chrono::milliseconds(request_.timeout_millis));
  clock::time_point drain_deadline = deadline;
  bool timed_out = false;

  while (true) {
    if (!exited_) {
      siginfo_t info = {};
      int ret =
          waitid(P_PID, child_pid_, &info, WEXITED | WNOHANG | WNOWAIT);
      if (ret == -1 && errno != EINTR) KJ_FAIL_SYSCALL("waitid", errno);
      if (ret == 0 && info.si_pid == child_pid_) {
        exited_ = true;
        clock::time_point end = clock::now();
        result->duration_millis = MillisBetween(start_, end);
        drain_deadline = std::min(
            clock::time_point(end +
                              std::chrono::milliseconds(kDrainGraceMillis)),
            deadline);
        pidfd_ = kj::AutoCloseFd();
        stdin_fds_[1] = kj::AutoCloseFd();
      }
    }

    clock::time_point now = clock::now();
    if (!exited_ && now >= deadline) {
      timed_out = true;
      break;
    }
    bool output_open = stdout_fds_[0].get() >= 0 || stderr_fds_[0].get() >= 0;
    if (exited_ && !output_open) break;
    if (exited_ && now >= drain_deadline) {
      KJ_LOG(INFO, "Output still open after the exit of the child");
      break;
    }

    struct pollfd fds[4] = {};
    nfds_t nfds = 0;
    auto watch = [&fds, &nfds](int fd, short events) {  // NOLINT
      if (fd < 0) return -1;
      fds[nfds].fd = fd;
      fds[nfds].events = events;
      return static_cast<int>(nfds++);
    };
    if (!exited_) watch(pidfd_.get(), POLLIN);
    int stdout_idx = watch(stdout_fds_[0].get(), POLLIN);
    int stderr_idx = watch(stderr_fds_[0].get(), POLLIN);
    int stdin_idx = watch(stdin_fds_[1].get(), POLLOUT);

    clock::time_point until = exited_ ? drain_deadline : deadline;
    int64_t wait_millis =
        (std::chrono::duration_cast<std::chrono::microseconds>(until - now)
             .count() +
         999) /
        1000;
    if (!exited_ && pidfd_.get() < 0) {
      wait_millis = std::min(wait_millis, kPollTickMillis);
    }

    int ret = poll(fds, nfds, static_cast<int>(wait_millis));
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) KJ_FAIL_SYSCALL("poll", errno);
    if (stdout_idx != -1 && fds[stdout_idx].revents != 0) {
      ReadOutput(&stdout_fds_[0], &stdout_);
    }
    if (stderr_idx != -1 && fds[stderr_idx].revents != 0) {
      ReadOutput(&stderr_fds_[0], &stderr_);
    }
    if (stdin_idx != -1 && fds[stdin_idx].revents != 0) WriteInput();
  }

  // Nothing started by the child outlives the execution.
  Kill();
  Reap();
  if (timed_out) {
    result->duration_millis = MillisBetween(start_, clock::now());
    KJ_LOG(INFO, "Execution timed out", request_.timeout_millis);
  } else {
    result->has_exit_code = true;
    if (WIFSIGNALED(child_status_)) {
      result->exit_code = -WTERMSIG(child_status_);
    } else {
      result->exit_code = WEXITSTATUS(child_status_);
    }
  }
  // Keep what is still in the pipes: the child may have been killed, or may
  // have exited during the last wait.
  ReadRemainingOutput();

  result->timed_out = timed_out;
  result->stdout_truncated = stdout_.Truncated();
  result->stderr_truncated = stderr_.Truncated();
  result->stdout_data = stdout_.ReleaseText();
  result->stderr_data = stderr_.ReleaseText();
}

void Unix::Execution::ReadOutput(kj::AutoCloseFd* fd, OutputBuffer* buffer) {
  char buf[kReadBufSize];
  for (int i = 0; i < kMaxReadsPerWakeup; i++) {
    ssize_t len = read(fd->get(), buf, kReadBufSize);
    if (len > 0) {
      buffer->Append(buf, len);
      continue;
    }
    if (len == -1 && errno == EINTR) continue;
    if (len == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
    if (len == -1) {
      char err[kStrErrorBufSize] = {};
      KJ_LOG(WARNING, "Unable to read the output of the child",
             mystrerror(errno, err, kStrErrorBufSize));
    }
    *fd = kj::AutoCloseFd();
    return;
  }
}

void Unix::Execution::ReadRemainingOutput() {
  if (stdout_fds_[0].get() >= 0) ReadOutput(&stdout_fds_[0], &stdout_);
  if (stderr_fds_[0].get() >= 0) ReadOutput(&stderr_fds_[0], &stderr_);
}

void Unix::Execution::WriteInput() {
  const std::string& data = request_.stdin_data;
  while (stdin_offset_ < data.size()) {
    ssize_t len = write(stdin_fds_[1].get(), data.data() + stdin_offset_,
                        data.size() - stdin_offset_);
    if (len >= 0) {
      stdin_offset_ += len;
      continue;
    }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return;
    // The child does not want more input.
    if (errno == EPIPE) {
      ConsumeSigpipe();
    } else {
      char err[kStrErrorBufSize] = {};
      KJ_LOG(WARNING, "Unable to write the input of the child",
             mystrerror(errno, err, kStrErrorBufSize));
    }
    break;
  }
  stdin_fds_[1] = kj::AutoCloseFd();
}

void Unix::Execution::Kill() {
  char buf[kStrErrorBufSize] = {};
  // The child leads its own process group, see Child.
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    KJ_LOG(ERROR, "Unable to kill the process group", child_pid_,
           mystrerror(errno, buf, kStrErrorBufSize));
  }
  if (kill(child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    KJ_LOG(ERROR, "Unable to kill the child", child_pid_,
           mystrerror(errno, buf, kStrErrorBufSize));
  }
}

void Unix::Execution::Reap() {
  while (waitpid(child_pid_, &child_status_, 0) == -1) {
    if (errno != EINTR) {
      char buf[kStrErrorBufSize] = {};
      KJ_LOG(ERROR, "Unable to reap the child", child_pid_,
             mystrerror(errno, buf, kStrErrorBufSize));
      break;
    }
  }
  reaped_ = true;
}

}  // namespace sandbox
