#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <ftw.h>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

const size_t kBufferSize = 64 * 1024;
const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "wasi-exec-XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  if (mkdtemp(data) == nullptr)                  // NOLINT
    return "";
  return data;  // NOLINT
}

}  // namespace

namespace util {

std::string File::ReadPrefix(const std::string& path, size_t max_bytes) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::string data(max_bytes, '\0');
  size_t pos = 0;
  while (pos < max_bytes) {
    ssize_t amount = read(fd.get(), &data[pos], max_bytes - pos);  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    if (amount == 0) break;
    pos += amount;
  }
  data.resize(pos);
  return data;
}

std::string File::Read(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  return ReadFd(fd.get());
}

std::string File::ReadFd(int fd) {
  std::string data;
  char buf[kBufferSize];
  while (true) {
    ssize_t amount = 0;
    KJ_SYSCALL(amount = read(fd, buf, kBufferSize));  // NOLINT
    if (amount == 0) break;
    data.append(buf, amount);
  }
  return data;
}

void File::WriteFd(int fd, const std::string& data) {
  size_t pos = 0;
  while (pos < data.size()) {
    ssize_t written = 0;
    KJ_SYSCALL(written = write(fd, data.data() + pos, data.size() - pos));
    pos += written;
  }
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  if (first.empty()) return second;
  if (first.back() == kPathSeparators[0]) return first + second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

bool File::IsDirectory(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISDIR(st.st_mode);
}

bool File::IsExecutable(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string File::Absolute(const std::string& path) {
  if (!path.empty() && path[0] == kPathSeparators[0]) return path;
  char cwd[PATH_MAX] = {};
  if (getcwd(cwd, sizeof(cwd)) == nullptr) {
    throw std::system_error(errno, std::system_category(), "getcwd");
  }
  return JoinPath(cwd, path);
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
  }
}

}  // namespace util
