#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <string>

#include <kj/common.h>

namespace util {

class File {
 public:
  // Reads at most max_bytes bytes from the beginning of the file. Throws
  // std::system_error if the file cannot be opened or read.
  static std::string ReadPrefix(const std::string& path, size_t max_bytes);

  // Reads a whole file. Throws std::system_error on failure.
  static std::string Read(const std::string& path);

  // Reads from fd until EOF.
  static std::string ReadFd(int fd);

  // Writes all of data to fd.
  static void WriteFd(int fd, const std::string& data);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }

  // Returns true if path is a directory.
  static bool IsDirectory(const std::string& path);

  // Returns true if path is a regular file the current user can execute.
  static bool IsExecutable(const std::string& path);

  // Makes a relative path absolute with respect to the working directory.
  static std::string Absolute(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool moved_ = false;
};

}  // namespace util

#endif
