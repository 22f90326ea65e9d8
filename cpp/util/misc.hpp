#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/main.h>
#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Splits a command line the way a POSIX shell would: whitespace separates
// words, single quotes are literal, double quotes allow backslash escapes of
// \ " $ ` and newline. Throws a kj::Exception on an unterminated quote or a
// trailing backslash.
std::vector<std::string> shellSplit(const std::string& s);

// Parses a base-10 integer that must span the whole string. Returns false on
// malformed input or overflow, leaving *out untouched.
bool parseInt(const std::string& s, int64_t* out);

// Returns s with every malformed UTF-8 sequence replaced by U+FFFD.
std::string toValidUtf8(const std::string& s);

// Length of the longest prefix of s that does not end inside a multi-byte
// UTF-8 sequence.
size_t utf8CompletePrefix(const std::string& s);

std::function<bool()> setBool(bool& var);
std::function<bool()> clearBool(bool& var);
std::function<bool(kj::StringPtr)> setString(std::string& var);
std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(int64_t& var);

}  // namespace util
#endif
