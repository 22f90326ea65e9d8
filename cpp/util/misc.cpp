#include "util/misc.hpp"

#include <cerrno>
#include <cstdlib>

#include <kj/debug.h>
#include <kj/encoding.h>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string toValidUtf8(const std::string& s) {
  bool ascii = true;
  for (char c : s) {
    if (c & 0x80) {
      ascii = false;
      break;
    }
  }
  if (ascii) return s;
  kj::EncodingResult<kj::Array<char16_t>> utf16 =
      kj::encodeUtf16(kj::ArrayPtr<const char>(s.data(), s.size()));
  if (!utf16.hadErrors) return s;
  kj::String text = kj::decodeUtf16(utf16);
  return std::string(text.begin(), text.size());
}

size_t utf8CompletePrefix(const std::string& s) {
  size_t start = s.size();
  size_t continuation = 0;
  while (start > 0 && continuation < 3 &&
         (static_cast<unsigned char>(s[start - 1]) & 0xc0) == 0x80) {
    start--;
    continuation++;
  }
  if (start == 0) return s.size();
  unsigned char lead = s[start - 1];
  size_t len = 0;
  if (lead >= 0xf0) {
    len = 4;
  } else if (lead >= 0xe0) {
    len = 3;
  } else if (lead >= 0xc0) {
    len = 2;
  } else {
    return s.size();
  }
  if (continuation + 1 < len) return start - 1;
  return s.size();
}

std::vector<std::string> shellSplit(const std::string& s) {
  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  for (size_t i = 0; i < s.size(); i++) {
    char c = s[i];
    if (c == ' ' || c == '\t' || c == '\n') {
      if (in_word) words.push_back(std::move(current));
      current.clear();
      in_word = false;
      continue;
    }
    in_word = true;
    if (c == '\\') {
      KJ_REQUIRE(i + 1 < s.size(), "trailing backslash", s.c_str());
      if (s[++i] != '\n') current += s[i];
      continue;
    }
    if (c == '\'') {
      size_t end = s.find('\'', i + 1);
      KJ_REQUIRE(end != std::string::npos, "unterminated single quote", s.c_str());
      current.append(s, i + 1, end - i - 1);
      i = end;
      continue;
    }
    if (c == '"') {
      for (i++; i < s.size() && s[i] != '"'; i++) {
        if (s[i] == '\\' && i + 1 < s.size()) {
          char next = s[i + 1];
          if (next == '\\' || next == '"' || next == '$' || next == '`') {
            current += next;
            i++;
            continue;
          }
          if (next == '\n') {
            i++;
            continue;
          }
        }
        current += s[i];
      }
      KJ_REQUIRE(i < s.size(), "unterminated double quote", s.c_str());
      continue;
    }
    current += c;
  }
  if (in_word) words.push_back(std::move(current));
  return words;
}

bool parseInt(const std::string& s, int64_t* out) {
  if (s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  long long value = strtoll(s.c_str(), &end, 10);  // NOLINT
  if (errno == ERANGE || end == s.c_str() || *end != '\0') return false;
  *out = value;
  return true;
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool()> clearBool(bool& var) {
  return [&var]() {
    var = false;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p.cStr();
    return true;
  };
};

std::function<kj::MainBuilder::Validity(kj::StringPtr)> setInt(int64_t& var) {
  return [&var](kj::StringPtr p) -> kj::MainBuilder::Validity {
    if (!parseInt(p.cStr(), &var)) return kj::str("expected an integer");
    return true;
  };
};

}  // namespace util
