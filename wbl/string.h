#ifndef WBL_STRING_H
#define WBL_STRING_H

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>
#include "generated_range.h"

namespace wbl {
namespace string_internal {

constexpr size_t getTotalLength() {
  return 0;
}

template <typename... Args>
size_t getTotalLength(std::string_view firstArg, Args... args) {
  return firstArg.size() + getTotalLength(args...);
}

constexpr void concatHelper(std::string& buffer) {}

template <typename... Args>
void concatHelper(std::string& buffer, std::string_view firstArg, Args... args) {
  buffer += firstArg;
  concatHelper(buffer, args...);
}

}  // namespace string_internal

inline bool startsWith(std::string_view s, std::string_view prefix) {
  size_t n = prefix.size();
  return n <= s.size() && memcmp(s.data(), prefix.data(), n) == 0;
}

inline bool endsWith(std::string_view s, std::string_view suffix) {
  size_t n = suffix.size();
  return n <= s.size() && memcmp(s.data() + s.size() - n, suffix.data(), n) == 0;
}

// Concatenates multiple string_views (or anything convertible to string_view).
template <typename... Args>
std::string concat(Args... args) {
  std::string result;
  result.reserve(string_internal::getTotalLength(args...));
  string_internal::concatHelper(result, args...);
  return result;
}

// Parses s as an int64_t represented in base 10.
// Strict parsing (space, '+' sign or extra characters at the end are not allowed). Leading zeros are ignored.
// Throws: ParseError.
int64_t parseInt64(std::string_view s);

enum TrimOptions {
  TRIM_LEFT = 1,
  TRIM_RIGHT = 2,
  TRIM_BOTH = TRIM_LEFT | TRIM_RIGHT,
};

// trimOptions is a combination of flags from TrimOptions.
std::string_view trim(std::string_view s, int trimOptions = TRIM_BOTH);

std::string toLowerCaseASCII(std::string_view s);

class FieldGenerator {
public:
  using value_type = std::string_view;
  FieldGenerator(std::string_view str, char separator, bool ignoreLastFieldIfEmpty = false);
  bool next();
  std::string_view value() const { return m_value; }

private:
  std::string_view m_unconsumedPart;
  std::string_view m_value;
  char m_separator;
  bool m_atEnd = false;
};

class LineGenerator : public FieldGenerator {
public:
  LineGenerator(std::string_view str) : FieldGenerator(str, '\n', true) {}
};

using split = wbl::GeneratedRange<FieldGenerator>;
using splitLines = wbl::GeneratedRange<LineGenerator>;

void encodeURIComponentCat(std::string_view str, std::string& buffer);
std::string encodeURIComponent(std::string_view str);

template <class T>
std::string join(const T& begin, const T& end, std::string_view delimiter) {
  std::string result;
  T it = begin;
  if (it != end) {
    result += *it;
    for (++it; it != end; ++it) {
      result += delimiter;
      result += *it;
    }
  }
  return result;
}

template <class T>
inline std::string join(const T& items, std::string_view delimiter) {
  return join(items.begin(), items.end(), delimiter);
}

}  // namespace wbl

#endif
