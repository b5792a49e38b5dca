#include "string.h"
#include <ctype.h>
#include <errno.h>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include "error.h"

using std::string;
using std::string_view;

namespace wbl {

constexpr char HEX_DIGITS[16] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

int64_t parseInt64(string_view s) {
  string buffer(s);
  const char* firstDigit = buffer.c_str();
  if (*firstDigit == '-') firstDigit++;
  if (*firstDigit >= '0' && *firstDigit <= '9') {
    char* end = nullptr;
    errno = 0;
    int64_t result = strtoll(buffer.c_str(), &end, 10);
    if (errno == 0 && *end == '\0') {
      return result;
    }
  }
  throw ParseError("Invalid int64 '" + buffer + "'");
}

string_view trim(string_view s, int trimOptions) {
  const char* start = s.data();
  const char* end = start + s.size();
  if (trimOptions & TRIM_LEFT) {
    for (; start < end && isspace(static_cast<unsigned char>(*start)); start++) {
    }
  }
  if (trimOptions & TRIM_RIGHT) {
    for (; start < end && isspace(static_cast<unsigned char>(*(end - 1))); end--) {
    }
  }
  return s.substr(start - s.data(), end - start);
}

string toLowerCaseASCII(string_view s) {
  string result(s);
  for (char& c : result) {
    if (c >= 'A' && c <= 'Z') {
      c += 'a' - 'A';
    }
  }
  return result;
}

FieldGenerator::FieldGenerator(string_view str, char separator, bool ignoreLastFieldIfEmpty)
    : m_unconsumedPart(str), m_separator(separator) {
  if (ignoreLastFieldIfEmpty) {
    if (m_unconsumedPart.empty()) {
      m_atEnd = true;
    } else if (m_unconsumedPart.back() == separator) {
      m_unconsumedPart.remove_suffix(1);
    }
  }
}

bool FieldGenerator::next() {
  if (m_atEnd) {
    return false;
  }
  size_t separatorPosition = m_unconsumedPart.find(m_separator);
  m_value = m_unconsumedPart.substr(0, separatorPosition);
  if (separatorPosition == string_view::npos) {
    m_atEnd = true;
  } else {
    m_unconsumedPart.remove_prefix(separatorPosition + 1);
  }
  return true;
}

void encodeURIComponentCat(string_view str, string& buffer) {
  static const bool* const CHARS_TO_ENCODE = []() {
    static bool charsToEncode[0x100];
    std::fill(charsToEncode, charsToEncode + 0x100, true);
    constexpr string_view UNENCODED_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_.!~*\'()";
    for (unsigned char c : UNENCODED_CHARS) {
      charsToEncode[c] = false;
    }
    return charsToEncode;
  }();

  size_t requiredCapacity = buffer.size() + str.size();
  for (unsigned char c : str) {
    if (CHARS_TO_ENCODE[c]) {
      requiredCapacity += 2;
    }
  }
  if (buffer.capacity() < requiredCapacity) {
    buffer.reserve(requiredCapacity);
  }
  for (unsigned char c : str) {
    if (CHARS_TO_ENCODE[c]) {
      buffer += '%';
      buffer += HEX_DIGITS[(c >> 4) & 0xF];
      buffer += HEX_DIGITS[c & 0xF];
    } else {
      buffer += static_cast<char>(c);
    }
  }
}

string encodeURIComponent(string_view str) {
  string result;
  encodeURIComponentCat(str, result);
  return result;
}

}  // namespace wbl
