#include "titles.h"
#include <string>
#include <string_view>
#include "wbl/string.h"

using std::string;
using std::string_view;

namespace mwd {

const char CATEGORY_PREFIX[] = "Category:";
const char DEFAULT_FILE_URL_BASE[] = "https://commons.wikimedia.org/wiki/Special:FilePath/";

static bool isSpaceOrUnderscore(char c) {
  return c == ' ' || c == '_' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Replaces runs of spaces and underscores with a single underscore and drops them at both ends.
static string collapseSpaces(string_view title) {
  string result;
  result.reserve(title.size());
  bool pendingSpace = false;
  for (char c : title) {
    if (isSpaceOrUnderscore(c)) {
      pendingSpace = !result.empty();
    } else {
      if (pendingSpace) {
        result += '_';
        pendingSpace = false;
      }
      result += c;
    }
  }
  return result;
}

// Upper case of a code point of the Latin-1 Supplement, Latin Extended-A, Greek and Cyrillic blocks. Other code points
// are returned unchanged.
static int toUpperCaseCodePoint(int c) {
  if (c >= 0xE0 && c <= 0xFE && c != 0xF7) {
    return c - 0x20;
  } else if (c == 0xFF) {
    return 0x178;
  } else if (c == 0x131) {
    return 'I';
  } else if (c == 0x17F) {
    return 'S';
  } else if ((c >= 0x100 && c <= 0x137) || (c >= 0x14A && c <= 0x177)) {
    return c & 1 ? c - 1 : c;
  } else if ((c >= 0x139 && c <= 0x148) || (c >= 0x179 && c <= 0x17E)) {
    return c & 1 ? c : c - 1;
  } else if (c >= 0x3B1 && c <= 0x3C9) {
    return c == 0x3C2 ? 0x3A3 : c - 0x20;
  } else if (c >= 0x430 && c <= 0x44F) {
    return c - 0x20;
  } else if (c >= 0x450 && c <= 0x45F) {
    return c - 0x50;
  }
  return c;
}

static void upperCaseFirstLetter(string& key) {
  unsigned char first = key[0];
  if (first >= 'a' && first <= 'z') {
    key[0] = static_cast<char>(first - 'a' + 'A');
    return;
  } else if ((first & 0xE0) != 0xC0 || key.size() < 2 || (static_cast<unsigned char>(key[1]) & 0xC0) != 0x80) {
    // Not a two-byte UTF-8 sequence. The blocks handled by toUpperCaseCodePoint() are all encoded on two bytes.
    return;
  }
  int c = ((first & 0x1F) << 6) | (key[1] & 0x3F);
  int upper = toUpperCaseCodePoint(c);
  if (upper == c) {
    return;
  }
  string encoded;
  if (upper < 0x80) {
    encoded += static_cast<char>(upper);
  } else {
    encoded += static_cast<char>(0xC0 | (upper >> 6));
    encoded += static_cast<char>(0x80 | (upper & 0x3F));
  }
  key.replace(0, 2, encoded);
}

string normalizeCategoryTitle(string_view title) {
  string key = collapseSpaces(title);
  size_t colon = key.find(':');
  if (colon != string::npos) {
    string_view prefix = string_view(key).substr(0, colon);
    if (!prefix.empty() && prefix.back() == '_') {
      prefix.remove_suffix(1);
    }
    if (wbl::toLowerCaseASCII(prefix) == "category") {
      key = collapseSpaces(string_view(key).substr(colon + 1));
    }
  }
  if (key.empty()) {
    return string();
  }
  upperCaseFirstLetter(key);
  return makeCategoryTitle(key);
}

string makeCategoryTitle(string_view key) {
  return wbl::concat(CATEGORY_PREFIX, key);
}

string_view getCategoryKey(string_view categoryTitle) {
  if (wbl::startsWith(categoryTitle, CATEGORY_PREFIX)) {
    categoryTitle.remove_prefix(sizeof(CATEGORY_PREFIX) - 1);
  }
  return categoryTitle;
}

string getFileURL(string_view urlBase, string_view fileTitle) {
  string url(urlBase);
  wbl::encodeURIComponentCat(fileTitle, url);
  return url;
}

string getLocalFileName(string_view fileTitle) {
  string fileName(fileTitle);
  for (char& c : fileName) {
    if (c == '/') {
      c = '_';
    }
  }
  return fileName;
}

}  // namespace mwd
