#include "path.h"
#include <string>
#include <string_view>

using std::string;
using std::string_view;

namespace wbl {

string getBaseName(const string& path) {
  size_t lastSlash = path.rfind('/');
  return path.substr(lastSlash == string::npos ? 0 : lastSlash + 1);
}

string joinPaths(string_view path1, string_view path2) {
  string path;
  path.reserve(path1.size() + path2.size() + 1);
  path += path1;
  if (!path.empty() && path[path.size() - 1] != '/') {
    path += '/';
  }
  path += path2;
  return path;
}

}  // namespace wbl
