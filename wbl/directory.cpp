#include "directory.h"
#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <string>
#include "error.h"

using std::string;

namespace wbl {

bool isDirectory(const string& path) {
  struct stat sb;
  int statResult = stat(path.c_str(), &sb);
  return statResult == 0 && S_ISDIR(sb.st_mode);
}

void makeDir(const string& path) {
  int mkdirResult = mkdir(path.c_str(), 0777);
  if (mkdirResult == 0) return;
  int savedErrno = errno;
  if (savedErrno == EEXIST && isDirectory(path)) return;
  throwErrorForPath(savedErrno, "Failed to create directory '" + path + "'");
}

void makeDirs(const string& path) {
  if (path.empty() || isDirectory(path)) return;
  size_t lastSlash = path.find_last_not_of('/');
  lastSlash = lastSlash == string::npos ? string::npos : path.rfind('/', lastSlash);
  if (lastSlash != string::npos && lastSlash > 0) {
    makeDirs(path.substr(0, lastSlash));
  }
  makeDir(path);
}

}  // namespace wbl
