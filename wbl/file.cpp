#include "file.h"
#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include "error.h"

using std::string;
using std::string_view;

namespace wbl {

bool fileExists(const string& path) {
  struct stat sb;
  int statResult = stat(path.c_str(), &sb);
  return statResult == 0 || errno == EOVERFLOW;
}

static string readOpenedFile(FILE* file) {
  if (fseek(file, 0, SEEK_END) == -1) {
    throw SystemError("fseek failed: " + getCErrorString(errno));
  }

  long length = ftell(file);
  if (length == -1) {
    throw SystemError("ftell failed: " + getCErrorString(errno));
  } else if (length == LONG_MAX) {
    // Reading a directory is undefined behavior, but this helps to provide a better error message in some cases.
    throw InternalError("ftell returned LONG_MAX (may indicate a directory)");
  }

  if (fseek(file, 0, SEEK_SET) == -1) {
    throw SystemError("fseek failed: " + getCErrorString(errno));
  }

  string content;
  if (length > 0) {  // &content[0] is undefined if length == 0.
    content.resize(length);
    errno = 0;
    long freadResult = fread(&content[0], 1, length, file);
    if (freadResult != length) {
      throw SystemError(errno != 0 ? "fread failed: " + getCErrorString(errno) : "bad file length");
    }
  }
  return content;
}

string readFile(const string& path) {
  FILE* file = fopen(path.c_str(), "r");
  if (file == nullptr) {
    throwErrorForPath(errno, "Cannot open '" + path + "'");
  }
  RunOnDestroy fileCloser([file]() { fclose(file); });
  try {
    return readOpenedFile(file);
  } catch (const SystemError& error) {
    throw SystemError("Cannot read '" + path + "': " + error.what());
  }
}

static void writeOpenedFileAndCloseIt(const string& path, FILE* file, string_view content) {
  if (file == nullptr) {
    throwErrorForPath(errno, "Cannot open '" + path + "' in write mode");
  }
  if (fwrite(content.data(), 1, content.size(), file) != content.size()) {
    int savedErrno = errno;
    fclose(file);
    throw SystemError("Cannot write '" + path + "': " + getCErrorString(savedErrno));
  }
  if (fclose(file) != 0) {
    int savedErrno = errno;
    throw SystemError("Cannot write '" + path + "': " + getCErrorString(savedErrno));
  }
}

void writeFile(const string& path, string_view content) {
  writeOpenedFileAndCloseIt(path, fopen(path.c_str(), "w"), content);
}

void writeFileAtomically(const string& path, string_view content) {
  string tempPath = path + ".tmp-XXXXXX";
  int fd = mkstemp(&tempPath[0]);
  if (fd == -1) {
    throwErrorForPath(errno, "Cannot write '" + path + "' because mkstemp failed");
  }
  // mkstemp creates the file with mode 0600.
  if (fchmod(fd, 0644) != 0) {
    int savedErrno = errno;
    close(fd);
    remove(tempPath.c_str());
    throwErrorForPath(savedErrno, "Cannot change the mode of '" + tempPath + "'");
  }
  try {
    writeOpenedFileAndCloseIt(tempPath, fdopen(fd, "w"), content);
  } catch (const Error&) {
    remove(tempPath.c_str());
    throw;
  }
  if (rename(tempPath.c_str(), path.c_str()) != 0) {
    int savedErrno = errno;
    remove(tempPath.c_str());
    throw SystemError("Cannot write '" + path + "' because renaming from '" + tempPath +
                      "' failed: " + getCErrorString(savedErrno));
  }
}

void appendToFile(const string& path, string_view content) {
  writeOpenedFileAndCloseIt(path, fopen(path.c_str(), "a"), content);
}

void removeFile(const string& path, bool mustExist) {
  if (remove(path.c_str()) == 0) {
    return;
  }
  int savedErrno = errno;
  if (savedErrno == ENOENT && !mustExist) {
    return;
  }
  throwErrorForPath(savedErrno, "Cannot remove '" + path + "'");
}

}  // namespace wbl
