#include "error.h"
#include <errno.h>
#include <cstring>
#include <string>

using std::string;

namespace wbl {

string getCErrorString(int errorNumber) {
  char buffer[0x100];
  buffer[0] = '\0';
  return strerror_r(errorNumber, buffer, sizeof(buffer));
}

void throwErrorForPath(int errorNumber, const string& messagePrefix) {
  string errorMessage = messagePrefix + ": " + getCErrorString(errorNumber);
  if (errorNumber == ENOENT || errorNumber == ENOTDIR) {
    throw FileNotFoundError(errorMessage);
  } else if (errorNumber == EACCES || errorNumber == EPERM) {
    throw PermissionError(errorMessage);
  }
  throw SystemError(errorMessage);
}

}  // namespace wbl
