#include "tempfile.h"
#include <cstdlib>
#include <stdexcept>
#include <string>
#include "error.h"

using std::string;

namespace wbl {

TempDir::TempDir() : TempDir("wbl") {}

TempDir::TempDir(const string& prefix) {
  if (prefix.find('\'') != string::npos) {
    throw std::invalid_argument("prefix must not contain single quotes");
  }
  m_path = "/tmp/" + prefix + "XXXXXX";
  const char* result = mkdtemp(&m_path[0]);
  if (!result) {
    throw SystemError("mkdtemp failed");
  }
}

TempDir::~TempDir() {
  string command = "rm -rf '" + m_path + "'";
  if (system(command.c_str()) != 0) {
    // Ignore failures.
  }
}

}  // namespace wbl
