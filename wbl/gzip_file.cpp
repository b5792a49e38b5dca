#include "gzip_file.h"
#include <zlib.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <string_view>
#include "error.h"

using std::string;
using std::string_view;

namespace wbl {

static constexpr int READ_BUFFER_SIZE = 1 << 16;

GzipLineReader::GzipLineReader(const string& path) : m_path(path) {
  errno = 0;
  m_file = gzopen(path.c_str(), "rb");
  if (m_file == nullptr) {
    // gzopen leaves errno at 0 if it fails for another reason than the underlying open().
    throwErrorForPath(errno != 0 ? errno : ENOMEM, "Cannot open '" + path + "'");
  }
  if (gzbuffer(m_file, READ_BUFFER_SIZE * 4) != 0) {
    gzclose(m_file);
    throw SystemError("Cannot set the read buffer size of '" + path + "'");
  }
}

GzipLineReader::~GzipLineReader() {
  gzclose(m_file);
}

void GzipLineReader::throwStreamError(const char* operation) {
  int errorCode = Z_OK;
  const char* message = gzerror(m_file, &errorCode);
  throw GzipError(string("Cannot ") + operation + " '" + m_path + "': " +
                  (message != nullptr && *message ? message : "unknown zlib error") + " (code " +
                  std::to_string(errorCode) + ")");
}

bool GzipLineReader::readLine(string& line) {
  char buffer[READ_BUFFER_SIZE];
  line.clear();
  bool readSomething = false;
  while (true) {
    if (gzgets(m_file, buffer, sizeof(buffer)) == nullptr) {
      int errorCode = Z_OK;
      gzerror(m_file, &errorCode);
      if (errorCode != Z_OK && errorCode != Z_STREAM_END) {
        throwStreamError("read");
      }
      break;  // End of file.
    }
    readSomething = true;
    size_t chunkSize = strlen(buffer);
    if (chunkSize > 0 && buffer[chunkSize - 1] == '\n') {
      line.append(buffer, chunkSize - 1);
      break;
    }
    line.append(buffer, chunkSize);
  }
  if (readSomething) {
    m_lineNumber++;
  }
  return readSomething;
}

void GzipLineReader::rewind() {
  if (gzrewind(m_file) != 0) {
    throwStreamError("rewind");
  }
  m_lineNumber = 0;
}

void writeGzipFile(const string& path, string_view content) {
  gzFile file = gzopen(path.c_str(), "wb");
  if (file == nullptr) {
    throwErrorForPath(errno != 0 ? errno : ENOMEM, "Cannot open '" + path + "' for writing");
  }
  RunOnDestroy closeFile([&file]() {
    if (file != nullptr) gzclose(file);
  });
  while (!content.empty()) {
    unsigned chunkSize = static_cast<unsigned>(std::min<size_t>(content.size(), READ_BUFFER_SIZE));
    if (gzwrite(file, content.data(), chunkSize) != static_cast<int>(chunkSize)) {
      int errorCode = Z_OK;
      throw GzipError("Cannot write to '" + path + "': " + gzerror(file, &errorCode));
    }
    content.remove_prefix(chunkSize);
  }
  gzFile fileToClose = file;
  file = nullptr;
  if (gzclose(fileToClose) != Z_OK) {
    throw GzipError("Cannot close '" + path + "'");
  }
}

}  // namespace wbl
