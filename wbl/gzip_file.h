// Line-oriented reading of gzip-compressed files.
// Usage:
//   wbl::GzipLineReader reader("dump.sql.gz");
//   string line;
//   while (reader.readLine(line)) {
//     ...
//   }
//
// Files that are not compressed are read as is, so the same code works on decompressed copies.
#ifndef WBL_GZIP_FILE_H
#define WBL_GZIP_FILE_H

#include <zlib.h>
#include <cstdint>
#include <string>
#include <string_view>
#include "error.h"

namespace wbl {

// The compressed stream is corrupt or truncated.
class GzipError : public Error {
public:
  using Error::Error;
};

class GzipLineReader {
public:
  // Throws: FileNotFoundError, PermissionError, SystemError.
  explicit GzipLineReader(const std::string& path);
  GzipLineReader(const GzipLineReader&) = delete;
  ~GzipLineReader();
  GzipLineReader& operator=(const GzipLineReader&) = delete;

  // Reads the next line into `line`, without the final '\n'. Returns false at the end of the file.
  // Lines have no length limit.
  // Throws: GzipError.
  bool readLine(std::string& line);
  // Goes back to the beginning of the file.
  // Throws: GzipError.
  void rewind();

  const std::string& path() const { return m_path; }
  // Number of lines returned by readLine since the file was opened or rewound.
  int64_t lineNumber() const { return m_lineNumber; }

private:
  [[noreturn]] void throwStreamError(const char* operation);

  std::string m_path;
  gzFile m_file = nullptr;
  int64_t m_lineNumber = 0;
};

// Writes `content` to `path` as a gzip-compressed file.
// Throws: SystemError, GzipError.
void writeGzipFile(const std::string& path, std::string_view content);

}  // namespace wbl

#endif
