#include "log.h"
#include <cstring>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>

namespace wbl_internal_log {

static std::mutex logMutex;

void writeLogLine(const std::ostringstream& line) {
  std::lock_guard<std::mutex> lock(logMutex);
  std::cerr << line.str() << '\n';
}

std::ostream& printLogLinePrefix(LogLevel level, const char* fileName, const EndOfLog& endOfLog) {
  const char* prefix = "";
  switch (level) {
    case LogLevel::INFO:
      prefix = "[INFO ";
      break;
    case LogLevel::WARNING:
      prefix = "[WARNING ";
      break;
    case LogLevel::ERROR:
      prefix = "[ERROR ";
      break;
    case LogLevel::FATAL:
      prefix = "[FATAL ";
      break;
  }
  const char* baseName = fileName + strlen(fileName);
  for (; baseName > fileName && *(baseName - 1) != '/'; baseName--) {}
  return endOfLog.buffer << prefix << baseName << "] ";
}

}  // namespace wbl_internal_log
