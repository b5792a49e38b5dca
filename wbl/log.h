// A library to log to std::cerr with some context (file and line).
// Usage:
//   WBL_INFO << "Something is happening";
//   WBL_WARNING << "Something strange is happening";
//   WBL_ERROR << "Something wrong is happening";
//   WBL_FATAL << "Something wrong happened and the process will end now";
//
// Each statement is buffered and written as a single line, so that logging from several threads at the same time
// does not mix fragments of different lines.
//
// The WBL_ASSERT macro is similar to assert but allows extra logging.
//   WBL_ASSERT(container.find(key) != container.end()) << "key=" << key;
//
// WBL_ASSERT_EQ is a specialization for equality tests that prints values in case of failure.
//   WBL_ASSERT_EQ(container[key], "expected value") << "key=" << key;

#ifndef WBL_LOG_H
#define WBL_LOG_H

#include <cstdlib>
#include <ostream>
#include <sstream>
#include <string>

// Defines a namespace outside of wbl so that resolution for operator<< overloads in wbl does not hide overloads in
// the global namespace.
namespace wbl_internal_log {

enum class LogLevel {
  INFO,
  WARNING,
  ERROR,
  FATAL,
};

struct EndOfLog {
  EndOfLog() = default;
  EndOfLog(const EndOfLog&) = delete;
  EndOfLog& operator=(const EndOfLog&) = delete;

  mutable std::ostringstream buffer;
};

// Writes `line` followed by '\n' to std::cerr, holding a process-wide lock.
void writeLogLine(const std::ostringstream& line);

struct EndOfNonFatalLog : public EndOfLog {
  ~EndOfNonFatalLog() { writeLogLine(buffer); }
};

struct EndOfFatalLog : public EndOfLog {
  [[noreturn]] ~EndOfFatalLog() {
    writeLogLine(buffer);
    exit(1);
  }
};

std::ostream& printLogLinePrefix(LogLevel level, const char* fileName, const EndOfLog& endOfLog);

// Returns an empty string if x == y, and otherwise the beginning of the message to log.
template <class X, class Y>
std::string getAssertEqFailure(const X& x, const Y& y, const char* assertionText) {
  if (x == y) {
    return std::string();
  }
  std::ostringstream message;
  message << "Assertion " << assertionText << " failed (" << x << " != " << y << ") ";
  return message.str();
}

}  // namespace wbl_internal_log

#define WBL_INTERNAL_STRINGIFY1(x) #x
#define WBL_INTERNAL_STRINGIFY2(x) WBL_INTERNAL_STRINGIFY1(x)
#define WBL_HERE __FILE__ ":" WBL_INTERNAL_STRINGIFY2(__LINE__)
#define WBL_INTERNAL_LOG(level, endClass) \
  ::wbl_internal_log::printLogLinePrefix(::wbl_internal_log::LogLevel::level, WBL_HERE, ::wbl_internal_log::endClass())

#define WBL_INFO WBL_INTERNAL_LOG(INFO, EndOfNonFatalLog)
#define WBL_WARNING WBL_INTERNAL_LOG(WARNING, EndOfNonFatalLog)
#define WBL_ERROR WBL_INTERNAL_LOG(ERROR, EndOfNonFatalLog)

#define WBL_FATAL WBL_INTERNAL_LOG(FATAL, EndOfFatalLog)

#define WBL_ASSERT(condition) \
  if (!(condition)) WBL_FATAL << "Assertion " #condition " failed "

#define WBL_ASSERT_EQ(x, y)                                                                                     \
  if (std::string wblAssertFailure = ::wbl_internal_log::getAssertEqFailure(x, y, #x " == " #y);               \
      wblAssertFailure.empty()) {                                                                               \
  } else                                                                                                        \
    WBL_FATAL << wblAssertFailure

#endif
