#ifndef WBL_ERROR_H
#define WBL_ERROR_H

#include <functional>
#include <stdexcept>
#include <string>

namespace wbl {

// Base class for all exceptions in the wbl namespace and the libraries built on top of it.
class Error : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

// Generic non-recoverable error, not due to the client.
// Should not be catched.
class InternalError : public Error {
public:
  using Error::Error;
};

// Non-recoverable error due to a logical error on the client side (function call breaking some preconditions).
// Should not be catched.
class InvalidStateError : public Error {
public:
  using Error::Error;
};

// Error of a system call.
class SystemError : public Error {
public:
  using Error::Error;
};

// Some file was not found.
class FileNotFoundError : public SystemError {
public:
  using SystemError::SystemError;
};

// The client is not allowed to execute an operation or access some file.
class PermissionError : public SystemError {
public:
  using SystemError::SystemError;
};

// Invalid string input.
class ParseError : public Error {
public:
  using Error::Error;
};

// Helper class to simulate finally blocks.
class RunOnDestroy {
public:
  explicit RunOnDestroy(const std::function<void()>& f) : m_function(f) {}
  RunOnDestroy(const RunOnDestroy&) = delete;
  ~RunOnDestroy() { m_function(); }
  RunOnDestroy& operator=(const RunOnDestroy&) = delete;

private:
  std::function<void()> m_function;
};

std::string getCErrorString(int errorNumber);

// Builds the exception matching errno after a failed call on `path` (FileNotFoundError, PermissionError or
// SystemError) with message "<messagePrefix>: <strerror>".
[[noreturn]] void throwErrorForPath(int errorNumber, const std::string& messagePrefix);

}  // namespace wbl

#endif
