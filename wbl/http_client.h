// C++ wrapper for libcurl to do GET requests.
// Usage:
//   HTTPClient client;
//   client.setUserAgent("wikibulk/1.0 (https://example.com/contact)");
//   client.setTimeout(60);
//   string content = client.get("https://example.com/image.jpg");
//
// A client owns a single curl handle and must not be shared between threads. Several clients may be used concurrently,
// each from its own thread.
#ifndef WBL_HTTP_CLIENT_H
#define WBL_HTTP_CLIENT_H

#include <memory>
#include <string>
#include "error.h"

namespace wbl {

class CurlGlobalState;
class CurlHandle;

// No response from an HTTP server (e.g. no Internet connection or invalid domain).
class NetworkError : public Error {
public:
  using Error::Error;
};

// The transfer did not complete within the timeout set with setTimeout.
class NetworkTimeoutError : public NetworkError {
public:
  using NetworkError::NetworkError;
};

// The HTTP server returned an HTTP error.
class HTTPError : public Error {
public:
  HTTPError(int httpCode, const std::string& message) : Error(message), m_httpCode(httpCode) {}
  int httpCode() const { return m_httpCode; }

private:
  int m_httpCode;
};

// HTTP error 404.
class HTTPNotFoundError : public HTTPError {
public:
  using HTTPError::HTTPError;
};

// HTTP error 403.
class HTTPForbiddenError : public HTTPError {
public:
  using HTTPError::HTTPError;
};

// HTTP error 429.
class HTTPTooManyRequestsError : public HTTPError {
public:
  using HTTPError::HTTPError;
};

// HTTP error 5xx.
class HTTPServerError : public HTTPError {
public:
  using HTTPError::HTTPError;
};

// Curl wrapper (see the top of the file).
class HTTPClient {
public:
  HTTPClient();
  HTTPClient(const HTTPClient&) = delete;
  ~HTTPClient();
  HTTPClient& operator=(const HTTPClient&) = delete;

  // Retrieves an URL with a GET request, following redirects. Only 200 is a success.
  // Throws: HTTPForbiddenError, HTTPNotFoundError, HTTPTooManyRequestsError, HTTPServerError, HTTPError,
  // NetworkTimeoutError, NetworkError.
  std::string get(const std::string& url);

  const std::string& userAgent() const;
  // Sets the value of the User-Agent header. If empty, no User-Agent header is sent (this is the default).
  void setUserAgent(const std::string& value);
  // Maximum duration of a whole request, in seconds. The default is 300.
  int timeout() const { return m_timeout; }
  void setTimeout(int seconds);

private:
  static size_t callback(void* ptr, size_t size, size_t nmemb, void* userdata);

  CurlHandle& curlHandle();
  void resetCurlHandle();
  size_t write(void* ptr, size_t size, size_t nmemb);
  [[noreturn]] void throwHTTPError(const std::string& url, long httpCode);

  std::unique_ptr<CurlHandle> m_lazyCurlHandle;
  std::shared_ptr<CurlGlobalState> m_curlGlobalState;

  std::string m_userAgent;
  int m_timeout = 300;

  std::string* m_buffer = nullptr;
};

}  // namespace wbl

#endif
