// Abstraction of the network: "given a URL, fetch the bytes or fail".
#ifndef WIKIBULK_FETCHER_H
#define WIKIBULK_FETCHER_H

#include <functional>
#include <memory>
#include <string>
#include "wbl/error.h"
#include "wbl/http_client.h"

namespace wikibulk {

class FetchError : public wbl::Error {
public:
  enum Kind {
    TIMEOUT,
    NOT_FOUND,
    TRANSPORT,
    INVALID_CONTENT,
  };

  FetchError(Kind kind, const std::string& message) : Error(message), m_kind(kind) {}
  Kind kind() const { return m_kind; }
  // TIMEOUT and TRANSPORT errors may disappear if the request is sent again.
  bool isTransient() const { return m_kind == TIMEOUT || m_kind == TRANSPORT; }

private:
  Kind m_kind;
};

const char* fetchErrorKindToString(FetchError::Kind kind);

class Fetcher {
public:
  virtual ~Fetcher() = default;
  // Returns the content at `url`.
  // Throws: FetchError.
  virtual std::string fetch(const std::string& url) = 0;
};

// Creates one fetcher per download worker, so that fetchers never need to be thread-safe.
using FetcherFactory = std::function<std::unique_ptr<Fetcher>()>;

struct HTTPFetcherOptions {
  std::string userAgent;
  int timeoutSeconds = 300;
};

// Fetcher over HTTP(S), backed by wbl::HTTPClient.
class HTTPFetcher : public Fetcher {
public:
  explicit HTTPFetcher(const HTTPFetcherOptions& options);
  // HTTP 404 is NOT_FOUND, 429 and 5xx are TRANSPORT, other HTTP errors and empty responses are INVALID_CONTENT.
  std::string fetch(const std::string& url) override;

private:
  wbl::HTTPClient m_client;
};

}  // namespace wikibulk

#endif
