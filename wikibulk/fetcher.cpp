#include "fetcher.h"
#include <string>
#include "wbl/error.h"
#include "wbl/http_client.h"

using std::string;

namespace wikibulk {

const char* fetchErrorKindToString(FetchError::Kind kind) {
  switch (kind) {
    case FetchError::TIMEOUT:
      return "timeout";
    case FetchError::NOT_FOUND:
      return "not found";
    case FetchError::TRANSPORT:
      return "transport error";
    case FetchError::INVALID_CONTENT:
      return "invalid content";
  }
  throw wbl::InternalError("Invalid FetchError::Kind " + std::to_string(static_cast<int>(kind)));
}

HTTPFetcher::HTTPFetcher(const HTTPFetcherOptions& options) {
  m_client.setUserAgent(options.userAgent);
  m_client.setTimeout(options.timeoutSeconds);
}

string HTTPFetcher::fetch(const string& url) {
  string content;
  try {
    content = m_client.get(url);
  } catch (const wbl::NetworkTimeoutError& error) {
    throw FetchError(FetchError::TIMEOUT, error.what());
  } catch (const wbl::NetworkError& error) {
    throw FetchError(FetchError::TRANSPORT, error.what());
  } catch (const wbl::HTTPNotFoundError& error) {
    throw FetchError(FetchError::NOT_FOUND, error.what());
  } catch (const wbl::HTTPTooManyRequestsError& error) {
    throw FetchError(FetchError::TRANSPORT, error.what());
  } catch (const wbl::HTTPServerError& error) {
    throw FetchError(FetchError::TRANSPORT, error.what());
  } catch (const wbl::HTTPError& error) {
    throw FetchError(FetchError::INVALID_CONTENT, error.what());
  }
  if (content.empty()) {
    throw FetchError(FetchError::INVALID_CONTENT, "Empty response for '" + url + "'");
  }
  return content;
}

}  // namespace wikibulk
