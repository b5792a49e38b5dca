#include "http_client.h"
#include <curl/curl.h>
#include <cstring>
#include <memory>
#include <string>
#include "error.h"

using std::string;

namespace wbl {

// Class used to manage calls to curl_global_init / curl_global_cleanup.
// Call CurlGlobalState::getInstance() to ensure that curl_global_init has been called and keep a shared_ptr to the
// result as long as you need to use curl.
// curl_global_cleanup is called automatically when both of these conditions are fulfilled:
// - main() has exited.
// - The last shared_ptr to CurlGlobalState has been released (and thus, the last HTTPClient has been destroyed).
// The first call must happen before worker threads start creating clients.
class CurlGlobalState {
public:
  CurlGlobalState(const CurlGlobalState&) = delete;
  ~CurlGlobalState() { curl_global_cleanup(); }
  CurlGlobalState& operator=(const CurlGlobalState&) = delete;

  static std::shared_ptr<CurlGlobalState> getInstance() {
    static std::shared_ptr<CurlGlobalState> curlGlobalState(new CurlGlobalState);
    return curlGlobalState;
  }

private:
  CurlGlobalState() {
    CURLcode curlInitCode = curl_global_init(CURL_GLOBAL_ALL);
    if (curlInitCode != 0) {
      throw InternalError("curl_global_init() failed with code " + std::to_string(curlInitCode));
    }
  }
};

class CurlHandle {
public:
  CurlHandle() : m_handle(curl_easy_init()) {
    if (m_handle == nullptr) {
      throw InternalError("curl_easy_init() failed");
    }
  }
  CurlHandle(const CurlHandle&) = delete;
  ~CurlHandle() { curl_easy_cleanup(m_handle); }
  CurlHandle& operator=(const CurlHandle&) = delete;

  CURL* handle() { return m_handle; }
  void setNumOpt(CURLoption option, long value) {
    CURLcode code = curl_easy_setopt(m_handle, option, value);
    if (code != CURLE_OK) {
      throw InternalError("curl_easy_setopt(" + std::to_string(option) + ", " + std::to_string(value) + ") failed");
    }
  }
  void setPtrOpt(CURLoption option, const void* value) {
    CURLcode code = curl_easy_setopt(m_handle, option, value);
    if (code != CURLE_OK) {
      throw InternalError("curl_easy_setopt(" + std::to_string(option) + ", pointer) failed");
    }
  }

private:
  CURL* m_handle = nullptr;
};

HTTPClient::HTTPClient() {
  m_curlGlobalState = CurlGlobalState::getInstance();
}

HTTPClient::~HTTPClient() {}

CurlHandle& HTTPClient::curlHandle() {
  if (!m_lazyCurlHandle) {
    m_lazyCurlHandle = std::make_unique<CurlHandle>();
    m_lazyCurlHandle->setNumOpt(CURLOPT_NOSIGNAL, 1);  // Timeouts must not raise signals in worker threads.
    m_lazyCurlHandle->setNumOpt(CURLOPT_FOLLOWLOCATION, 1);
    m_lazyCurlHandle->setNumOpt(CURLOPT_MAXREDIRS, 10);
    m_lazyCurlHandle->setNumOpt(CURLOPT_TIMEOUT, m_timeout);
    m_lazyCurlHandle->setPtrOpt(CURLOPT_ACCEPT_ENCODING, "");  // All encodings supported by curl.
    if (!m_userAgent.empty()) {
      m_lazyCurlHandle->setPtrOpt(CURLOPT_USERAGENT, m_userAgent.c_str());
    }
  }
  return *m_lazyCurlHandle;
}

void HTTPClient::resetCurlHandle() {
  m_lazyCurlHandle.reset();
}

size_t HTTPClient::callback(void* ptr, size_t size, size_t nmemb, void* userdata) {
  return static_cast<HTTPClient*>(userdata)->write(ptr, size, nmemb);
}

size_t HTTPClient::write(void* ptr, size_t size, size_t nmemb) {
  size_t oldSize = m_buffer->size();
  size_t recvSize = size * nmemb;
  if (recvSize != 0) {
    m_buffer->resize(oldSize + recvSize);
    memcpy(&(*m_buffer)[oldSize], ptr, recvSize);
  }
  return recvSize;
}

void HTTPClient::throwHTTPError(const string& url, long httpCode) {
  string errorMessage = "Cannot read '" + url + "': server returned HTTP error " + std::to_string(httpCode);
  if (httpCode == 403) {
    throw HTTPForbiddenError(httpCode, errorMessage);
  } else if (httpCode == 404) {
    throw HTTPNotFoundError(httpCode, errorMessage);
  } else if (httpCode == 429) {
    throw HTTPTooManyRequestsError(httpCode, errorMessage);
  } else if (httpCode >= 500 && httpCode < 600) {
    throw HTTPServerError(httpCode, errorMessage);
  }
  throw HTTPError(httpCode, errorMessage);
}

string HTTPClient::get(const string& url) {
  string content;
  m_buffer = &content;
  RunOnDestroy releaseBuffer([this]() { m_buffer = nullptr; });
  CurlHandle& handle = curlHandle();
  handle.setPtrOpt(CURLOPT_WRITEFUNCTION, reinterpret_cast<const void*>(HTTPClient::callback));
  handle.setPtrOpt(CURLOPT_WRITEDATA, this);
  handle.setPtrOpt(CURLOPT_URL, url.c_str());
  CURLcode code = curl_easy_perform(handle.handle());
  if (code == CURLE_OPERATION_TIMEDOUT) {
    throw NetworkTimeoutError("Cannot read '" + url + "': timeout after " + std::to_string(m_timeout) + " seconds");
  } else if (code != CURLE_OK) {
    throw NetworkError("Cannot read '" + url + "': " + curl_easy_strerror(code) + " (curl code " +
                       std::to_string(code) + ")");
  }
  long httpCode = 0;
  if (curl_easy_getinfo(handle.handle(), CURLINFO_RESPONSE_CODE, &httpCode) != CURLE_OK) {
    throw InternalError("curl_easy_getinfo(CURLINFO_RESPONSE_CODE) failed");
  }
  if (httpCode != 200) {
    throwHTTPError(url, httpCode);
  }
  return content;
}

const string& HTTPClient::userAgent() const {
  return m_userAgent;
}

void HTTPClient::setUserAgent(const string& value) {
  if (m_userAgent == value) return;
  m_userAgent = value;
  resetCurlHandle();
}

void HTTPClient::setTimeout(int seconds) {
  if (m_timeout == seconds) return;
  m_timeout = seconds;
  resetCurlHandle();
}

}  // namespace wbl
