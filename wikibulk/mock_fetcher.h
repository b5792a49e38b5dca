#ifndef WIKIBULK_MOCK_FETCHER_H
#define WIKIBULK_MOCK_FETCHER_H

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include "fetcher.h"

namespace wikibulk {

// Mock for the network to build tests that run locally.
// A MockFetcher object serves a fixed set of URLs. Fetchers created by factory() all share its state, so it can be
// passed to DownloadEngine as is. URLs without a response fail with NOT_FOUND.
class MockFetcher : public Fetcher {
public:
  void setResponse(const std::string& url, const std::string& content);
  // The next `count` requests to `url` fail with `kind`. Later requests get the normal response.
  void addFailures(const std::string& url, FetchError::Kind kind, int count = 1);
  void resetMock();

  std::string fetch(const std::string& url) override;
  FetcherFactory factory();

  int numRequests(const std::string& url) const;
  int totalRequests() const;

private:
  mutable std::mutex m_mutex;
  std::map<std::string, std::string> m_responses;
  std::map<std::string, std::deque<FetchError::Kind>> m_failures;
  std::map<std::string, int> m_numRequests;
  int m_totalRequests = 0;
};

}  // namespace wikibulk

#endif
