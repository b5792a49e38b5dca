#include "mock_fetcher.h"
#include <memory>
#include <mutex>
#include <string>
#include "fetcher.h"

using std::string;

namespace wikibulk {
namespace {

class SharedMockFetcher : public Fetcher {
public:
  explicit SharedMockFetcher(MockFetcher* mock) : m_mock(mock) {}
  string fetch(const string& url) override { return m_mock->fetch(url); }

private:
  MockFetcher* m_mock;
};

}  // namespace

void MockFetcher::setResponse(const string& url, const string& content) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_responses[url] = content;
}

void MockFetcher::addFailures(const string& url, FetchError::Kind kind, int count) {
  std::lock_guard<std::mutex> lock(m_mutex);
  for (int i = 0; i < count; i++) {
    m_failures[url].push_back(kind);
  }
}

void MockFetcher::resetMock() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_responses.clear();
  m_failures.clear();
  m_numRequests.clear();
  m_totalRequests = 0;
}

string MockFetcher::fetch(const string& url) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_numRequests[url]++;
  m_totalRequests++;
  auto failureIt = m_failures.find(url);
  if (failureIt != m_failures.end() && !failureIt->second.empty()) {
    FetchError::Kind kind = failureIt->second.front();
    failureIt->second.pop_front();
    throw FetchError(kind, "Mock failure for '" + url + "'");
  }
  auto responseIt = m_responses.find(url);
  if (responseIt == m_responses.end()) {
    throw FetchError(FetchError::NOT_FOUND, "No mock response for '" + url + "'");
  }
  return responseIt->second;
}

FetcherFactory MockFetcher::factory() {
  return [this]() { return std::make_unique<SharedMockFetcher>(this); };
}

int MockFetcher::numRequests(const string& url) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_numRequests.find(url);
  return it == m_numRequests.end() ? 0 : it->second;
}

int MockFetcher::totalRequests() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_totalRequests;
}

}  // namespace wikibulk
