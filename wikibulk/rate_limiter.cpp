#include "rate_limiter.h"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>

namespace wikibulk {

static constexpr double BACKOFF_FACTOR = 2;

static std::chrono::steady_clock::duration toDuration(double seconds) {
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(seconds));
}

RateLimiter::RateLimiter(double baseDelaySeconds, double maxDelaySeconds, double minBackoffSeconds)
    : m_baseDelay(std::max(baseDelaySeconds, 0.0)), m_maxDelay(std::max(maxDelaySeconds, m_baseDelay)),
      m_minBackoff(std::max(minBackoffSeconds, 0.0)), m_delay(m_baseDelay) {}

void RateLimiter::wait() {
  while (true) {
    Clock::time_point pauseEnd;
    double delay;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      pauseEnd = m_pauseEnd;
      delay = m_delay;
    }
    // The pause may have been extended by other workers while sleeping, hence the loop.
    if (Clock::now() < pauseEnd) {
      std::this_thread::sleep_until(pauseEnd);
      continue;
    }
    if (delay > 0) {
      std::this_thread::sleep_for(toDuration(delay));
    }
    return;
  }
}

void RateLimiter::onSuccess() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_delay /= BACKOFF_FACTOR;
  if (m_delay < std::max(m_baseDelay, m_minBackoff)) {
    m_delay = m_baseDelay;
  }
}

void RateLimiter::onFailure() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_delay = std::min(m_maxDelay, std::max(m_delay * BACKOFF_FACTOR, m_minBackoff));
  m_pauseEnd = std::max(m_pauseEnd, Clock::now() + toDuration(m_delay));
}

double RateLimiter::currentDelay() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_delay;
}

}  // namespace wikibulk
