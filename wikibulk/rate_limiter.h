#ifndef WIKIBULK_RATE_LIMITER_H
#define WIKIBULK_RATE_LIMITER_H

#include <chrono>
#include <mutex>

namespace wikibulk {

// Adaptive delay shared by all download workers.
// Each failure doubles the delay (at least minBackoffSeconds, at most maxDelaySeconds) and pauses every worker for
// that duration. Each success halves the delay, down to baseDelaySeconds.
class RateLimiter {
public:
  RateLimiter(double baseDelaySeconds, double maxDelaySeconds, double minBackoffSeconds = 1);
  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  // Called before each request. Waits for the end of the global pause, if any, then for the current delay.
  void wait();
  void onSuccess();
  void onFailure();

  double currentDelay() const;

private:
  using Clock = std::chrono::steady_clock;

  const double m_baseDelay;
  const double m_maxDelay;
  const double m_minBackoff;
  mutable std::mutex m_mutex;
  double m_delay;
  Clock::time_point m_pauseEnd;
};

}  // namespace wikibulk

#endif
