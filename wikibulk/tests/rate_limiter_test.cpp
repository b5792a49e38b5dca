#include "wikibulk/rate_limiter.h"
#include <chrono>
#include "wbl/log.h"
#include "wbl/unittest.h"

namespace wikibulk {

class RateLimiterTest : public wbl::Test {
private:
  WBL_TEST_CASE(backoff) {
    RateLimiter rateLimiter(0, 60);
    WBL_ASSERT_EQ(rateLimiter.currentDelay(), 0);
    rateLimiter.onFailure();
    WBL_ASSERT_EQ(rateLimiter.currentDelay(), 1);
    rateLimiter.onFailure();
    WBL_ASSERT_EQ(rateLimiter.currentDelay(), 2);
    rateLimiter.onFailure();
    WBL_ASSERT_EQ(rateLimiter.currentDelay(), 4);
    rateLimiter.onSuccess();
    WBL_ASSERT_EQ(rateLimiter.currentDelay(), 2);
    rateLimiter.onSuccess();
    WBL_ASSERT_EQ(rateLimiter.currentDelay(), 1);
    rateLimiter.onSuccess();
    WBL_ASSERT_EQ(rateLimiter.currentDelay(), 0);
  }

  WBL_TEST_CASE(delayIsBounded) {
    RateLimiter rateLimiter(0.5, 8);
    for (int i = 0; i < 10; i++) {
      rateLimiter.onFailure();
    }
    WBL_ASSERT_EQ(rateLimiter.currentDelay(), 8);
    for (int i = 0; i < 10; i++) {
      rateLimiter.onSuccess();
    }
    WBL_ASSERT_EQ(rateLimiter.currentDelay(), 0.5);
  }

  WBL_TEST_CASE(waitAfterFailure) {
    RateLimiter rateLimiter(0, 0.05, 0.05);
    auto start = std::chrono::steady_clock::now();
    rateLimiter.wait();
    WBL_ASSERT(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(40));
    rateLimiter.onFailure();
    start = std::chrono::steady_clock::now();
    rateLimiter.wait();
    // Pause, then the current delay.
    WBL_ASSERT(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(50));
  }
};

}  // namespace wikibulk

int main() {
  wikibulk::RateLimiterTest().run();
  return 0;
}
