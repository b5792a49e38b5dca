// Minimal unit test harness.
// Usage:
//   class ScannerTest : public wbl::Test {
//     WBL_TEST_CASE(EmptyStatement) { WBL_ASSERT_EQ(countRows(""), 0); }
//     WBL_TEST_CASE(TwoRows) { WBL_ASSERT_EQ(countRows("(1),(2)"), 2); }
//   };
//   int main() {
//     ScannerTest().run();  // Runs every case declared with WBL_TEST_CASE, in declaration order.
//   }
//
// Failed assertions abort the process through WBL_FATAL, so a test binary exits with a non-zero status as soon as one
// case fails. An exception escaping from a test case is reported the same way.
#ifndef WBL_UNITTEST_H
#define WBL_UNITTEST_H

#include <functional>
#include <string>
#include <vector>

#define WBL_TEST_CASE(x)                                              \
  int testCaseRunner##x = [this]() {                                  \
    m_testCases.push_back({#x, [this]() { testCaseFunction##x(); }}); \
    return 0;                                                         \
  }();                                                                \
  void testCaseFunction##x()

namespace wbl {

class Test {
public:
  // Runs all tests by default, or just a specific test if testName is non-empty.
  void run(const std::string& testName = std::string());
  virtual ~Test();
  // Executed before each test case.
  virtual void setUp() {}
  // Executed after each test case.
  virtual void tearDown() {}

protected:
  struct TestCase {
    std::string name;
    std::function<void()> f;
  };
  std::vector<TestCase> m_testCases;
};

}  // namespace wbl

#endif
