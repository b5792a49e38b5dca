#include "unittest.h"
#include <exception>
#include <string>
#include "log.h"

using std::string;

namespace wbl {

Test::~Test() {}

void Test::run(const string& testName) {
  int numTestCases = 0;
  for (const TestCase& testCase : m_testCases) {
    if (!testName.empty() && testCase.name != testName) {
      continue;
    }
    setUp();
    try {
      testCase.f();
    } catch (const std::exception& error) {
      WBL_FATAL << "Test case " << testCase.name << " threw an exception: " << error.what();
    }
    tearDown();
    numTestCases++;
  }
  WBL_ASSERT(numTestCases > 0);
}

}  // namespace wbl
