#include "string.h"
#include <cstdint>
#include <string>
#include <vector>
#include "error.h"
#include "log.h"
#include "unittest.h"

using std::string;
using std::string_view;
using std::vector;

namespace wbl {

class StringTest : public wbl::Test {
  WBL_TEST_CASE(parseInt64) {
    WBL_ASSERT_EQ(parseInt64("0"), 0);
    WBL_ASSERT_EQ(parseInt64("-12"), -12);
    WBL_ASSERT_EQ(parseInt64("9223372036854775807"), INT64_MAX);
    for (const char* invalidNumber : {"", "-", "+1", " 1", "1 ", "1.5", "9223372036854775808"}) {
      bool exceptionThrown = false;
      try {
        parseInt64(invalidNumber);
      } catch (const ParseError&) {
        exceptionThrown = true;
      }
      WBL_ASSERT(exceptionThrown) << invalidNumber;
    }
  }

  WBL_TEST_CASE(trim) {
    WBL_ASSERT_EQ(trim("  Cats \n"), "Cats");
    WBL_ASSERT_EQ(trim("  Cats ", TRIM_LEFT), "Cats ");
    WBL_ASSERT_EQ(trim("  Cats ", TRIM_RIGHT), "  Cats");
    WBL_ASSERT_EQ(trim("   "), "");
  }

  WBL_TEST_CASE(splitLines) {
    vector<string> lines;
    for (string_view line : wbl::splitLines("Cats\n\n# comment\nDogs\n")) {
      lines.emplace_back(line);
    }
    WBL_ASSERT_EQ(join(lines, "|"), "Cats||# comment|Dogs");
  }

  WBL_TEST_CASE(encodeURIComponent) {
    WBL_ASSERT_EQ(encodeURIComponent("Cat_photo.jpg"), "Cat_photo.jpg");
    WBL_ASSERT_EQ(encodeURIComponent("A b/c?d&é"), "A%20b%2Fc%3Fd%26%C3%A9");
  }
};

}  // namespace wbl

int main() {
  wbl::StringTest().run();
  return 0;
}
