#include "args_parser.h"
#include <iterator>
#include <string>
#include <vector>
#include "log.h"
#include "unittest.h"

using std::string;
using std::vector;

namespace wbl {

class ArgsParserTest : public wbl::Test {
  WBL_TEST_CASE(flagsAndPositionalArgs) {
    string command;
    string outputDir = "default";
    int workers = 10;
    double delay = 0;
    bool noRecursiveSearch = false;
    const char* argv[] = {"wikibulk", "--workers=4", "download", "--output-dir", "out", "--delay", "0.5",
                          "--no-recursive-search"};
    parseArgs(std::size(argv), argv, "command", &command, "--output-dir", &outputDir, "--workers", &workers, "--delay",
              &delay, "--no-recursive-search", &noRecursiveSearch);
    WBL_ASSERT_EQ(command, "download");
    WBL_ASSERT_EQ(outputDir, "out");
    WBL_ASSERT_EQ(workers, 4);
    WBL_ASSERT_EQ(delay, 0.5);
    WBL_ASSERT(noRecursiveSearch);
  }

  WBL_TEST_CASE(defaultValuesArePreserved) {
    string command;
    int workers = 10;
    const char* argv[] = {"wikibulk", "status"};
    parseArgs(std::size(argv), argv, "command", &command, "--workers", &workers);
    WBL_ASSERT_EQ(workers, 10);
  }

  WBL_TEST_CASE(invalidValues) {
    vector<vector<const char*>> invalidCommandLines = {
        {"wikibulk", "status", "--workers=ten"},
        {"wikibulk", "status", "--delay=fast"},
        {"wikibulk", "status", "--unknown"},
        {"wikibulk"},
        {"wikibulk", "status", "extra"},
    };
    for (const vector<const char*>& argv : invalidCommandLines) {
      string command;
      int workers = 10;
      double delay = 0;
      bool exceptionThrown = false;
      try {
        parseArgs(argv.size(), argv.data(), "command", &command, "--workers", &workers, "--delay", &delay);
      } catch (const FlagParsingError&) {
        exceptionThrown = true;
      }
      WBL_ASSERT(exceptionThrown) << argv.size();
    }
  }

  WBL_TEST_CASE(requiredFlag) {
    string command;
    string categoryFile;
    const char* argv[] = {"wikibulk", "fetch"};
    bool exceptionThrown = false;
    try {
      parseArgs(std::size(argv), argv, "command", &command, "--category-file,required", &categoryFile);
    } catch (const FlagParsingError&) {
      exceptionThrown = true;
    }
    WBL_ASSERT(exceptionThrown);
  }
};

}  // namespace wbl

int main() {
  wbl::ArgsParserTest().run();
  return 0;
}
