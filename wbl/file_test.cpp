#include "file.h"
#include <sys/stat.h>
#include <string>
#include "directory.h"
#include "error.h"
#include "log.h"
#include "tempfile.h"
#include "unittest.h"

using std::string;

namespace wbl {

class FileTest : public wbl::Test {
  WBL_TEST_CASE(writeAndReadFile) {
    string path = m_tempDir.path() + "/file.txt";
    WBL_ASSERT(!fileExists(path));
    writeFile(path, string("abc\0def", 7));
    WBL_ASSERT(fileExists(path));
    WBL_ASSERT_EQ(readFile(path), string("abc\0def", 7));
  }

  WBL_TEST_CASE(readFile_Missing) {
    bool exceptionThrown = false;
    try {
      readFile(m_tempDir.path() + "/missing.txt");
    } catch (const FileNotFoundError&) {
      exceptionThrown = true;
    }
    WBL_ASSERT(exceptionThrown);
  }

  WBL_TEST_CASE(writeFileAtomically) {
    string path = m_tempDir.path() + "/index.json";
    writeFile(path, "old");
    writeFileAtomically(path, "new content");
    WBL_ASSERT_EQ(readFile(path), "new content");
    struct stat sb;
    WBL_ASSERT_EQ(stat(path.c_str(), &sb), 0);
    WBL_ASSERT_EQ(sb.st_mode & 0777, 0644u);
  }

  WBL_TEST_CASE(writeFileAtomically_MissingDirectory) {
    string path = m_tempDir.path() + "/missing-dir/index.json";
    bool exceptionThrown = false;
    try {
      writeFileAtomically(path, "content");
    } catch (const FileNotFoundError&) {
      exceptionThrown = true;
    }
    WBL_ASSERT(exceptionThrown);
    WBL_ASSERT(!isDirectory(m_tempDir.path() + "/missing-dir"));
  }

  WBL_TEST_CASE(appendToFile) {
    string path = m_tempDir.path() + "/failed.txt";
    appendToFile(path, "a\t404\n");
    appendToFile(path, "b\ttimeout\n");
    WBL_ASSERT_EQ(readFile(path), "a\t404\nb\ttimeout\n");
  }

  WBL_TEST_CASE(removeFile) {
    string path = m_tempDir.path() + "/to-remove";
    writeFile(path, "");
    removeFile(path, true);
    WBL_ASSERT(!fileExists(path));
    removeFile(path, false);  // Should not fail.
    bool exceptionThrown = false;
    try {
      removeFile(path, true);
    } catch (const FileNotFoundError&) {
      exceptionThrown = true;
    }
    WBL_ASSERT(exceptionThrown);
  }

private:
  TempDir m_tempDir;
};

}  // namespace wbl

int main() {
  wbl::FileTest().run();
  return 0;
}
