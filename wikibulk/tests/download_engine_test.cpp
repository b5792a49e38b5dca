#include "wikibulk/download_engine.h"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include "mwdump/titles.h"
#include "wbl/directory.h"
#include "wbl/error.h"
#include "wbl/file.h"
#include "wbl/log.h"
#include "wbl/string.h"
#include "wbl/tempfile.h"
#include "wbl/unittest.h"
#include "wikibulk/mock_fetcher.h"
#include "wikibulk/progress_index.h"

using std::string;
using std::string_view;
using std::vector;

namespace wikibulk {

const char URL_BASE[] = "https://upload.example.org/";

class DownloadEngineTest : public wbl::Test {
private:
  void setUp() override {
    m_tempDir = std::make_unique<wbl::TempDir>();
    m_mockFetcher.resetMock();
    m_options = DownloadOptions();
    m_options.outputDir = m_tempDir->path() + "/media";
    m_options.failureLog = m_tempDir->path() + "/failed.txt";
    m_options.fileURLBase = URL_BASE;
    m_options.numWorkers = 4;
    m_options.flushInterval = 2;
    m_options.maxAttempts = 3;
    m_options.maxBackoffSeconds = 0.001;
    m_options.minBackoffSeconds = 0.001;
  }

  void tearDown() override {
    m_index.reset();
    m_tempDir.reset();
  }

  string indexPath() const { return m_tempDir->path() + "/index.json"; }
  string localPath(const string& title) const {
    return m_options.outputDir + "/" + mwd::getLocalFileName(title);
  }
  void setResponse(const string& title, const string& content) {
    m_mockFetcher.setResponse(mwd::getFileURL(URL_BASE, title), content);
  }
  int numRequests(const string& title) const { return m_mockFetcher.numRequests(mwd::getFileURL(URL_BASE, title)); }

  ProgressIndex& createIndex(const vector<string>& titles) {
    m_index = std::make_unique<ProgressIndex>(indexPath());
    vector<ResolvedFile> files;
    for (const string& title : titles) {
      files.push_back({.title = title, .category = "Category:Cats"});
    }
    m_index->merge(files, {"Category:Cats"});
    return *m_index;
  }

  WBL_TEST_CASE(downloadAll) {
    vector<string> titles;
    for (int i = 0; i < 20; i++) {
      string title = "Cat " + std::to_string(i) + ".jpg";
      setResponse(title, "content " + std::to_string(i));
      titles.push_back(title);
    }
    titles.push_back("AC/DC.jpg");
    setResponse("AC/DC.jpg", "slash");
    ProgressIndex& index = createIndex(titles);

    DownloadEngine engine(index, m_mockFetcher.factory(), m_options);
    DownloadStats stats = engine.run(index.pendingFiles());
    WBL_ASSERT_EQ(stats.downloaded, 21);
    WBL_ASSERT_EQ(stats.failed, 0);
    WBL_ASSERT_EQ(wbl::readFile(localPath("Cat 7.jpg")), "content 7");
    WBL_ASSERT_EQ(wbl::readFile(m_options.outputDir + "/AC_DC.jpg"), "slash");
    WBL_ASSERT(index.pendingFiles().empty());
    WBL_ASSERT_EQ(m_mockFetcher.totalRequests(), 21);
    WBL_ASSERT(!wbl::fileExists(m_options.failureLog));

    // The index is flushed when run() returns.
    ProgressIndex reloadedIndex(indexPath());
    WBL_ASSERT_EQ(reloadedIndex.countByStatus().downloaded, 21);
  }

  WBL_TEST_CASE(existingFilesAreNotDownloaded) {
    ProgressIndex& index = createIndex({"Cat1.jpg", "Cat2.jpg"});
    setResponse("Cat1.jpg", "new content");
    setResponse("Cat2.jpg", "content 2");
    wbl::makeDirs(m_options.outputDir);
    wbl::writeFile(localPath("Cat1.jpg"), "old content");

    DownloadStats stats = DownloadEngine(index, m_mockFetcher.factory(), m_options).run(index.pendingFiles());
    WBL_ASSERT_EQ(stats.alreadyPresent, 1);
    WBL_ASSERT_EQ(stats.downloaded, 1);
    WBL_ASSERT_EQ(numRequests("Cat1.jpg"), 0);
    WBL_ASSERT_EQ(wbl::readFile(localPath("Cat1.jpg")), "old content");
    WBL_ASSERT(index.getFile("Cat1.jpg")->status == FileStatus::DOWNLOADED);
  }

  WBL_TEST_CASE(transientErrorsAreRetried) {
    ProgressIndex& index = createIndex({"Cat1.jpg"});
    setResponse("Cat1.jpg", "content");
    m_mockFetcher.addFailures(mwd::getFileURL(URL_BASE, "Cat1.jpg"), FetchError::TRANSPORT);
    m_mockFetcher.addFailures(mwd::getFileURL(URL_BASE, "Cat1.jpg"), FetchError::TIMEOUT);

    DownloadStats stats = DownloadEngine(index, m_mockFetcher.factory(), m_options).run(index.pendingFiles());
    WBL_ASSERT_EQ(stats.downloaded, 1);
    WBL_ASSERT_EQ(numRequests("Cat1.jpg"), 3);
    WBL_ASSERT_EQ(wbl::readFile(localPath("Cat1.jpg")), "content");
  }

  WBL_TEST_CASE(failures) {
    ProgressIndex& index = createIndex({"Missing.jpg", "Flaky.jpg", "Empty.jpg", "Cat1.jpg"});
    setResponse("Cat1.jpg", "content");
    setResponse("Flaky.jpg", "never served");
    m_mockFetcher.addFailures(mwd::getFileURL(URL_BASE, "Flaky.jpg"), FetchError::TRANSPORT, 10);
    m_mockFetcher.addFailures(mwd::getFileURL(URL_BASE, "Empty.jpg"), FetchError::INVALID_CONTENT);

    DownloadStats stats = DownloadEngine(index, m_mockFetcher.factory(), m_options).run(index.pendingFiles());
    WBL_ASSERT_EQ(stats.downloaded, 1);
    WBL_ASSERT_EQ(stats.failed, 3);
    // Only transient errors are retried, up to maxAttempts requests.
    WBL_ASSERT_EQ(numRequests("Missing.jpg"), 1);
    WBL_ASSERT_EQ(numRequests("Empty.jpg"), 1);
    WBL_ASSERT_EQ(numRequests("Flaky.jpg"), 3);
    WBL_ASSERT(!wbl::fileExists(localPath("Flaky.jpg")));

    WBL_ASSERT(index.getFile("Missing.jpg")->status == FileStatus::INVALID);
    WBL_ASSERT(index.getFile("Flaky.jpg")->status == FileStatus::INVALID);
    WBL_ASSERT(index.getFile("Cat1.jpg")->status == FileStatus::DOWNLOADED);

    string failureLogContent = wbl::readFile(m_options.failureLog);
    vector<string> logLines;
    for (string_view line : wbl::splitLines(failureLogContent)) {
      logLines.emplace_back(line);
    }
    WBL_ASSERT_EQ(logLines.size(), 3U);
    int numNotFound = 0;
    for (const string& line : logLines) {
      WBL_ASSERT(line.find('\t') != string::npos) << line;
      if (wbl::startsWith(line, "Missing.jpg\tnot found: ")) {
        numNotFound++;
      }
    }
    WBL_ASSERT_EQ(numNotFound, 1);

    // Invalid files are attempted again by the next run.
    WBL_ASSERT(index.pendingFiles() == (vector<string>{"Empty.jpg", "Flaky.jpg", "Missing.jpg"}));
    setResponse("Missing.jpg", "found");
    stats = DownloadEngine(index, m_mockFetcher.factory(), m_options).run(index.pendingFiles());
    WBL_ASSERT_EQ(stats.downloaded, 1);
    WBL_ASSERT_EQ(stats.failed, 2);
    WBL_ASSERT(index.pendingFiles() == (vector<string>{"Empty.jpg", "Flaky.jpg"}));
  }

  WBL_TEST_CASE(fetcherPerWorker) {
    ProgressIndex& index = createIndex({"A.jpg", "B.jpg", "C.jpg"});
    setResponse("A.jpg", "a");
    setResponse("B.jpg", "b");
    setResponse("C.jpg", "c");
    int numFetchers = 0;
    FetcherFactory mockFactory = m_mockFetcher.factory();
    FetcherFactory countingFactory = [&]() {
      static std::mutex mutex;
      std::lock_guard<std::mutex> lock(mutex);
      numFetchers++;
      return mockFactory();
    };
    m_options.numWorkers = 8;
    DownloadStats stats = DownloadEngine(index, countingFactory, m_options).run(index.pendingFiles());
    WBL_ASSERT_EQ(stats.downloaded, 3);
    // No more workers than files.
    WBL_ASSERT_EQ(numFetchers, 3);
  }

  WBL_TEST_CASE(workerErrorIsPropagated) {
    ProgressIndex& index = createIndex({"Cat1.jpg"});
    bool errorThrown = false;
    try {
      DownloadEngine engine(index, []() -> std::unique_ptr<Fetcher> { throw wbl::InternalError("no network"); },
                            m_options);
      engine.run(index.pendingFiles());
    } catch (const wbl::InternalError&) {
      errorThrown = true;
    }
    WBL_ASSERT(errorThrown);
    WBL_ASSERT(index.getFile("Cat1.jpg")->status == FileStatus::PENDING);
  }

  std::unique_ptr<wbl::TempDir> m_tempDir;
  MockFetcher m_mockFetcher;
  DownloadOptions m_options;
  std::unique_ptr<ProgressIndex> m_index;
};

}  // namespace wikibulk

int main() {
  wikibulk::DownloadEngineTest().run();
  return 0;
}
