#include "download_engine.h"
#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "mwdump/titles.h"
#include "wbl/directory.h"
#include "wbl/error.h"
#include "wbl/file.h"
#include "wbl/log.h"
#include "wbl/path.h"
#include "fetcher.h"
#include "progress_index.h"

using std::string;
using std::vector;

namespace wikibulk {

// Keeps the failure log at one line per file.
static string sanitizeReason(const string& reason) {
  string sanitizedReason = reason;
  std::replace_if(
      sanitizedReason.begin(), sanitizedReason.end(), [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
  return sanitizedReason;
}

DownloadEngine::DownloadEngine(ProgressIndex& index, const FetcherFactory& fetcherFactory,
                               const DownloadOptions& options)
    : m_index(index), m_fetcherFactory(fetcherFactory), m_options(options),
      m_rateLimiter(options.baseDelaySeconds, options.maxBackoffSeconds, options.minBackoffSeconds) {
  m_options.numWorkers = std::max(m_options.numWorkers, 1);
  m_options.maxAttempts = std::max(m_options.maxAttempts, 1);
  m_options.flushInterval = std::max(m_options.flushInterval, 1);
}

DownloadStats DownloadEngine::run(const vector<string>& titles) {
  wbl::makeDirs(m_options.outputDir);
  m_queue.assign(titles.begin(), titles.end());
  m_stats = DownloadStats();
  m_numProcessed = 0;
  m_numTitles = titles.size();
  m_workerError = nullptr;

  int numThreads = std::min<int64_t>(m_options.numWorkers, std::max<int64_t>(m_numTitles, 1));
  WBL_INFO << "Downloading " << m_numTitles << " files with " << numThreads << " workers to '" << m_options.outputDir
           << "'";
  vector<std::thread> workers;
  for (int i = 0; i < numThreads; i++) {
    workers.emplace_back(&DownloadEngine::runWorker, this);
  }
  for (std::thread& worker : workers) {
    worker.join();
  }
  m_index.flush();
  if (m_workerError) {
    std::rethrow_exception(m_workerError);
  }
  WBL_INFO << "Downloads finished: " << m_stats.downloaded << " downloaded, " << m_stats.alreadyPresent
           << " already present, " << m_stats.failed << " failed";
  return m_stats;
}

bool DownloadEngine::takeNextTitle(string& title) {
  std::lock_guard<std::mutex> lock(m_queueMutex);
  if (m_queue.empty()) {
    return false;
  }
  title = std::move(m_queue.front());
  m_queue.pop_front();
  return true;
}

void DownloadEngine::runWorker() {
  try {
    std::unique_ptr<Fetcher> fetcher = m_fetcherFactory();
    string title;
    while (takeNextTitle(title)) {
      downloadFile(*fetcher, title);
    }
  } catch (const std::exception& error) {
    WBL_ERROR << "Download worker stopped: " << error.what();
    std::lock_guard<std::mutex> lock(m_queueMutex);
    if (!m_workerError) {
      m_workerError = std::current_exception();
    }
    m_queue.clear();  // Stops the other workers after their current file.
  }
}

void DownloadEngine::downloadFile(Fetcher& fetcher, const string& title) {
  string localPath = wbl::joinPaths(m_options.outputDir, mwd::getLocalFileName(title));
  if (wbl::fileExists(localPath)) {
    recordStatus(title, FileStatus::DOWNLOADED, &DownloadStats::alreadyPresent);
    return;
  }
  string url = mwd::getFileURL(m_options.fileURLBase, title);
  for (int attempt = 1;; attempt++) {
    m_rateLimiter.wait();
    string content;
    try {
      content = fetcher.fetch(url);
    } catch (const FetchError& error) {
      if (error.isTransient()) {
        m_rateLimiter.onFailure();
        if (attempt < m_options.maxAttempts) {
          WBL_WARNING << "Attempt " << attempt << "/" << m_options.maxAttempts << " failed for '" << title
                      << "': " << error.what();
          continue;
        }
      }
      recordFailure(title, string(fetchErrorKindToString(error.kind())) + ": " + error.what());
      return;
    }
    m_rateLimiter.onSuccess();
    wbl::writeFileAtomically(localPath, content);
    recordStatus(title, FileStatus::DOWNLOADED, &DownloadStats::downloaded);
    return;
  }
}

void DownloadEngine::recordFailure(const string& title, const string& reason) {
  WBL_WARNING << "Cannot download '" << title << "': " << reason;
  if (!m_options.failureLog.empty()) {
    std::lock_guard<std::mutex> lock(m_failureLogMutex);
    wbl::appendToFile(m_options.failureLog, title + "\t" + sanitizeReason(reason) + "\n");
  }
  recordStatus(title, FileStatus::INVALID, &DownloadStats::failed);
}

void DownloadEngine::recordStatus(const string& title, FileStatus status, int64_t DownloadStats::*counter) {
  m_index.markStatus(title, status);
  int64_t numProcessed;
  {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_stats.*counter += 1;
    numProcessed = ++m_numProcessed;
  }
  if (m_index.flushIfDirty(m_options.flushInterval)) {
    WBL_INFO << "Processed " << numProcessed << "/" << m_numTitles << " files";
  }
}

}  // namespace wikibulk
