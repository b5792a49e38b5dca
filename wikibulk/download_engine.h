// Concurrent download of the files listed in the progress index.
#ifndef WIKIBULK_DOWNLOAD_ENGINE_H
#define WIKIBULK_DOWNLOAD_ENGINE_H

#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <string>
#include <vector>
#include "mwdump/titles.h"
#include "fetcher.h"
#include "progress_index.h"
#include "rate_limiter.h"

namespace wikibulk {

struct DownloadOptions {
  std::string outputDir;
  // Append-only list of "<title>\t<reason>" lines. No log is written if empty.
  std::string failureLog;
  std::string fileURLBase = mwd::DEFAULT_FILE_URL_BASE;
  int numWorkers = 10;
  // Number of status updates between two writes of the index.
  int flushInterval = 100;
  // Maximum number of requests for one file. Only TIMEOUT and TRANSPORT errors are retried.
  int maxAttempts = 5;
  double baseDelaySeconds = 0;
  double maxBackoffSeconds = 60;
  double minBackoffSeconds = 1;
};

struct DownloadStats {
  int64_t downloaded = 0;
  int64_t alreadyPresent = 0;
  int64_t failed = 0;
};

class DownloadEngine {
public:
  // `index` must outlive the engine. `fetcherFactory` is called once per worker thread.
  DownloadEngine(ProgressIndex& index, const FetcherFactory& fetcherFactory, const DownloadOptions& options);
  DownloadEngine(const DownloadEngine&) = delete;
  DownloadEngine& operator=(const DownloadEngine&) = delete;

  // Downloads `titles` (normally index.pendingFiles()) with a pool of worker threads. Files already present in the
  // output directory are marked as downloaded without being fetched. Failures of individual files are recorded in the
  // index and in the failure log. The index is flushed before returning.
  // Throws: wbl::SystemError (output directory, index or failure log cannot be written).
  DownloadStats run(const std::vector<std::string>& titles);

private:
  void runWorker();
  bool takeNextTitle(std::string& title);
  void downloadFile(Fetcher& fetcher, const std::string& title);
  void recordFailure(const std::string& title, const std::string& reason);
  void recordStatus(const std::string& title, FileStatus status, int64_t DownloadStats::*counter);

  ProgressIndex& m_index;
  FetcherFactory m_fetcherFactory;
  DownloadOptions m_options;
  RateLimiter m_rateLimiter;

  std::mutex m_queueMutex;
  std::deque<std::string> m_queue;
  std::exception_ptr m_workerError;

  std::mutex m_statsMutex;
  DownloadStats m_stats;
  int64_t m_numProcessed = 0;
  int64_t m_numTitles = 0;

  std::mutex m_failureLogMutex;
};

}  // namespace wikibulk

#endif
