#include "wikibulk_lib.h"
#include <string>
#include <string_view>
#include <vector>
#include "wbl/args_parser.h"
#include "wbl/error.h"
#include "wbl/file.h"
#include "wbl/log.h"
#include "wbl/path.h"
#include "wbl/string.h"
#include "category_resolver.h"
#include "download_engine.h"
#include "progress_index.h"

using std::string;
using std::string_view;
using std::vector;

namespace wikibulk {

void FetchFlags::declareFlags(wbl::ArgsParser& parser) {
  parser.addArgs("--category-file", &m_categoryFile, "--dumps-dir", &m_dumpsDir, "--dump-prefix", &m_dumpPrefix,
                 "--no-recursive-search", &m_noRecursiveSearch, "--file-filter", &m_fileFilter);
}

DumpFiles FetchFlags::dumpFiles() const {
  return getDumpFiles(m_dumpsDir, m_dumpPrefix);
}

ResolverOptions FetchFlags::resolverOptions() const {
  return {.recursive = !m_noRecursiveSearch, .fileFilter = m_fileFilter};
}

void FetchFlags::checkRequiredFlags() const {
  if (m_categoryFile.empty()) {
    throw wbl::FlagParsingError("--category-file is required to fetch categories");
  } else if (m_dumpsDir.empty()) {
    throw wbl::FlagParsingError("--dumps-dir is required to fetch categories");
  }
}

void DownloadFlags::declareFlags(wbl::ArgsParser& parser) {
  parser.addArgs("--output-dir", &m_outputDir, "--failure-log", &m_failureLog, "--workers", &m_workers,
                 "--flush-interval", &m_flushInterval, "--max-attempts", &m_maxAttempts, "--delay", &m_delay,
                 "--max-backoff", &m_maxBackoff, "--timeout", &m_timeout, "--user-agent", &m_userAgent,
                 "--file-url-base", &m_fileURLBase);
}

string DownloadFlags::failureLog() const {
  if (!m_failureLog.empty()) {
    return m_failureLog;
  } else if (!m_outputDir.empty()) {
    return wbl::joinPaths(m_outputDir, "failed.txt");
  }
  return string();
}

DownloadOptions DownloadFlags::downloadOptions() const {
  return {
      .outputDir = m_outputDir,
      .failureLog = failureLog(),
      .fileURLBase = m_fileURLBase,
      .numWorkers = m_workers,
      .flushInterval = m_flushInterval,
      .maxAttempts = m_maxAttempts,
      .baseDelaySeconds = m_delay,
      .maxBackoffSeconds = m_maxBackoff,
  };
}

HTTPFetcherOptions DownloadFlags::fetcherOptions() const {
  return {.userAgent = m_userAgent, .timeoutSeconds = m_timeout};
}

void DownloadFlags::checkRequiredFlags() const {
  if (m_outputDir.empty()) {
    throw wbl::FlagParsingError("--output-dir is required to download files");
  } else if (m_workers < 1) {
    throw wbl::FlagParsingError("--workers must be at least 1");
  } else if (m_flushInterval < 1) {
    throw wbl::FlagParsingError("--flush-interval must be at least 1");
  } else if (m_maxAttempts < 1) {
    throw wbl::FlagParsingError("--max-attempts must be at least 1");
  } else if (m_timeout < 1) {
    throw wbl::FlagParsingError("--timeout must be at least 1");
  } else if (m_delay < 0 || m_maxBackoff < 0) {
    throw wbl::FlagParsingError("--delay and --max-backoff must not be negative");
  }
}

vector<string> parseCategoryList(string_view content) {
  vector<string> categories;
  for (string_view line : wbl::splitLines(content)) {
    line = wbl::trim(line);
    if (!line.empty() && line[0] != '#') {
      categories.emplace_back(line);
    }
  }
  return categories;
}

vector<string> readCategoryFile(const string& path) {
  return parseCategoryList(wbl::readFile(path));
}

ResolutionResult fetchCategories(ProgressIndex& index, const vector<string>& categories, const DumpFiles& dumps,
                                 const ResolverOptions& options) {
  CategoryResolver resolver(dumps, options);
  ResolutionResult result = resolver.resolve(categories, index.processedCategories());
  MergeStats mergeStats = index.merge(result.files, result.categories);
  index.flush();
  WBL_INFO << "Fetch finished: " << result.categories.size() << " categories resolved (" << mergeStats.newCategories
           << " new), " << result.files.size() << " files found (" << mergeStats.newFiles << " new), "
           << result.skippedCategories.size() << " categories skipped, " << result.notFoundCategories.size()
           << " not found, " << result.malformedRows << " malformed rows";
  if (!result.notFoundCategories.empty()) {
    WBL_WARNING << "Categories not found: " << wbl::join(result.notFoundCategories, ", ");
  }
  return result;
}

DownloadStats downloadPendingFiles(ProgressIndex& index, const FetcherFactory& fetcherFactory,
                                   const DownloadOptions& options) {
  vector<string> titles = index.pendingFiles();
  if (titles.empty()) {
    WBL_INFO << "No file to download";
    return DownloadStats();
  }
  DownloadEngine engine(index, fetcherFactory, options);
  return engine.run(titles);
}

string describeStatus(const ProgressIndex& index) {
  StatusCounts counts = index.countByStatus();
  return wbl::concat("Index: ", index.path(), "\n", "Processed categories: ",
                     std::to_string(index.processedCategories().size()), "\n", "Files: ",
                     std::to_string(index.numFiles()), " (downloaded: ", std::to_string(counts.downloaded),
                     ", pending: ", std::to_string(counts.pending), ", invalid: ", std::to_string(counts.invalid),
                     ")\n");
}

void cleanState(const string& indexFile, const string& failureLog) {
  wbl::removeFile(indexFile, false);
  WBL_INFO << "Removed '" << indexFile << "'";
  if (!failureLog.empty()) {
    wbl::removeFile(failureLog, false);
    WBL_INFO << "Removed '" << failureLog << "'";
  }
}

}  // namespace wikibulk
