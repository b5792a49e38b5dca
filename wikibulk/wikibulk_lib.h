// Commands of the wikibulk tool: resolution of categories from dumps ("fetch"), download of the files found
// ("download"), both ("run"), summary of the index ("status") and removal of the state files ("clean").
#ifndef WIKIBULK_WIKIBULK_LIB_H
#define WIKIBULK_WIKIBULK_LIB_H

#include <string>
#include <string_view>
#include <vector>
#include "wbl/args_parser.h"
#include "category_resolver.h"
#include "download_engine.h"
#include "fetcher.h"
#include "progress_index.h"

namespace wikibulk {

constexpr const char DEFAULT_INDEX_FILE[] = "wikibulk_index.json";
constexpr const char DEFAULT_DUMP_PREFIX[] = "commonswiki-latest";
constexpr const char DEFAULT_USER_AGENT[] = "wikibulk/1.0 (bulk download of Wikimedia Commons categories)";

// Flags of the fetch phase.
class FetchFlags : public wbl::FlagsConsumer {
public:
  void declareFlags(wbl::ArgsParser& parser) override;

  const std::string& categoryFile() const { return m_categoryFile; }
  DumpFiles dumpFiles() const;
  ResolverOptions resolverOptions() const;
  // Throws: wbl::FlagParsingError if a flag required for the fetch phase is missing.
  void checkRequiredFlags() const;

private:
  std::string m_categoryFile;
  std::string m_dumpsDir;
  std::string m_dumpPrefix = DEFAULT_DUMP_PREFIX;
  bool m_noRecursiveSearch = false;
  std::string m_fileFilter;
};

// Flags of the download phase.
class DownloadFlags : public wbl::FlagsConsumer {
public:
  void declareFlags(wbl::ArgsParser& parser) override;

  const std::string& outputDir() const { return m_outputDir; }
  // --failure-log, or "failed.txt" in the output directory. Empty if neither is set.
  std::string failureLog() const;
  DownloadOptions downloadOptions() const;
  HTTPFetcherOptions fetcherOptions() const;
  // Throws: wbl::FlagParsingError if a flag required for the download phase is missing or invalid.
  void checkRequiredFlags() const;

private:
  std::string m_outputDir;
  std::string m_failureLog;
  int m_workers = 10;
  int m_flushInterval = 100;
  int m_maxAttempts = 5;
  double m_delay = 0;
  double m_maxBackoff = 60;
  int m_timeout = 300;
  std::string m_userAgent = DEFAULT_USER_AGENT;
  std::string m_fileURLBase = mwd::DEFAULT_FILE_URL_BASE;
};

// One category per line. Blank lines and lines starting with '#' are ignored.
std::vector<std::string> parseCategoryList(std::string_view content);
// Throws: wbl::FileNotFoundError, wbl::SystemError.
std::vector<std::string> readCategoryFile(const std::string& path);

// Resolves the categories that are not processed yet and adds the files found to the index, which is then flushed.
// Throws: mwd::DumpFormatError, wbl::ParseError (invalid file filter), wbl::SystemError.
ResolutionResult fetchCategories(ProgressIndex& index, const std::vector<std::string>& categories,
                                 const DumpFiles& dumps, const ResolverOptions& options);
// Downloads all files of the index that are not downloaded yet.
// Throws: wbl::SystemError.
DownloadStats downloadPendingFiles(ProgressIndex& index, const FetcherFactory& fetcherFactory,
                                   const DownloadOptions& options);
// Human-readable summary of the index.
std::string describeStatus(const ProgressIndex& index);
// Removes the index and the failure log. Downloaded files are kept.
// Throws: wbl::SystemError.
void cleanState(const std::string& indexFile, const std::string& failureLog);

}  // namespace wikibulk

#endif
