// Downloads the media files of a list of Wikimedia Commons categories, using the SQL dumps to resolve categories.
// Usage:
//   wikibulk fetch --category-file=categories.txt --dumps-dir=dumps
//   wikibulk download --output-dir=images
//   wikibulk run --category-file=categories.txt --dumps-dir=dumps --output-dir=images
//   wikibulk status
//   wikibulk clean --output-dir=images
#include <iostream>
#include <memory>
#include <string>
#include "mwdump/sql_dump.h"
#include "wbl/args_parser.h"
#include "wbl/error.h"
#include "wbl/log.h"
#include "fetcher.h"
#include "progress_index.h"
#include "wikibulk_lib.h"

using std::string;
using namespace wikibulk;

static void runCommand(const string& command, const string& indexFile, const FetchFlags& fetchFlags,
                       const DownloadFlags& downloadFlags) {
  bool fetch = command == "fetch" || command == "run";
  bool download = command == "download" || command == "run";
  if (fetch) {
    fetchFlags.checkRequiredFlags();
  }
  if (download) {
    downloadFlags.checkRequiredFlags();
  }
  if (fetch || download) {
    ProgressIndex index(indexFile);
    if (fetch) {
      fetchCategories(index, readCategoryFile(fetchFlags.categoryFile()), fetchFlags.dumpFiles(),
                      fetchFlags.resolverOptions());
    }
    if (download) {
      HTTPFetcherOptions fetcherOptions = downloadFlags.fetcherOptions();
      downloadPendingFiles(
          index, [fetcherOptions]() { return std::make_unique<HTTPFetcher>(fetcherOptions); },
          downloadFlags.downloadOptions());
    }
  } else if (command == "status") {
    ProgressIndex index(indexFile);
    std::cout << describeStatus(index);
  } else if (command == "clean") {
    cleanState(indexFile, downloadFlags.failureLog());
  } else {
    throw wbl::FlagParsingError("Unknown command '" + command + "' (expected run, fetch, download, status or clean)");
  }
}

int main(int argc, char** argv) {
  string command;
  string indexFile = DEFAULT_INDEX_FILE;
  FetchFlags fetchFlags;
  DownloadFlags downloadFlags;
  try {
    wbl::parseArgs(argc, argv, "command", &command, "--index-file", &indexFile, &fetchFlags, &downloadFlags);
    runCommand(command, indexFile, fetchFlags, downloadFlags);
  } catch (const wbl::FlagParsingError& error) {
    WBL_FATAL << error.what() << " (see --help)";
  } catch (const mwd::DumpFormatError& error) {
    WBL_FATAL << "Cannot read dump: " << error.what();
  } catch (const wbl::Error& error) {
    WBL_FATAL << error.what();
  }
  return 0;
}
