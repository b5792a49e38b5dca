// Persistent state shared by successive runs: categories already resolved and files already discovered, with their
// download status.
//
// On disk, the index is a JSON document:
//   {
//     "version": 1,
//     "processedCategories": ["Category:Cats"],
//     "files": {"Cat1.jpg": {"status": "pending", "category": "Category:Cats"}}
//   }
// Fields unknown to this version, at the top level or in a file entry, are kept as is when the index is rewritten.
//
// All methods can be called from several threads at the same time.
#ifndef WIKIBULK_PROGRESS_INDEX_H
#define WIKIBULK_PROGRESS_INDEX_H

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "wbl/error.h"
#include "relations.h"

namespace wikibulk {

// The index file exists but cannot be interpreted. The file is never overwritten in that case.
class IndexCorruptError : public wbl::Error {
public:
  using Error::Error;
};

enum class FileStatus {
  PENDING,
  DOWNLOADED,
  INVALID,
};

const char* fileStatusToString(FileStatus status);
// Returns std::nullopt if `value` is not the name of a status.
std::optional<FileStatus> parseFileStatus(std::string_view value);

struct FileEntry {
  FileStatus status = FileStatus::PENDING;
  std::string category;
};

struct StatusCounts {
  int64_t pending = 0;
  int64_t downloaded = 0;
  int64_t invalid = 0;
};

struct MergeStats {
  int64_t newFiles = 0;
  int64_t newCategories = 0;
};

// Minimum time between two writes triggered by flushIfDirty().
constexpr std::chrono::milliseconds DEFAULT_MIN_FLUSH_INTERVAL = std::chrono::seconds(5);

class ProgressIndex {
public:
  // Loads the index from `path`, or starts with an empty index if the file does not exist. Nothing is written until
  // flush() is called.
  // Throws: IndexCorruptError, wbl::SystemError.
  explicit ProgressIndex(const std::string& path);
  ProgressIndex(const ProgressIndex&) = delete;
  ProgressIndex& operator=(const ProgressIndex&) = delete;

  // Adds files and processed categories that are not in the index yet. Existing entries keep their status and
  // category.
  MergeStats merge(const std::vector<ResolvedFile>& files, const std::vector<std::string>& processedCategories);
  // Throws: wbl::InvalidStateError if the file is not in the index.
  void markStatus(const std::string& title, FileStatus status);

  // Writes the index atomically. The state is copied under the lock and serialized outside of it, so markStatus()
  // is not blocked while the file is written.
  // Throws: wbl::SystemError.
  void flush();
  // Calls flush() if at least `batchSize` status updates happened since the last write and the last write is older
  // than the minimum flush interval. Returns false without waiting if another thread is writing the index.
  // Throws: wbl::SystemError.
  bool flushIfDirty(int batchSize);
  void setMinFlushInterval(std::chrono::milliseconds interval);
  // Number of times the index file was written by this object.
  int64_t numWrites() const;

  // Titles of files whose status is not DOWNLOADED, sorted.
  std::vector<std::string> pendingFiles() const;
  StatusCounts countByStatus() const;
  bool isProcessed(const std::string& category) const;
  std::set<std::string> processedCategories() const;
  std::optional<FileEntry> getFile(const std::string& title) const;
  int64_t numFiles() const;
  const std::string& path() const { return m_path; }

private:
  void load(std::string_view content);
  // m_flushMutex must be held.
  void writeSnapshot();
  std::string serialize(const std::set<std::string>& processedCategories,
                        const std::map<std::string, FileEntry>& files) const;

  const std::string m_path;
  mutable std::mutex m_mutex;
  std::set<std::string> m_processedCategories;
  std::map<std::string, FileEntry> m_files;
  // Unknown fields, serialized. Only modified by the constructor.
  std::map<std::string, std::string> m_extraFields;
  std::map<std::string, std::map<std::string, std::string>> m_extraFileFields;
  int m_updatesSinceFlush = 0;

  // Taken before m_mutex. Guards the fields below.
  mutable std::mutex m_flushMutex;
  std::chrono::milliseconds m_minFlushInterval = DEFAULT_MIN_FLUSH_INTERVAL;
  std::optional<std::chrono::steady_clock::time_point> m_lastWrite;
  int64_t m_numWrites = 0;
};

}  // namespace wikibulk

#endif
