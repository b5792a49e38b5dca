#include "progress_index.h"
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
#include "wbl/file.h"
#include "wbl/json.h"
#include "wbl/log.h"

using std::string;
using std::string_view;
using std::vector;

namespace wikibulk {

static constexpr int INDEX_VERSION = 1;

const char* fileStatusToString(FileStatus status) {
  switch (status) {
    case FileStatus::PENDING:
      return "pending";
    case FileStatus::DOWNLOADED:
      return "downloaded";
    case FileStatus::INVALID:
      return "invalid";
  }
  throw wbl::InternalError("Invalid FileStatus " + std::to_string(static_cast<int>(status)));
}

std::optional<FileStatus> parseFileStatus(string_view value) {
  if (value == "pending") {
    return FileStatus::PENDING;
  } else if (value == "downloaded") {
    return FileStatus::DOWNLOADED;
  } else if (value == "invalid") {
    return FileStatus::INVALID;
  }
  return std::nullopt;
}

ProgressIndex::ProgressIndex(const string& path) : m_path(path) {
  string content;
  try {
    content = wbl::readFile(path);
  } catch (const wbl::FileNotFoundError&) {
    WBL_INFO << "No index at '" << path << "', starting with an empty one";
    return;
  }
  try {
    load(content);
  } catch (const wbl::ParseError& error) {
    throw IndexCorruptError("Cannot load the index '" + path + "': " + error.what());
  }
}

// Throws: wbl::ParseError.
void ProgressIndex::load(string_view content) {
  json::Value document = json::parse(content);
  if (!document.isObject()) {
    throw wbl::ParseError("the root is not an object");
  }
  for (auto& [key, value] : document) {
    if (key == "version") {
      if (!value.isNumber() || value.numberAsInt64() < 1) {
        throw wbl::ParseError("invalid version");
      } else if (value.numberAsInt64() > INDEX_VERSION) {
        WBL_WARNING << "Index '" << m_path << "' has version " << value.numberAsInt64() << ", newer than "
                    << INDEX_VERSION;
      }
    } else if (key == "processedCategories") {
      if (!value.isArray()) {
        throw wbl::ParseError("processedCategories is not an array");
      }
      for (const json::Value& category : value.array()) {
        if (!category.isString()) {
          throw wbl::ParseError("processedCategories contains a value that is not a string");
        }
        m_processedCategories.insert(category.str());
      }
    } else if (key == "files") {
      if (!value.isObject()) {
        throw wbl::ParseError("files is not an object");
      }
      for (const auto& [title, jsonEntry] : value.object()) {
        const json::Value& status = jsonEntry["status"];
        const json::Value& category = jsonEntry["category"];
        if (!jsonEntry.isObject() || !status.isString() || !(category.isString() || category.isNull())) {
          throw wbl::ParseError("invalid entry for file '" + title + "'");
        }
        std::optional<FileStatus> parsedStatus = parseFileStatus(status.str());
        if (!parsedStatus) {
          throw wbl::ParseError("invalid status '" + status.str() + "' for file '" + title + "'");
        }
        m_files[title] = {.status = *parsedStatus, .category = category.isString() ? category.str() : ""};
        for (const auto& [fieldName, fieldValue] : jsonEntry.object()) {
          if (fieldName != "status" && fieldName != "category") {
            m_extraFileFields[title][fieldName] = fieldValue.toJSON();
          }
        }
      }
    } else {
      m_extraFields[key] = value.toJSON();
    }
  }
}

MergeStats ProgressIndex::merge(const vector<ResolvedFile>& files, const vector<string>& processedCategories) {
  std::lock_guard<std::mutex> lock(m_mutex);
  MergeStats stats;
  for (const ResolvedFile& file : files) {
    if (m_files.emplace(file.title, FileEntry{.status = FileStatus::PENDING, .category = file.category}).second) {
      stats.newFiles++;
    }
  }
  for (const string& category : processedCategories) {
    if (m_processedCategories.insert(category).second) {
      stats.newCategories++;
    }
  }
  return stats;
}

void ProgressIndex::markStatus(const string& title, FileStatus status) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_files.find(title);
  if (it == m_files.end()) {
    throw wbl::InvalidStateError("Cannot set the status of '" + title + "' because it is not in the index");
  }
  it->second.status = status;
  m_updatesSinceFlush++;
}

string ProgressIndex::serialize(const std::set<string>& processedCategories,
                               const std::map<string, FileEntry>& files) const {
  json::Value document;
  for (const auto& [key, serializedValue] : m_extraFields) {
    document.getMutable(key) = json::parse(serializedValue);
  }
  document.getMutable("version") = INDEX_VERSION;
  json::Value& jsonCategories = document.getMutable("processedCategories");
  jsonCategories.setToEmptyArray();
  for (const string& category : processedCategories) {
    jsonCategories.addItem() = category;
  }
  json::Value& jsonFiles = document.getMutable("files");
  jsonFiles.setToEmptyObject();
  for (const auto& [title, entry] : files) {
    json::Value& jsonEntry = jsonFiles.getMutable(title);
    auto extraFieldsIt = m_extraFileFields.find(title);
    if (extraFieldsIt != m_extraFileFields.end()) {
      for (const auto& [fieldName, serializedValue] : extraFieldsIt->second) {
        jsonEntry.getMutable(fieldName) = json::parse(serializedValue);
      }
    }
    jsonEntry.getMutable("status") = fileStatusToString(entry.status);
    jsonEntry.getMutable("category") = entry.category;
  }
  return document.toJSON(json::INDENTED) + "\n";
}

void ProgressIndex::writeSnapshot() {
  std::set<string> processedCategories;
  std::map<string, FileEntry> files;
  int numUpdates = 0;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    processedCategories = m_processedCategories;
    files = m_files;
    numUpdates = m_updatesSinceFlush;
    m_updatesSinceFlush = 0;
  }
  try {
    wbl::writeFileAtomically(m_path, serialize(processedCategories, files));
  } catch (const wbl::Error&) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_updatesSinceFlush += numUpdates;
    throw;
  }
  m_lastWrite = std::chrono::steady_clock::now();
  m_numWrites++;
}

void ProgressIndex::flush() {
  std::lock_guard<std::mutex> flushLock(m_flushMutex);
  writeSnapshot();
}

bool ProgressIndex::flushIfDirty(int batchSize) {
  std::unique_lock<std::mutex> flushLock(m_flushMutex, std::try_to_lock);
  if (!flushLock.owns_lock()) {
    return false;
  } else if (m_lastWrite && std::chrono::steady_clock::now() - *m_lastWrite < m_minFlushInterval) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_updatesSinceFlush == 0 || m_updatesSinceFlush < batchSize) {
      return false;
    }
  }
  writeSnapshot();
  return true;
}

void ProgressIndex::setMinFlushInterval(std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> flushLock(m_flushMutex);
  m_minFlushInterval = interval;
}

int64_t ProgressIndex::numWrites() const {
  std::lock_guard<std::mutex> flushLock(m_flushMutex);
  return m_numWrites;
}

vector<string> ProgressIndex::pendingFiles() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  vector<string> titles;
  for (const auto& [title, entry] : m_files) {
    if (entry.status != FileStatus::DOWNLOADED) {
      titles.push_back(title);
    }
  }
  return titles;
}

StatusCounts ProgressIndex::countByStatus() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  StatusCounts counts;
  for (const auto& [title, entry] : m_files) {
    switch (entry.status) {
      case FileStatus::PENDING:
        counts.pending++;
        break;
      case FileStatus::DOWNLOADED:
        counts.downloaded++;
        break;
      case FileStatus::INVALID:
        counts.invalid++;
        break;
    }
  }
  return counts;
}

bool ProgressIndex::isProcessed(const string& category) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_processedCategories.count(category) != 0;
}

std::set<string> ProgressIndex::processedCategories() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_processedCategories;
}

std::optional<FileEntry> ProgressIndex::getFile(const string& title) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_files.find(title);
  if (it == m_files.end()) {
    return std::nullopt;
  }
  return it->second;
}

int64_t ProgressIndex::numFiles() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_files.size();
}

}  // namespace wikibulk
