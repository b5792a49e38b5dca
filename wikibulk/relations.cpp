#include "relations.h"
#include <climits>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>
#include "mwdump/sql_dump.h"
#include "wbl/string.h"

using mwd::RowParseError;
using mwd::SqlDumpReader;
using mwd::SqlRow;
using std::string;
using std::string_view;
using std::vector;

namespace wikibulk {

static constexpr int LINKTARGET_COLUMNS = 3;
static constexpr int CATEGORYLINKS_COLUMNS = 7;
static constexpr int PAGE_MIN_COLUMNS = 3;

MembershipKind parseMembershipKind(string_view value) {
  if (value == "file") {
    return MembershipKind::FILE;
  } else if (value == "subcat") {
    return MembershipKind::SUBCATEGORY;
  } else if (value == "page") {
    return MembershipKind::PAGE;
  }
  throw RowParseError(wbl::concat("Invalid category link type '", value, "'"));
}

void LinkTargetTable::add(LinkTarget linkTarget) {
  m_idsByTitle[linkTarget.title].push_back(linkTarget.id);
  int64_t id = linkTarget.id;
  m_byId[id] = std::move(linkTarget);
}

const LinkTarget* LinkTargetTable::find(int64_t id) const {
  auto it = m_byId.find(id);
  return it == m_byId.end() ? nullptr : &it->second;
}

vector<int64_t> LinkTargetTable::findIds(int ns, const string& title) const {
  vector<int64_t> ids;
  auto it = m_idsByTitle.find(title);
  if (it != m_idsByTitle.end()) {
    for (int64_t id : it->second) {
      const LinkTarget* linkTarget = find(id);
      if (linkTarget != nullptr && linkTarget->ns == ns && linkTarget->title == title) {
        ids.push_back(id);
      }
    }
  }
  return ids;
}

void CategoryMembership::add(const CategoryEdge& edge) {
  m_members[edge.toLinkTargetId].push_back({.pageId = edge.fromPageId, .kind = edge.kind});
  m_numEdges++;
}

const vector<CategoryMembership::Member>& CategoryMembership::membersOf(int64_t linkTargetId) const {
  static const vector<Member> noMembers;
  auto it = m_members.find(linkTargetId);
  return it == m_members.end() ? noMembers : it->second;
}

std::unordered_set<int64_t> CategoryMembership::memberPageIds() const {
  std::unordered_set<int64_t> pageIds;
  for (const auto& [linkTargetId, members] : m_members) {
    for (const Member& member : members) {
      pageIds.insert(member.pageId);
    }
  }
  return pageIds;
}

void PageTable::add(Page page) {
  int64_t id = page.id;
  m_pages[id] = std::move(page);
}

const Page* PageTable::find(int64_t id) const {
  auto it = m_pages.find(id);
  return it == m_pages.end() ? nullptr : &it->second;
}

static int parseNamespace(const mwd::SqlValue& value) {
  int64_t ns = value.asInt64();
  if (ns < INT_MIN || ns > INT_MAX) {
    throw RowParseError("Namespace out of range: " + std::to_string(ns));
  }
  return static_cast<int>(ns);
}

// Runs `processRow` on every row of the dump, counting rows for which it throws RowParseError as malformed.
template <class ProcessRow>
static ExtractionStats extractRows(SqlDumpReader& reader, ProcessRow processRow) {
  ExtractionStats stats;
  int64_t initialRowsRead = reader.rowsRead();
  int64_t initialMalformedRows = reader.malformedRows();
  SqlRow row;
  while (reader.next(row)) {
    try {
      if (processRow(row)) {
        stats.rowsKept++;
      }
    } catch (const RowParseError& error) {
      reader.reportMalformedRow(error);
    }
  }
  stats.rowsRead = reader.rowsRead() - initialRowsRead;
  stats.malformedRows = reader.malformedRows() - initialMalformedRows;
  return stats;
}

ExtractionStats extractLinkTargets(SqlDumpReader& reader, const LinkTargetFilter& filter,
                                   LinkTargetTable& linkTargets) {
  return extractRows(reader, [&](const SqlRow& row) {
    if (row.size() != LINKTARGET_COLUMNS) {
      throw RowParseError("Unexpected number of columns in linktarget row: " + std::to_string(row.size()));
    }
    LinkTarget linkTarget{.id = row[0].asInt64(), .ns = parseNamespace(row[1]), .title = row[2].str()};
    if (!filter(linkTarget)) {
      return false;
    }
    linkTargets.add(std::move(linkTarget));
    return true;
  });
}

ExtractionStats extractCategoryEdges(SqlDumpReader& reader, const CategoryEdgeFilter& filter,
                                     CategoryMembership& membership) {
  return extractRows(reader, [&](const SqlRow& row) {
    if (row.size() != CATEGORYLINKS_COLUMNS) {
      throw RowParseError("Unexpected number of columns in categorylinks row: " + std::to_string(row.size()));
    }
    CategoryEdge edge{
        .fromPageId = row[0].asInt64(), .toLinkTargetId = row[6].asInt64(), .kind = parseMembershipKind(row[4].str())};
    if (!filter(edge)) {
      return false;
    }
    membership.add(edge);
    return true;
  });
}

ExtractionStats extractPages(SqlDumpReader& reader, const PageFilter& filter, PageTable& pages) {
  return extractRows(reader, [&](const SqlRow& row) {
    if (row.size() < PAGE_MIN_COLUMNS) {
      throw RowParseError("Unexpected number of columns in page row: " + std::to_string(row.size()));
    }
    Page page{.id = row[0].asInt64(), .ns = parseNamespace(row[1]), .title = row[2].str()};
    if (!filter(page)) {
      return false;
    }
    pages.add(std::move(page));
    return true;
  });
}

}  // namespace wikibulk
