// In-memory views of the three tables joined to resolve categories: linktarget, categorylinks and page.
// Each extract* function does a single pass over a dump and keeps the rows accepted by a filter.
#ifndef WIKIBULK_RELATIONS_H
#define WIKIBULK_RELATIONS_H

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "mwdump/sql_dump.h"

namespace wikibulk {

enum class MembershipKind {
  FILE,
  SUBCATEGORY,
  PAGE,
};

// Parses the value of cl_type ("file", "subcat" or "page").
// Throws: mwd::RowParseError.
MembershipKind parseMembershipKind(std::string_view value);

struct LinkTarget {
  int64_t id = 0;
  int ns = 0;
  std::string title;
};

// Page fromPageId is a member of the category that toLinkTargetId resolves to.
struct CategoryEdge {
  int64_t fromPageId = 0;
  int64_t toLinkTargetId = 0;
  MembershipKind kind = MembershipKind::PAGE;
};

struct Page {
  int64_t id = 0;
  int ns = 0;
  std::string title;
};

// A media file (title without the "File:" prefix) and the first category through which it was found.
struct ResolvedFile {
  std::string title;
  std::string category;
};

struct ExtractionStats {
  int64_t rowsRead = 0;
  int64_t rowsKept = 0;
  int64_t malformedRows = 0;
};

class LinkTargetTable {
public:
  void add(LinkTarget linkTarget);
  // Returns nullptr if there is no link target with this id.
  const LinkTarget* find(int64_t id) const;
  // Ids of the link targets (ns, title). There is normally at most one, but the table has no unique constraint that
  // the dump would let us rely on.
  std::vector<int64_t> findIds(int ns, const std::string& title) const;
  size_t size() const { return m_byId.size(); }

private:
  std::unordered_map<int64_t, LinkTarget> m_byId;
  std::unordered_map<std::string, std::vector<int64_t>> m_idsByTitle;
};

class CategoryMembership {
public:
  struct Member {
    int64_t pageId = 0;
    MembershipKind kind = MembershipKind::PAGE;
  };

  void add(const CategoryEdge& edge);
  // Members of the category with this link target id, in dump order.
  const std::vector<Member>& membersOf(int64_t linkTargetId) const;
  // Ids of all pages that are a member of at least one category.
  std::unordered_set<int64_t> memberPageIds() const;
  int64_t numEdges() const { return m_numEdges; }

private:
  std::unordered_map<int64_t, std::vector<Member>> m_members;
  int64_t m_numEdges = 0;
};

class PageTable {
public:
  void add(Page page);
  // Returns nullptr if there is no page with this id.
  const Page* find(int64_t id) const;
  bool contains(int64_t id) const { return m_pages.count(id) != 0; }
  size_t size() const { return m_pages.size(); }

private:
  std::unordered_map<int64_t, Page> m_pages;
};

using LinkTargetFilter = std::function<bool(const LinkTarget&)>;
using CategoryEdgeFilter = std::function<bool(const CategoryEdge&)>;
using PageFilter = std::function<bool(const Page&)>;

// Reads rows (lt_id, lt_namespace, lt_title) until the end of the dump.
// Throws: mwd::DumpFormatError.
ExtractionStats extractLinkTargets(mwd::SqlDumpReader& reader, const LinkTargetFilter& filter,
                                   LinkTargetTable& linkTargets);
// Reads rows (cl_from, cl_sortkey, cl_timestamp, cl_sortkey_prefix, cl_type, cl_collation_id, cl_target_id) until the
// end of the dump.
// Throws: mwd::DumpFormatError.
ExtractionStats extractCategoryEdges(mwd::SqlDumpReader& reader, const CategoryEdgeFilter& filter,
                                     CategoryMembership& membership);
// Reads rows (page_id, page_namespace, page_title, ...) until the end of the dump.
// Throws: mwd::DumpFormatError.
ExtractionStats extractPages(mwd::SqlDumpReader& reader, const PageFilter& filter, PageTable& pages);

}  // namespace wikibulk

#endif
