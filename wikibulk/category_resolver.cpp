#include "category_resolver.h"
#include <cstdint>
#include <deque>
#include <memory>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include <re2/re2.h>
#include "mwdump/sql_dump.h"
#include "mwdump/titles.h"
#include "wbl/error.h"
#include "wbl/log.h"
#include "wbl/path.h"
#include "relations.h"

using mwd::NS_CATEGORY;
using mwd::NS_FILE;
using mwd::SqlDumpReader;
using std::set;
using std::string;
using std::unordered_set;
using std::vector;

namespace wikibulk {

static void logExtraction(const char* table, const ExtractionStats& stats) {
  WBL_INFO << table << ": " << stats.rowsRead << " rows read, " << stats.rowsKept << " kept, " << stats.malformedRows
           << " malformed";
}

DumpFiles getDumpFiles(const string& dumpsDir, const string& prefix) {
  return {
      .linkTarget = wbl::joinPaths(dumpsDir, prefix + "-linktarget.sql.gz"),
      .categoryLinks = wbl::joinPaths(dumpsDir, prefix + "-categorylinks.sql.gz"),
      .page = wbl::joinPaths(dumpsDir, prefix + "-page.sql.gz"),
  };
}

vector<int64_t> findCategoryIds(const LinkTargetTable& linkTargets, const string& category) {
  vector<int64_t> ids = linkTargets.findIds(NS_CATEGORY, string(mwd::getCategoryKey(category)));
  if (ids.empty()) {
    throw CategoryNotFoundError("Category not found in the linktarget dump: '" + category + "'");
  }
  return ids;
}

vector<string> expandCategories(const vector<string>& roots, const set<string>& excluded,
                                const LinkTargetTable& linkTargets, const CategoryMembership& membership,
                                const PageTable& pages, bool recursive) {
  vector<string> categories;
  unordered_set<string> visited(excluded.begin(), excluded.end());
  for (const string& root : roots) {
    if (visited.insert(root).second) {
      categories.push_back(root);
    }
  }
  if (!recursive) {
    return categories;
  }
  // `categories` doubles as the BFS queue.
  for (size_t i = 0; i < categories.size(); i++) {
    string key(mwd::getCategoryKey(categories[i]));
    for (int64_t linkTargetId : linkTargets.findIds(NS_CATEGORY, key)) {
      for (const CategoryMembership::Member& member : membership.membersOf(linkTargetId)) {
        if (member.kind != MembershipKind::SUBCATEGORY) continue;
        const Page* page = pages.find(member.pageId);
        if (page == nullptr || page->ns != NS_CATEGORY) continue;
        string subcategory = mwd::makeCategoryTitle(page->title);
        if (visited.insert(subcategory).second) {
          categories.push_back(std::move(subcategory));
        }
      }
    }
  }
  return categories;
}

vector<ResolvedFile> collectFiles(const vector<string>& categories, const LinkTargetTable& linkTargets,
                                  const CategoryMembership& membership, const PageTable& pages,
                                  const re2::RE2* fileFilter) {
  vector<ResolvedFile> files;
  unordered_set<string> seenTitles;
  for (const string& category : categories) {
    string key(mwd::getCategoryKey(category));
    for (int64_t linkTargetId : linkTargets.findIds(NS_CATEGORY, key)) {
      for (const CategoryMembership::Member& member : membership.membersOf(linkTargetId)) {
        if (member.kind != MembershipKind::FILE) continue;
        const Page* page = pages.find(member.pageId);
        if (page == nullptr || page->ns != NS_FILE) continue;
        if (fileFilter != nullptr && !re2::RE2::PartialMatch(page->title, *fileFilter)) continue;
        if (seenTitles.insert(page->title).second) {
          files.push_back({.title = page->title, .category = category});
        }
      }
    }
  }
  return files;
}

CategoryResolver::CategoryResolver(const DumpFiles& dumps, const ResolverOptions& options)
    : m_dumps(dumps), m_recursive(options.recursive) {
  if (!options.fileFilter.empty()) {
    m_fileFilter = std::make_unique<re2::RE2>(options.fileFilter, re2::RE2::Quiet);
    if (!m_fileFilter->ok()) {
      throw wbl::ParseError("Invalid file filter '" + options.fileFilter + "': " + m_fileFilter->error());
    }
  }
}

CategoryResolver::~CategoryResolver() {}

ResolutionResult CategoryResolver::resolve(const vector<string>& requestedCategories,
                                           const set<string>& processedCategories) {
  ResolutionResult result;
  vector<string> pendingCategories;
  set<string> pendingKeys;
  for (const string& requestedCategory : requestedCategories) {
    string category = mwd::normalizeCategoryTitle(requestedCategory);
    if (category.empty()) {
      WBL_WARNING << "Ignoring invalid category name '" << requestedCategory << "'";
    } else if (processedCategories.count(category) != 0) {
      result.skippedCategories.push_back(category);
    } else if (pendingKeys.insert(string(mwd::getCategoryKey(category))).second) {
      pendingCategories.push_back(category);
    }
  }
  if (!result.skippedCategories.empty()) {
    WBL_INFO << result.skippedCategories.size() << " categories already processed by a previous run";
  }
  if (pendingCategories.empty()) {
    WBL_INFO << "No new category to resolve";
    return result;
  }

  LinkTargetTable linkTargets;
  SqlDumpReader linkTargetReader(m_dumps.linkTarget, "linktarget");
  ExtractionStats stats = extractLinkTargets(
      linkTargetReader,
      [&](const LinkTarget& linkTarget) {
        return linkTarget.ns == NS_CATEGORY && (m_recursive || pendingKeys.count(linkTarget.title) != 0);
      },
      linkTargets);
  logExtraction("linktarget", stats);
  result.malformedRows += stats.malformedRows;

  vector<string> roots;
  unordered_set<int64_t> rootIds;
  for (const string& category : pendingCategories) {
    try {
      vector<int64_t> ids = findCategoryIds(linkTargets, category);
      rootIds.insert(ids.begin(), ids.end());
      roots.push_back(category);
    } catch (const CategoryNotFoundError& error) {
      WBL_WARNING << error.what();
      result.notFoundCategories.push_back(category);
    }
  }
  if (roots.empty()) {
    return result;
  }

  CategoryMembership membership;
  SqlDumpReader categoryLinksReader(m_dumps.categoryLinks, "categorylinks");
  stats = extractCategoryEdges(
      categoryLinksReader,
      [&](const CategoryEdge& edge) {
        if (edge.kind == MembershipKind::FILE) {
          return rootIds.count(edge.toLinkTargetId) != 0;
        }
        return m_recursive && edge.kind == MembershipKind::SUBCATEGORY && linkTargets.find(edge.toLinkTargetId);
      },
      membership);
  logExtraction("categorylinks", stats);
  result.malformedRows += stats.malformedRows;

  PageTable pages;
  unordered_set<int64_t> pageIds = membership.memberPageIds();
  SqlDumpReader pageReader(m_dumps.page, "page");
  stats = extractPages(
      pageReader, [&](const Page& page) { return pageIds.count(page.id) != 0; }, pages);
  logExtraction("page", stats);
  result.malformedRows += stats.malformedRows;

  result.categories =
      expandCategories(roots, processedCategories, linkTargets, membership, pages, m_recursive);
  if (result.categories.size() > roots.size()) {
    WBL_INFO << "Found " << result.categories.size() - roots.size() << " subcategories";
    unordered_set<int64_t> subcategoryIds;
    for (size_t i = roots.size(); i < result.categories.size(); i++) {
      for (int64_t id : linkTargets.findIds(NS_CATEGORY, string(mwd::getCategoryKey(result.categories[i])))) {
        subcategoryIds.insert(id);
      }
    }
    if (!subcategoryIds.empty()) {
      // The first pass only kept files of the requested categories.
      categoryLinksReader.rewind();
      stats = extractCategoryEdges(
          categoryLinksReader,
          [&](const CategoryEdge& edge) {
            return edge.kind == MembershipKind::FILE && subcategoryIds.count(edge.toLinkTargetId) != 0;
          },
          membership);
      logExtraction("categorylinks (subcategories)", stats);
      result.malformedRows += stats.malformedRows;

      pageIds = membership.memberPageIds();
      pageReader.rewind();
      stats = extractPages(
          pageReader, [&](const Page& page) { return !pages.contains(page.id) && pageIds.count(page.id) != 0; },
          pages);
      logExtraction("page (subcategories)", stats);
      result.malformedRows += stats.malformedRows;
    }
  }

  result.files = collectFiles(result.categories, linkTargets, membership, pages, m_fileFilter.get());
  WBL_INFO << "Resolved " << result.categories.size() << " categories to " << result.files.size() << " files";
  return result;
}

}  // namespace wikibulk
