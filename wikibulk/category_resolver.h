// Resolution of a list of categories to the media files they contain, from the SQL dumps of Wikimedia Commons.
//
// The join is linktarget (category title -> link target id), categorylinks (link target id -> member page ids) and
// page (page id -> namespace and title). Subcategories are followed recursively unless disabled.
#ifndef WIKIBULK_CATEGORY_RESOLVER_H
#define WIKIBULK_CATEGORY_RESOLVER_H

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <re2/re2.h>
#include "wbl/error.h"
#include "relations.h"

namespace wikibulk {

// A requested category has no link target in the dump, i.e. no page was ever put in it.
class CategoryNotFoundError : public wbl::Error {
public:
  using Error::Error;
};

struct DumpFiles {
  std::string linkTarget;
  std::string categoryLinks;
  std::string page;
};

// Paths "<dumpsDir>/<prefix>-linktarget.sql.gz", "<dumpsDir>/<prefix>-categorylinks.sql.gz" and
// "<dumpsDir>/<prefix>-page.sql.gz".
DumpFiles getDumpFiles(const std::string& dumpsDir, const std::string& prefix);

// Ids of the link targets of a category ("Category:<key>").
// Throws: CategoryNotFoundError.
std::vector<int64_t> findCategoryIds(const LinkTargetTable& linkTargets, const std::string& category);

// Returns `roots` followed by their subcategories in breadth-first order, each category once. Categories in
// `excluded` are neither returned nor expanded. If `recursive` is false, only returns the roots.
std::vector<std::string> expandCategories(const std::vector<std::string>& roots, const std::set<std::string>& excluded,
                                          const LinkTargetTable& linkTargets, const CategoryMembership& membership,
                                          const PageTable& pages, bool recursive);

// Files that are direct members of `categories`, each with the first category of the list that contains it.
// If fileFilter is not null, only titles with a partial match are kept.
std::vector<ResolvedFile> collectFiles(const std::vector<std::string>& categories, const LinkTargetTable& linkTargets,
                                       const CategoryMembership& membership, const PageTable& pages,
                                       const re2::RE2* fileFilter);

struct ResolverOptions {
  bool recursive = true;
  // RE2 regular expression. Empty means no filter.
  std::string fileFilter;
};

struct ResolutionResult {
  std::vector<ResolvedFile> files;
  // Categories that were resolved in this run (requested or discovered), in traversal order.
  std::vector<std::string> categories;
  // Requested categories that were already processed by a previous run.
  std::vector<std::string> skippedCategories;
  std::vector<std::string> notFoundCategories;
  int64_t malformedRows = 0;
};

class CategoryResolver {
public:
  // Throws: wbl::ParseError if the file filter is not a valid regular expression.
  CategoryResolver(const DumpFiles& dumps, const ResolverOptions& options);
  ~CategoryResolver();

  // Normalizes `requestedCategories` and resolves those that are not in `processedCategories`.
  // Dumps are not read at all if there is nothing to resolve.
  // Throws: mwd::DumpFormatError.
  ResolutionResult resolve(const std::vector<std::string>& requestedCategories,
                           const std::set<std::string>& processedCategories);

private:
  DumpFiles m_dumps;
  bool m_recursive;
  std::unique_ptr<re2::RE2> m_fileFilter;
};

}  // namespace wikibulk

#endif
