#include "wikibulk/category_resolver.h"
#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include "mwdump/sql_dump.h"
#include "wbl/error.h"
#include "wbl/gzip_file.h"
#include "wbl/log.h"
#include "wbl/tempfile.h"
#include "wbl/unittest.h"

using std::set;
using std::string;
using std::vector;

namespace wikibulk {

// Category tree of the test dumps:
//   Cats: Cat1.jpg, subcategory Kittens, article Cat_article
//   Kittens: Kitten1.jpg, Cat1.jpg
//   Dogs: Dog1.jpg
//   A: A1.png, subcategory B
//   B: B1.jpg, subcategory A
const char LINKTARGET_DUMP[] =
    "INSERT INTO `linktarget` VALUES (1,14,'Cats'),(2,14,'Dogs'),(3,14,'Kittens'),(4,14,'A'),(5,14,'B'),"
    "(6,6,'Cat1.jpg');\n";
const char PAGE_DUMP[] =
    "INSERT INTO `page` VALUES (10,6,'Cat1.jpg',0,0,0.1,'20240101000000',NULL,1,10,NULL,NULL),"
    "(11,6,'Dog1.jpg',0,0,0.2,'20240101000000',NULL,2,10,NULL,NULL),"
    "(12,14,'Kittens',0,0,0.3,'20240101000000',NULL,3,10,NULL,NULL);\n"
    "INSERT INTO `page` VALUES (13,6,'Kitten1.jpg',0,0,0.4,'20240101000000',NULL,4,10,NULL,NULL),"
    "(14,14,'A',0,0,0.5,'20240101000000',NULL,5,10,NULL,NULL),"
    "(15,14,'B',0,0,0.6,'20240101000000',NULL,6,10,NULL,NULL),"
    "(16,6,'A1.png',0,0,0.7,'20240101000000',NULL,7,10,NULL,NULL),"
    "(17,6,'B1.jpg',0,0,0.8,'20240101000000',NULL,8,10,NULL,NULL),"
    "(18,0,'Cat_article',0,0,0.9,'20240101000000',NULL,9,10,NULL,NULL);\n";
const char CATEGORYLINKS_DUMP[] =
    "INSERT INTO `categorylinks` VALUES (10,'CAT1','2024-01-01 00:00:00','','file',1,1),"
    "(11,'DOG1','2024-01-01 00:00:00','','file',1,2),"
    "(12,'KITTENS','2024-01-01 00:00:00','','subcat',1,1),"
    "(13,'KITTEN1','2024-01-01 00:00:00','','file',1,3),"
    "(18,'CAT ARTICLE','2024-01-01 00:00:00','','page',1,1);\n"
    "INSERT INTO `categorylinks` VALUES (15,'B','2024-01-01 00:00:00','','subcat',1,4),"
    "(14,'A','2024-01-01 00:00:00','','subcat',1,5),"
    "(16,'A1','2024-01-01 00:00:00','','file',1,4),"
    "(17,'B1','2024-01-01 00:00:00','','file',1,5),"
    "(10,'CAT1','2024-01-01 00:00:00','','file',1,3);\n";

class CategoryResolverTest : public wbl::Test {
private:
  void setUp() override {
    m_dumps = getDumpFiles(m_tempDir.path(), "commonswiki-test");
    wbl::writeGzipFile(m_dumps.linkTarget, LINKTARGET_DUMP);
    wbl::writeGzipFile(m_dumps.categoryLinks, CATEGORYLINKS_DUMP);
    wbl::writeGzipFile(m_dumps.page, PAGE_DUMP);
  }

  ResolutionResult resolve(const vector<string>& categories, bool recursive,
                           const set<string>& processedCategories = {}, const string& fileFilter = "") {
    CategoryResolver resolver(m_dumps, {.recursive = recursive, .fileFilter = fileFilter});
    return resolver.resolve(categories, processedCategories);
  }

  // Formats files as "title<category;title<category;".
  static string formatFiles(const vector<ResolvedFile>& files) {
    string result;
    for (const ResolvedFile& file : files) {
      result += file.title + "<" + file.category + ";";
    }
    return result;
  }

  WBL_TEST_CASE(getDumpFiles) {
    DumpFiles dumps = getDumpFiles("/data/dumps", "commonswiki-latest");
    WBL_ASSERT_EQ(dumps.linkTarget, "/data/dumps/commonswiki-latest-linktarget.sql.gz");
    WBL_ASSERT_EQ(dumps.categoryLinks, "/data/dumps/commonswiki-latest-categorylinks.sql.gz");
    WBL_ASSERT_EQ(dumps.page, "/data/dumps/commonswiki-latest-page.sql.gz");
  }

  WBL_TEST_CASE(directMembers) {
    ResolutionResult result = resolve({"Cats", "Dogs"}, false);
    WBL_ASSERT_EQ(formatFiles(result.files), "Cat1.jpg<Category:Cats;Dog1.jpg<Category:Dogs;");
    WBL_ASSERT(result.categories == (vector<string>{"Category:Cats", "Category:Dogs"}));
    WBL_ASSERT(result.skippedCategories.empty());
    WBL_ASSERT(result.notFoundCategories.empty());
    WBL_ASSERT_EQ(result.malformedRows, 0);
  }

  WBL_TEST_CASE(recursiveSearch) {
    ResolutionResult result = resolve({"Category:Cats"}, true);
    WBL_ASSERT(result.categories == (vector<string>{"Category:Cats", "Category:Kittens"}));
    // Cat1.jpg is also in Kittens but keeps the first category through which it was found.
    WBL_ASSERT_EQ(formatFiles(result.files), "Cat1.jpg<Category:Cats;Kitten1.jpg<Category:Kittens;");
  }

  WBL_TEST_CASE(nonRecursiveResultIsSubset) {
    ResolutionResult recursiveResult = resolve({"Cats", "A"}, true);
    ResolutionResult directResult = resolve({"Cats", "A"}, false);
    set<string> recursiveTitles;
    for (const ResolvedFile& file : recursiveResult.files) {
      recursiveTitles.insert(file.title);
    }
    for (const ResolvedFile& file : directResult.files) {
      WBL_ASSERT(recursiveTitles.count(file.title) != 0) << file.title;
    }
    WBL_ASSERT_EQ(formatFiles(directResult.files), "Cat1.jpg<Category:Cats;A1.png<Category:A;");
    WBL_ASSERT(directResult.files.size() < recursiveResult.files.size());
  }

  WBL_TEST_CASE(cycle) {
    ResolutionResult result = resolve({"A"}, true);
    WBL_ASSERT(result.categories == (vector<string>{"Category:A", "Category:B"}));
    WBL_ASSERT_EQ(formatFiles(result.files), "A1.png<Category:A;B1.jpg<Category:B;");
  }

  WBL_TEST_CASE(processedCategoriesAreSkipped) {
    ResolutionResult result = resolve({"Cats", "Dogs"}, true, {"Category:Cats"});
    WBL_ASSERT(result.skippedCategories == vector<string>{"Category:Cats"});
    WBL_ASSERT(result.categories == vector<string>{"Category:Dogs"});
    WBL_ASSERT_EQ(formatFiles(result.files), "Dog1.jpg<Category:Dogs;");
  }

  WBL_TEST_CASE(processedSubcategoriesAreNotExpanded) {
    ResolutionResult result = resolve({"Cats"}, true, {"Category:Kittens"});
    WBL_ASSERT(result.categories == vector<string>{"Category:Cats"});
    WBL_ASSERT_EQ(formatFiles(result.files), "Cat1.jpg<Category:Cats;");
  }

  WBL_TEST_CASE(nothingToResolve) {
    // The dumps are not opened at all.
    CategoryResolver resolver(getDumpFiles(m_tempDir.path(), "missing"), {});
    ResolutionResult result = resolver.resolve({"Cats", "category:cats"}, {"Category:Cats"});
    WBL_ASSERT(result.files.empty());
    WBL_ASSERT(result.categories.empty());
    WBL_ASSERT_EQ(result.skippedCategories.size(), 2U);
  }

  WBL_TEST_CASE(categoryNamesAreNormalized) {
    ResolutionResult result = resolve({" category : cats ", "Category:Cats", "", "Dogs"}, false);
    WBL_ASSERT(result.categories == (vector<string>{"Category:Cats", "Category:Dogs"}));
  }

  WBL_TEST_CASE(fileFilter) {
    ResolutionResult result = resolve({"A"}, true, {}, "\\.png$");
    WBL_ASSERT_EQ(formatFiles(result.files), "A1.png<Category:A;");
    // Filtered categories are still processed.
    WBL_ASSERT_EQ(result.categories.size(), 2U);

    bool errorThrown = false;
    try {
      CategoryResolver resolver(m_dumps, {.recursive = true, .fileFilter = "(unclosed"});
    } catch (const wbl::ParseError&) {
      errorThrown = true;
    }
    WBL_ASSERT(errorThrown);
  }

  WBL_TEST_CASE(categoryNotFound) {
    ResolutionResult result = resolve({"Birds", "Dogs"}, true);
    WBL_ASSERT(result.notFoundCategories == vector<string>{"Category:Birds"});
    WBL_ASSERT(result.categories == vector<string>{"Category:Dogs"});
    WBL_ASSERT_EQ(formatFiles(result.files), "Dog1.jpg<Category:Dogs;");

    result = resolve({"Birds"}, false);
    WBL_ASSERT(result.notFoundCategories == vector<string>{"Category:Birds"});
    WBL_ASSERT(result.categories.empty());
    WBL_ASSERT(result.files.empty());
  }

  WBL_TEST_CASE(findCategoryIds) {
    LinkTargetTable linkTargets;
    linkTargets.add({.id = 7, .ns = 14, .title = "Cats"});
    WBL_ASSERT(wikibulk::findCategoryIds(linkTargets, "Category:Cats") == vector<int64_t>{7});
    bool errorThrown = false;
    try {
      wikibulk::findCategoryIds(linkTargets, "Category:Dogs");
    } catch (const CategoryNotFoundError&) {
      errorThrown = true;
    }
    WBL_ASSERT(errorThrown);
  }

  WBL_TEST_CASE(expandCategoriesWithoutDumps) {
    LinkTargetTable linkTargets;
    linkTargets.add({.id = 1, .ns = 14, .title = "Root"});
    linkTargets.add({.id = 2, .ns = 14, .title = "Child"});
    CategoryMembership membership;
    membership.add({.fromPageId = 20, .toLinkTargetId = 1, .kind = MembershipKind::SUBCATEGORY});
    membership.add({.fromPageId = 21, .toLinkTargetId = 2, .kind = MembershipKind::SUBCATEGORY});
    membership.add({.fromPageId = 22, .toLinkTargetId = 1, .kind = MembershipKind::SUBCATEGORY});
    PageTable pages;
    pages.add({.id = 20, .ns = 14, .title = "Child"});
    pages.add({.id = 21, .ns = 14, .title = "Grandchild"});
    pages.add({.id = 22, .ns = 0, .title = "Not_a_category"});

    vector<string> categories = expandCategories({"Category:Root"}, {}, linkTargets, membership, pages, true);
    WBL_ASSERT(categories == (vector<string>{"Category:Root", "Category:Child", "Category:Grandchild"}));
    categories = expandCategories({"Category:Root"}, {}, linkTargets, membership, pages, false);
    WBL_ASSERT(categories == vector<string>{"Category:Root"});
    categories = expandCategories({"Category:Root"}, {"Category:Child"}, linkTargets, membership, pages, true);
    WBL_ASSERT(categories == vector<string>{"Category:Root"});
  }

  WBL_TEST_CASE(missingDump) {
    wbl::TempDir emptyDir;
    CategoryResolver resolver(getDumpFiles(emptyDir.path(), "commonswiki-test"), {});
    bool errorThrown = false;
    try {
      resolver.resolve({"Cats"}, {});
    } catch (const mwd::DumpFormatError&) {
      errorThrown = true;
    }
    WBL_ASSERT(errorThrown);
  }

  wbl::TempDir m_tempDir;
  DumpFiles m_dumps;
};

}  // namespace wikibulk

int main() {
  wikibulk::CategoryResolverTest().run();
  return 0;
}
