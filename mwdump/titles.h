// Title conventions of MediaWiki database dumps.
// Titles in the page and linktarget tables are stored in "database key" form: no namespace prefix, underscores
// instead of spaces, first letter in upper case.
#ifndef MWD_TITLES_H
#define MWD_TITLES_H

#include <string>
#include <string_view>

namespace mwd {

enum NamespaceNumber {
  NS_MAIN = 0,
  NS_FILE = 6,
  NS_CATEGORY = 14,
};

extern const char CATEGORY_PREFIX[];  // "Category:"
extern const char DEFAULT_FILE_URL_BASE[];

// Converts a category name typed by a user to the form "Category:<key>".
// Spaces and underscores are collapsed into single underscores and removed at both ends, an optional "Category:"
// prefix is stripped (case-insensitive, spaces around ':' allowed) and the first letter is put in upper case if it is ASCII or belongs to the Latin-1 Supplement,
// Latin Extended-A, Greek or Cyrillic blocks.
// Returns an empty string if nothing remains.
//   normalizeCategoryTitle(" category : big  cats ") == "Category:Big_cats"
std::string normalizeCategoryTitle(std::string_view title);
// "Category:" + key, where key is in database key form.
std::string makeCategoryTitle(std::string_view key);
// Inverse of makeCategoryTitle. Titles without the prefix are returned unchanged.
std::string_view getCategoryKey(std::string_view categoryTitle);

// URL from which the original version of a file can be downloaded, e.g.
// "https://commons.wikimedia.org/wiki/Special:FilePath/Cat%C3%A9.jpg" for "Caté.jpg".
std::string getFileURL(std::string_view urlBase, std::string_view fileTitle);
// Name of the local copy of a file. Slashes are replaced so that the file stays in the output directory.
std::string getLocalFileName(std::string_view fileTitle);

}  // namespace mwd

#endif
