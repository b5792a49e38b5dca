// String operations on paths. These functions perform no disk access.
#ifndef WBL_PATH_H
#define WBL_PATH_H

#include <string>
#include <string_view>

namespace wbl {

// Strips everything until the last slash from path, e.g. getBaseName("/usr/bin/gcc") = "gcc".
// Only '/' is recognized as a path separator.
std::string getBaseName(const std::string& path);

// Joins two paths with '/', e.g. joinPaths("/usr", "bin/gcc") = "/usr/bin/gcc".
// If path1 already ends with '/', no additional '/' is inserted between path1 and path2.
// If path1 is empty, path2 is returned.
// path2 must be a relative path, i.e. it must not start with '/'.
std::string joinPaths(std::string_view path1, std::string_view path2);

}  // namespace wbl

#endif
