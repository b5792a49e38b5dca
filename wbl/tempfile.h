#ifndef WBL_TEMPFILE_H
#define WBL_TEMPFILE_H

#include <string>

namespace wbl {

// Temporary directory under /tmp, removed recursively with its content by the destructor.
class TempDir {
public:
  TempDir();
  explicit TempDir(const std::string& prefix);
  TempDir(const TempDir&) = delete;
  ~TempDir();
  TempDir& operator=(const TempDir&) = delete;
  const std::string& path() const { return m_path; }

private:
  std::string m_path;
};

}  // namespace wbl

#endif
