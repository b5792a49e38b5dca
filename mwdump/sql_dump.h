// Streaming reader for the SQL dumps of MediaWiki tables (e.g. commonswiki-latest-page.sql.gz).
//
// These dumps are produced by mysqldump and contain, apart from schema definitions and comments, statements of the
// form
//   INSERT INTO `page` VALUES (1,0,'Main_Page',...),(2,6,'Cat.jpg',...),...;
// SqlDumpReader decompresses the file on the fly and returns one row at a time, so that dumps of several gigabytes can
// be processed without loading them in memory.
//
// Usage:
//   mwd::SqlDumpReader reader("commonswiki-latest-page.sql.gz", "page");
//   mwd::SqlRow row;
//   while (reader.next(row)) {
//     int64_t pageId = row[0].asInt64();
//     ...
//   }
#ifndef MWD_SQL_DUMP_H
#define MWD_SQL_DUMP_H

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "wbl/error.h"
#include "wbl/gzip_file.h"

namespace mwd {

// The dump cannot be opened or its compressed stream is corrupt. Processing of the dump cannot continue.
class DumpFormatError : public wbl::Error {
public:
  using Error::Error;
};

// A tuple or a value does not have the expected syntax or type. Only affects one row.
class RowParseError : public wbl::ParseError {
public:
  using ParseError::ParseError;
};

class SqlValue {
public:
  enum Type {
    NULL_VALUE,
    INTEGER,
    DECIMAL,  // Kept as text, e.g. "0.123" or "1e5".
    STRING,
  };

  SqlValue() = default;
  static SqlValue makeInteger(int64_t value);
  static SqlValue makeDecimal(std::string_view text);
  static SqlValue makeString(std::string value);

  Type type() const { return m_type; }
  bool isNull() const { return m_type == NULL_VALUE; }
  // Throws: RowParseError if the value is not an integer.
  int64_t asInt64() const;
  // Text of a STRING or DECIMAL value.
  // Throws: RowParseError if the value is NULL or an integer.
  const std::string& str() const;

private:
  Type m_type = NULL_VALUE;
  int64_t m_integer = 0;
  std::string m_text;
};

using SqlRow = std::vector<SqlValue>;

class SqlDumpReader {
public:
  // Opens a dump (gzip-compressed or not) and prepares to read the rows inserted in `table`.
  // Throws: DumpFormatError.
  SqlDumpReader(const std::string& path, std::string_view table);
  SqlDumpReader(const SqlDumpReader&) = delete;
  ~SqlDumpReader();
  SqlDumpReader& operator=(const SqlDumpReader&) = delete;

  // Reads the next well-formed row. Malformed tuples are skipped and counted in malformedRows().
  // Returns false at the end of the dump.
  // Throws: DumpFormatError.
  bool next(SqlRow& row);
  // Restarts from the beginning of the dump. Counters are reset.
  // Throws: DumpFormatError.
  void rewind();

  // Records a row that next() returned but that the caller cannot interpret (wrong arity or column type).
  void reportMalformedRow(const RowParseError& error);

  const std::string& path() const { return m_path; }
  int64_t rowsRead() const { return m_rowsRead; }
  int64_t malformedRows() const { return m_malformedRows; }
  int64_t statementsRead() const { return m_statementsRead; }

private:
  // Loads the next INSERT statement for the table into m_statement. Returns false at the end of the dump.
  bool readStatement();
  // Parses the tuple starting at m_position and moves m_position after it.
  // Throws: RowParseError.
  void parseTuple(SqlRow& row);
  // Moves m_position to the beginning of the next tuple after tupleStart, or to the end of the statement.
  void resync(size_t tupleStart);
  void skipSpaces();

  std::string m_path;
  std::string m_insertPrefix;
  std::unique_ptr<wbl::GzipLineReader> m_reader;
  std::string m_line;
  std::string m_statement;
  size_t m_position = 0;
  int64_t m_statementLine = 0;
  int64_t m_rowsRead = 0;
  int64_t m_malformedRows = 0;
  int64_t m_statementsRead = 0;
};

}  // namespace mwd

#endif
