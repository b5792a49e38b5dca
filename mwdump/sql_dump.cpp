#include "sql_dump.h"
#include <cctype>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include "wbl/error.h"
#include "wbl/gzip_file.h"
#include "wbl/log.h"
#include "wbl/path.h"
#include "wbl/string.h"

using std::string;
using std::string_view;

namespace mwd {

static constexpr int MAX_LOGGED_MALFORMED_ROWS = 20;
static constexpr int STATEMENTS_BETWEEN_PROGRESS_LOGS = 1000;

SqlValue SqlValue::makeInteger(int64_t value) {
  SqlValue sqlValue;
  sqlValue.m_type = INTEGER;
  sqlValue.m_integer = value;
  return sqlValue;
}

SqlValue SqlValue::makeDecimal(string_view text) {
  SqlValue sqlValue;
  sqlValue.m_type = DECIMAL;
  sqlValue.m_text = text;
  return sqlValue;
}

SqlValue SqlValue::makeString(string value) {
  SqlValue sqlValue;
  sqlValue.m_type = STRING;
  sqlValue.m_text = std::move(value);
  return sqlValue;
}

int64_t SqlValue::asInt64() const {
  if (m_type != INTEGER) {
    throw RowParseError("Integer expected");
  }
  return m_integer;
}

const string& SqlValue::str() const {
  if (m_type != STRING && m_type != DECIMAL) {
    throw RowParseError("String expected");
  }
  return m_text;
}

static std::unique_ptr<wbl::GzipLineReader> openDump(const string& path) {
  try {
    return std::make_unique<wbl::GzipLineReader>(path);
  } catch (const wbl::SystemError& error) {
    throw DumpFormatError(error.what());
  }
}

SqlDumpReader::SqlDumpReader(const string& path, string_view table)
    : m_path(path), m_insertPrefix(wbl::concat("INSERT INTO `", table, "` VALUES")), m_reader(openDump(path)) {}

SqlDumpReader::~SqlDumpReader() {}

bool SqlDumpReader::readStatement() {
  m_statement.clear();
  m_position = 0;
  try {
    bool inStatement = false;
    while (m_reader->readLine(m_line)) {
      if (!inStatement) {
        if (!wbl::startsWith(m_line, m_insertPrefix)) {
          continue;
        }
        inStatement = true;
        m_statementLine = m_reader->lineNumber();
        m_statement.assign(m_line, m_insertPrefix.size());
      } else {
        m_statement += '\n';
        m_statement += m_line;
      }
      if (wbl::endsWith(wbl::trim(m_line, wbl::TRIM_RIGHT), ";")) {
        break;
      }
    }
    if (!inStatement) {
      return false;
    }
  } catch (const wbl::GzipError& error) {
    throw DumpFormatError(error.what());
  }
  m_statementsRead++;
  if (m_statementsRead % STATEMENTS_BETWEEN_PROGRESS_LOGS == 0) {
    WBL_INFO << wbl::getBaseName(m_path) << ": " << m_statementsRead << " statements, " << m_rowsRead << " rows";
  }
  return true;
}

void SqlDumpReader::skipSpaces() {
  for (; m_position < m_statement.size() && isspace(static_cast<unsigned char>(m_statement[m_position]));
       m_position++) {}
}

static SqlValue parseString(string_view statement, size_t& position) {
  // Precondition: statement[position] == '\''.
  string value;
  for (position++; position < statement.size(); position++) {
    char c = statement[position];
    if (c == '\'') {
      if (position + 1 < statement.size() && statement[position + 1] == '\'') {
        value += '\'';
        position++;
      } else {
        position++;
        return SqlValue::makeString(std::move(value));
      }
    } else if (c == '\\') {
      position++;
      if (position >= statement.size()) {
        break;
      }
      char escapedChar = statement[position];
      switch (escapedChar) {
        case '0':
          value += '\0';
          break;
        case 'b':
          value += '\b';
          break;
        case 'n':
          value += '\n';
          break;
        case 'r':
          value += '\r';
          break;
        case 't':
          value += '\t';
          break;
        case 'Z':
          value += '\x1A';
          break;
        case '%':
        case '_':
          // MySQL keeps the backslash for these two.
          value += '\\';
          value += escapedChar;
          break;
        default:
          // \\, \', \" and unknown escapes.
          value += escapedChar;
          break;
      }
    } else {
      value += c;
    }
  }
  throw RowParseError("Unterminated string");
}

// Characters that can appear in an unquoted number, apart from letters.
static bool isNumberChar(char c) {
  return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.';
}

static SqlValue parseUnquotedValue(string_view statement, size_t& position) {
  size_t start = position;
  for (; position < statement.size(); position++) {
    char c = statement[position];
    if (!isNumberChar(c) && !isalpha(static_cast<unsigned char>(c))) break;
  }
  string_view token = statement.substr(start, position - start);
  if (token.empty()) {
    throw RowParseError("Value expected");
  } else if (token == "NULL" || token == "null") {
    return SqlValue();
  }
  size_t digits = token[0] == '-' || token[0] == '+' ? 1 : 0;
  if (digits >= token.size() || !(token[digits] >= '0' && token[digits] <= '9')) {
    throw RowParseError(wbl::concat("Invalid value '", token, "'"));
  }
  bool isDecimal = false;
  for (size_t i = digits; i < token.size(); i++) {
    char c = token[i];
    if (c == '.' || c == 'e' || c == 'E') {
      isDecimal = true;
    } else if (!(c >= '0' && c <= '9') && !((c == '-' || c == '+') && (token[i - 1] == 'e' || token[i - 1] == 'E'))) {
      throw RowParseError(wbl::concat("Invalid number '", token, "'"));
    }
  }
  if (isDecimal) {
    return SqlValue::makeDecimal(token);
  }
  try {
    return SqlValue::makeInteger(wbl::parseInt64(token[0] == '+' ? token.substr(1) : token));
  } catch (const wbl::ParseError&) {
    throw RowParseError(wbl::concat("Integer out of range '", token, "'"));
  }
}

void SqlDumpReader::parseTuple(SqlRow& row) {
  row.clear();
  if (m_statement[m_position] != '(') {
    throw RowParseError("'(' expected");
  }
  m_position++;
  while (true) {
    skipSpaces();
    if (m_position >= m_statement.size()) {
      throw RowParseError("Unexpected end of statement");
    } else if (m_statement[m_position] == '\'') {
      row.push_back(parseString(m_statement, m_position));
    } else {
      row.push_back(parseUnquotedValue(m_statement, m_position));
    }
    skipSpaces();
    if (m_position >= m_statement.size()) {
      throw RowParseError("Unexpected end of statement");
    }
    char c = m_statement[m_position++];
    if (c == ')') {
      break;
    } else if (c != ',') {
      throw RowParseError("',' or ')' expected after value");
    }
  }
  skipSpaces();
  if (m_position < m_statement.size()) {
    char c = m_statement[m_position];
    if (c == ',') {
      m_position++;
    } else if (c == ';') {
      m_position = m_statement.size();
    } else {
      throw RowParseError("',' or ';' expected after tuple");
    }
  }
}

void SqlDumpReader::resync(size_t tupleStart) {
  size_t nextTuple = m_statement.find("),(", tupleStart + 1);
  m_position = nextTuple == string::npos ? m_statement.size() : nextTuple + 2;
}

void SqlDumpReader::reportMalformedRow(const RowParseError& error) {
  m_malformedRows++;
  if (m_malformedRows <= MAX_LOGGED_MALFORMED_ROWS) {
    WBL_WARNING << wbl::getBaseName(m_path) << ": skipping malformed row in the statement starting on line "
                << m_statementLine << ": " << error.what();
  }
}

bool SqlDumpReader::next(SqlRow& row) {
  while (true) {
    skipSpaces();
    if (m_position >= m_statement.size()) {
      if (!readStatement()) {
        return false;
      }
      continue;
    }
    size_t tupleStart = m_position;
    try {
      parseTuple(row);
    } catch (const RowParseError& error) {
      reportMalformedRow(error);
      resync(tupleStart);
      continue;
    }
    m_rowsRead++;
    return true;
  }
}

void SqlDumpReader::rewind() {
  try {
    m_reader->rewind();
  } catch (const wbl::GzipError& error) {
    throw DumpFormatError(error.what());
  }
  m_statement.clear();
  m_position = 0;
  m_rowsRead = 0;
  m_malformedRows = 0;
  m_statementsRead = 0;
}

}  // namespace mwd
