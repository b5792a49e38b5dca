#include "json.h"
#include <cstdint>
#include <cstdlib>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "error.h"
#include "string.h"

using wbl::ParseError;
using std::map;
using std::string;
using std::string_view;
using std::vector;

namespace json {

static const Value NULL_VALUE;
static const string EMPTY_STRING;
const vector<Value*> Value::EMPTY_ARRAY;
const map<string, Value> Value::EMPTY_OBJECT;
map<string, Value> MUTABLE_EMPTY_OBJECT;  // Never actually mutated (only used for begin() and end()).
constexpr char HEX_DIGITS[16] = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};
// Deeper documents are rejected instead of overflowing the stack.
constexpr int MAX_NESTING_DEPTH = 256;

// Appends the UTF-8 encoding of a code point obtained from \u escapes (at most 0x10FFFF by construction).
static void appendUTF8(int c, string& buffer) {
  if (c < 0x80) {
    buffer += static_cast<char>(c);
  } else if (c < 0x800) {
    buffer += static_cast<char>(0xC0 | (c >> 6));
    buffer += static_cast<char>(0x80 | (c & 0x3F));
  } else if (c < 0x10000) {
    buffer += static_cast<char>(0xE0 | (c >> 12));
    buffer += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
    buffer += static_cast<char>(0x80 | (c & 0x3F));
  } else {
    buffer += static_cast<char>(0xF0 | (c >> 18));
    buffer += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
    buffer += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
    buffer += static_cast<char>(0x80 | (c & 0x3F));
  }
}

void quoteCat(string_view str, string& buffer) {
  buffer += '"';
  for (unsigned char c : str) {
    if (c < 0x20) {
      if (c == '\n') {
        buffer += "\\n";
      } else if (c == '\t') {
        buffer += "\\t";
      } else if (c == '\r') {
        buffer += "\\r";
      } else {
        char charBuffer[7] = {'\\', 'u', '0', '0', HEX_DIGITS[c >> 4], HEX_DIGITS[c & 0xF], 0};
        buffer += charBuffer;
      }
    } else if (c == '\\') {
      buffer += "\\\\";
    } else if (c == '"') {
      buffer += "\\\"";
    } else {
      buffer += static_cast<char>(c);
    }
  }
  buffer += '"';
}

string quote(string_view str) {
  string result;
  quoteCat(str, result);
  return result;
}

const Value& Value::ObjectAccessor::operator[](const string& key) const {
  map<string, Value>::const_iterator it = m_object->find(key);
  return it == m_object->end() ? NULL_VALUE : it->second;
}

Value::Value(Value&& otherValue) {
  m_type = otherValue.m_type;
  m_data.rawPointer = otherValue.m_data.rawPointer;
  otherValue.m_type = VT_NULL;
}

Value& Value::operator=(Value&& otherValue) {
  if (this != &otherValue) {
    // Retain the current value of *this until the assignment is done, in case otherValue is a part of *this
    // (see MoveAssignmentChild test) and then automatically free it.
    Value oldThis(std::move(*this));
    m_type = otherValue.m_type;
    m_data.rawPointer = otherValue.m_data.rawPointer;
    otherValue.m_type = VT_NULL;
  }
  return *this;
}

bool Value::boolean() const {
  return m_type == VT_BOOL && m_data.boolData;
}

void Value::setBoolean(bool b) {
  setType(VT_BOOL);
  m_data.boolData = b ? &EMPTY_STRING : nullptr;
}

int64_t Value::numberAsInt64() const {
  return m_type == VT_NUMBER ? atoll(m_data.str->c_str()) : 0;
}

void Value::setNumber(int64_t number) {
  setType(VT_NUMBER);
  *m_data.str = std::to_string(number);
}

const string& Value::str() const {
  return m_type == VT_STRING ? *m_data.str : EMPTY_STRING;
}

void Value::setStr(string_view s) {
  setType(VT_STRING);
  // Builds a string explicitly and then move it, in case s.data == m_data.str->c_str() (see test AssignOwnString).
  *m_data.str = string(s);
}

bool Value::has(const string& key) const {
  return m_type == VT_OBJECT ? m_data.object->find(key) != m_data.object->end() : false;
}

Value& Value::getMutable(const string& key) {
  setType(VT_OBJECT);
  return (*m_data.object)[key];
}

Value::iterator Value::begin() {
  return m_type == VT_OBJECT ? m_data.object->begin() : MUTABLE_EMPTY_OBJECT.begin();
}

Value::const_iterator Value::begin() const {
  return m_type == VT_OBJECT ? m_data.object->begin() : EMPTY_OBJECT.begin();
}

Value::iterator Value::end() {
  return m_type == VT_OBJECT ? m_data.object->end() : MUTABLE_EMPTY_OBJECT.end();
}

Value::const_iterator Value::end() const {
  return m_type == VT_OBJECT ? m_data.object->end() : EMPTY_OBJECT.end();
}

void Value::reallocArray(int newSize) {
  if (newSize < 0) {
    throw std::invalid_argument("json::Value::reallocArray called with a negative size");
  }
  int oldSize = m_data.array->size();
  for (int i = newSize; i < oldSize; i++) {
    delete (*m_data.array)[i];
  }
  m_data.array->resize(newSize);
  for (int i = oldSize; i < newSize; i++) {
    (*m_data.array)[i] = new Value;
  }
}

void Value::setToEmptyArray() {
  setType(VT_ARRAY);
  reallocArray(0);
}

Value& Value::addItem() {
  setType(VT_ARRAY);
  int n = m_data.array->size();
  reallocArray(n + 1);
  return *(*m_data.array)[n];
}

void Value::setToEmptyObject() {
  setType(VT_OBJECT);
  m_data.object->clear();
}

void Value::setType(ValueType newType) {
  if (m_type != newType) {
    if (m_type == VT_NUMBER || m_type == VT_STRING) {
      delete m_data.str;
    } else if (m_type == VT_OBJECT) {
      delete m_data.object;
    } else if (m_type == VT_ARRAY) {
      reallocArray(0);
      delete m_data.array;
    }
    if (newType == VT_NUMBER || newType == VT_STRING) {
      m_data.str = new string;
    } else if (newType == VT_OBJECT) {
      m_data.object = new map<string, Value>;
    } else if (newType == VT_ARRAY) {
      m_data.array = new vector<Value*>;
    }
    m_type = newType;
  }
}

static void addIndentedLine(string& buffer, int depth) {
  buffer += '\n';
  buffer.append(depth * 2, ' ');
}

// Writes the items of an object or an array between `open` and `close`, one per line in the INDENTED style.
template <class Container, class WriteItem>
static void writeContainer(string& buffer, char open, char close, const Container& items, Style style, int depth,
                           WriteItem writeItem) {
  buffer += open;
  bool empty = true;
  for (const auto& item : items) {
    if (!empty) {
      buffer += ',';
    }
    empty = false;
    if (style == INDENTED) {
      addIndentedLine(buffer, depth + 1);
    }
    writeItem(item);
  }
  if (!empty && style == INDENTED) {
    addIndentedLine(buffer, depth);
  }
  buffer += close;
}

void Value::toJSONCat(string& buffer, Style style, int depth) const {
  switch (m_type) {
    case VT_NULL:
      buffer += "null";
      break;
    case VT_BOOL:
      buffer += m_data.boolData ? "true" : "false";
      break;
    case VT_NUMBER:
      buffer += *m_data.str;
      break;
    case VT_STRING:
      quoteCat(*m_data.str, buffer);
      break;
    case VT_OBJECT:
      writeContainer(buffer, '{', '}', *m_data.object, style, depth, [&](const auto& member) {
        quoteCat(member.first, buffer);
        buffer += style == INDENTED ? ": " : ":";
        member.second.toJSONCat(buffer, style, depth + 1);
      });
      break;
    case VT_ARRAY:
      writeContainer(buffer, '[', ']', *m_data.array, style, depth,
                     [&](const Value* item) { item->toJSONCat(buffer, style, depth + 1); });
      break;
  }
}

// Recursive descent parser. Errors are reported with the line and column of the current position.
class ValueParser {
public:
  explicit ValueParser(string_view input) : m_input(input) {}
  Value parseDocument();

private:
  [[noreturn]] void fail(const string& message) const;
  bool atEnd() const { return m_position >= m_input.size(); }
  char peek() const { return atEnd() ? '\0' : m_input[m_position]; }
  bool consume(char c);
  void skipSpace();
  size_t countDigits(size_t start) const;

  Value parseValue(int depth);
  Value parseKeyword();
  Value parseNumber();
  Value parseObject(int depth);
  Value parseArray(int depth);
  string parseString();
  int parseUnicodeEscape();
  int parseHex4();

  string_view m_input;
  size_t m_position = 0;
};

void ValueParser::fail(const string& message) const {
  int64_t line = 1;
  size_t lineStart = 0;
  for (size_t i = 0; i < m_position && i < m_input.size(); i++) {
    if (m_input[i] == '\n') {
      line++;
      lineStart = i + 1;
    }
  }
  throw ParseError(wbl::concat(message, " (line ", std::to_string(line), ", column ",
                               std::to_string(m_position - lineStart + 1), ")"));
}

bool ValueParser::consume(char c) {
  if (!atEnd() && m_input[m_position] == c) {
    m_position++;
    return true;
  }
  return false;
}

void ValueParser::skipSpace() {
  while (!atEnd()) {
    char c = m_input[m_position];
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
    m_position++;
  }
}

size_t ValueParser::countDigits(size_t start) const {
  size_t end = start;
  for (; end < m_input.size() && m_input[end] >= '0' && m_input[end] <= '9'; end++) {
  }
  return end - start;
}

Value ValueParser::parseDocument() {
  Value value = parseValue(0);
  skipSpace();
  if (!atEnd()) {
    fail("Unexpected content after the end of the JSON value");
  }
  return value;
}

Value ValueParser::parseValue(int depth) {
  if (depth > MAX_NESTING_DEPTH) {
    fail("Too many nested objects or arrays");
  }
  skipSpace();
  if (atEnd()) {
    fail("Expected value but found end of string");
  }
  char c = peek();
  if (c == '{') {
    return parseObject(depth);
  } else if (c == '[') {
    return parseArray(depth);
  } else if (c == '"') {
    Value value;
    value.setType(VT_STRING);
    *value.m_data.str = parseString();
    return value;
  } else if (c == '-' || (c >= '0' && c <= '9')) {
    return parseNumber();
  } else if (c >= 'a' && c <= 'z') {
    return parseKeyword();
  }
  fail("Unexpected character at the beginning of a value: '" + string(1, c) + "'");
}

Value ValueParser::parseKeyword() {
  size_t end = m_position;
  for (; end < m_input.size() && m_input[end] >= 'a' && m_input[end] <= 'z'; end++) {
  }
  string_view keyword = m_input.substr(m_position, end - m_position);
  Value value;
  if (keyword == "true" || keyword == "false") {
    value.setType(VT_BOOL);
    value.m_data.boolData = keyword == "true" ? &EMPTY_STRING : nullptr;
  } else if (keyword != "null") {
    fail("Invalid keyword '" + string(keyword) + "'");
  }
  m_position = end;
  return value;
}

// number = [ "-" ] ( "0" / [1-9] *DIGIT ) [ "." 1*DIGIT ] [ ( "e" / "E" ) [ "+" / "-" ] 1*DIGIT ]
// The text of the number is kept as is.
Value ValueParser::parseNumber() {
  size_t end = m_position;
  if (m_input[end] == '-') {
    end++;
  }
  size_t integerDigits = countDigits(end);
  if (integerDigits == 0 || (integerDigits > 1 && m_input[end] == '0')) {
    fail("Invalid number: bad integer part");
  }
  end += integerDigits;
  if (end < m_input.size() && m_input[end] == '.') {
    size_t fractionDigits = countDigits(end + 1);
    if (fractionDigits == 0) {
      fail("Invalid number: missing digits after '.'");
    }
    end += 1 + fractionDigits;
  }
  if (end < m_input.size() && (m_input[end] == 'e' || m_input[end] == 'E')) {
    end++;
    if (end < m_input.size() && (m_input[end] == '+' || m_input[end] == '-')) {
      end++;
    }
    size_t exponentDigits = countDigits(end);
    if (exponentDigits == 0) {
      fail("Invalid number: missing exponent");
    }
    end += exponentDigits;
  }
  Value value;
  value.setType(VT_NUMBER);
  *value.m_data.str = m_input.substr(m_position, end - m_position);
  m_position = end;
  return value;
}

Value ValueParser::parseObject(int depth) {
  m_position++;  // '{'
  Value value;
  value.setType(VT_OBJECT);
  skipSpace();
  if (consume('}')) {
    return value;
  }
  while (true) {
    skipSpace();
    if (peek() != '"') {
      fail(peek() == '}' ? "Invalid object: trailing commas are not allowed before '}'"
                         : "Invalid object: expected string key");
    }
    string key = parseString();
    skipSpace();
    if (!consume(':')) {
      fail("Invalid object: missing ':' after key");
    }
    (*value.m_data.object)[key] = parseValue(depth + 1);
    skipSpace();
    if (consume('}')) {
      return value;
    } else if (!consume(',')) {
      fail("Invalid object: missing ',' or '}' after value");
    }
  }
}

Value ValueParser::parseArray(int depth) {
  m_position++;  // '['
  Value value;
  value.setType(VT_ARRAY);
  skipSpace();
  if (consume(']')) {
    return value;
  }
  while (true) {
    value.m_data.array->push_back(new Value(parseValue(depth + 1)));
    skipSpace();
    if (consume(']')) {
      return value;
    } else if (!consume(',')) {
      fail("Invalid array: missing ',' or ']' after value");
    }
  }
}

string ValueParser::parseString() {
  if (!consume('"')) {
    fail("Invalid string: missing opening quotes");
  }
  string data;
  while (true) {
    size_t end = m_position;
    for (; end < m_input.size() && m_input[end] != '"' && m_input[end] != '\\' && m_input[end] != '\0'; end++) {
    }
    data += m_input.substr(m_position, end - m_position);
    m_position = end;
    if (atEnd()) {
      fail("Invalid string: missing closing quotes");
    } else if (consume('"')) {
      return data;
    } else if (peek() == '\0') {
      fail("Invalid string: contains raw nul char");
    }
    m_position++;  // '\\'
    if (atEnd()) {
      fail("Invalid string: missing escaped char after '\\'");
    }
    char escapedChar = m_input[m_position++];
    switch (escapedChar) {
      case '"':
      case '\\':
      case '/':
        data += escapedChar;
        break;
      case 'b':
        data += '\b';
        break;
      case 'f':
        data += '\f';
        break;
      case 'n':
        data += '\n';
        break;
      case 'r':
        data += '\r';
        break;
      case 't':
        data += '\t';
        break;
      case 'u':
        appendUTF8(parseUnicodeEscape(), data);
        break;
      default:
        m_position -= 2;
        fail("Invalid escape sequence in string: '\\" + string(1, escapedChar) + "'");
    }
  }
}

// Parses the part of a \u escape after "\u", including the second half of a surrogate pair.
int ValueParser::parseUnicodeEscape() {
  int c = parseHex4();
  if (c >= 0xDC00 && c <= 0xDFFF) {
    fail("Invalid string: low surrogate without high surrogate");
  } else if (c >= 0xD800 && c <= 0xDBFF) {
    if (m_input.substr(m_position, 2) != "\\u") {
      fail("Invalid string: high surrogate not followed by a low surrogate");
    }
    m_position += 2;
    int low = parseHex4();
    if (low < 0xDC00 || low > 0xDFFF) {
      fail("Invalid string: high surrogate not followed by a low surrogate");
    }
    c = 0x10000 + ((c - 0xD800) << 10) + (low - 0xDC00);
  }
  return c;
}

int ValueParser::parseHex4() {
  if (m_input.size() - m_position < 4) {
    fail("Invalid string: incomplete \\u escape");
  }
  int c = 0;
  for (int i = 0; i < 4; i++) {
    char digit = m_input[m_position + i];
    int digitValue = 0;
    if (digit >= '0' && digit <= '9') {
      digitValue = digit - '0';
    } else if (digit >= 'a' && digit <= 'f') {
      digitValue = digit - 'a' + 10;
    } else if (digit >= 'A' && digit <= 'F') {
      digitValue = digit - 'A' + 10;
    } else {
      fail("Invalid string: bad \\u escape");
    }
    c = c * 16 + digitValue;
  }
  m_position += 4;
  return c;
}

Value parse(string_view s) {
  return ValueParser(s).parseDocument();
}

}  // namespace json
