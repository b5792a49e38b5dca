// Parsing and serialization of data in JSON format.
//
// Parsing JSON:
//   json::Value value = json::parse(R"({"results": [1, 2, 3]})");
//   for (const json::Value& result : value["results"].array()) {
//     std::cout << result.numberAsInt64() << "\n";
//   }
//
// Generating JSON:
//   json::Value value;
//   json::Value& results = value.getMutable("results");
//   results.addItem() = 1;
//   results.addItem() = 2;
//   std::cout << value.toJSON(json::INDENTED) << "\n";
//
// There is currently no support for floating point values. The parser can process data containing floating point
// values, but there is no way to read them afterwards.
#ifndef WBL_JSON_H
#define WBL_JSON_H

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace json {

void quoteCat(std::string_view str, std::string& buffer);
std::string quote(std::string_view str);

enum ValueType {
  VT_NULL,
  VT_BOOL,
  VT_NUMBER,
  VT_STRING,
  VT_OBJECT,
  VT_ARRAY,
};

enum Style {
  COMPACT,
  // One member or item per line, indented by two spaces per level.
  INDENTED,
};

// Ad-hoc variant type that can be parsed from and serialized to JSON.
class Value {
public:
  class ArrayAccessor {
  public:
    class iterator {
    public:
      explicit iterator(const Value* const* p = nullptr) : p(p) {}
      bool operator!=(const iterator& it) const { return p != it.p; }
      const Value& operator*() const { return **p; }
      iterator operator++() { return iterator(++p); }

    private:
      const Value* const* p;
    };

    explicit ArrayAccessor(const std::vector<Value*>* array) : m_array(array) {}
    bool empty() const { return m_array->empty(); }
    int size() const { return m_array->size(); }
    iterator begin() const { return iterator(m_array->empty() ? nullptr : &(*m_array)[0]); }
    iterator end() const { return iterator(m_array->empty() ? nullptr : &(*m_array)[0] + m_array->size()); }

  private:
    const std::vector<Value*>* m_array;
  };
  class ObjectAccessor {
  public:
    explicit ObjectAccessor(const std::map<std::string, Value>* object) : m_object(object) {}
    bool empty() const { return m_object->empty(); }
    int size() const { return m_object->size(); }
    std::map<std::string, Value>::const_iterator begin() const { return m_object->begin(); }
    std::map<std::string, Value>::const_iterator end() const { return m_object->end(); }
    const Value& operator[](const std::string& key) const;

  private:
    const std::map<std::string, Value>* m_object;
  };

  Value() {}
  explicit Value(const void*) = delete;  // No implicit pointer -> bool conversion.
  explicit Value(std::string_view s) { setStr(s); }
  Value(const Value& otherValue) = delete;
  Value(Value&& otherValue);
  ~Value() { setNull(); }

  Value& operator=(const Value& otherValue) = delete;
  // "value = std::move(value)" is a valid noop.
  // "value = std::move(value.getMutable("some_key"))" is allowed.
  // "value.getMutable("some_key") = std::move(value)" is not allowed (it would create cycles).
  Value& operator=(Value&& otherValue);
  Value& operator=(const void*) = delete;
  Value& operator=(bool b) {
    setBoolean(b);
    return *this;
  }
  Value& operator=(int number) {
    setNumber(number);
    return *this;
  }
  Value& operator=(int64_t number) {
    setNumber(number);
    return *this;
  }
  Value& operator=(std::string_view s) {
    setStr(s);
    return *this;
  }
  Value& operator=(const char* s) { return *this = std::string_view(s); }

  ValueType getType() const { return m_type; }
  bool isNull() const { return m_type == VT_NULL; }
  bool isBoolean() const { return m_type == VT_BOOL; }
  bool isNumber() const { return m_type == VT_NUMBER; }
  bool isString() const { return m_type == VT_STRING; }
  bool isObject() const { return m_type == VT_OBJECT; }
  bool isArray() const { return m_type == VT_ARRAY; }

  void setNull() { setType(VT_NULL); }
  bool boolean() const;
  void setBoolean(bool b);
  int64_t numberAsInt64() const;
  void setNumber(int64_t number);
  const std::string& str() const;
  void setStr(std::string_view s);
  ArrayAccessor array() const { return ArrayAccessor(m_type == VT_ARRAY ? m_data.array : &EMPTY_ARRAY); }
  void setToEmptyArray();
  ObjectAccessor object() const { return ObjectAccessor(m_type == VT_OBJECT ? m_data.object : &EMPTY_OBJECT); }
  void setToEmptyObject();

  bool has(const std::string& key) const;
  Value& getMutable(const std::string& key);
  const Value& operator[](const std::string& key) const { return object()[key]; }
  typedef std::map<std::string, Value>::iterator iterator;
  typedef std::map<std::string, Value>::const_iterator const_iterator;
  iterator begin();
  const_iterator begin() const;
  iterator end();
  const_iterator end() const;

  Value& addItem();

  void toJSONCat(std::string& buffer, Style style = COMPACT, int depth = 0) const;
  std::string toJSON(Style style = COMPACT) const {
    std::string buffer;
    toJSONCat(buffer, style);
    return buffer;
  }

private:
  void reallocArray(int newSize);
  void setType(ValueType newType);

  static const std::vector<Value*> EMPTY_ARRAY;
  static const std::map<std::string, Value> EMPTY_OBJECT;

  ValueType m_type = VT_NULL;
  union {
    void* rawPointer;
    const std::string* boolData;
    std::string* str;
    std::vector<Value*>* array;
    std::map<std::string, Value>* object;
  } m_data;

  friend class ValueParser;
};

// Throws: wbl::ParseError.
Value parse(std::string_view s);

}  // namespace json

#endif
