//
//   PlistFlow Property List (plist) serialization and parsing library.
//
//   Copyright (c) 2011 Animetrics Inc. (marc@animetrics.com)
//   
//   Permission is hereby granted, free of charge, to any person obtaining a copy
//   of this software and associated documentation files (the "Software"), to deal
//   in the Software without restriction, including without limitation the rights
//   to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
//   copies of the Software, and to permit persons to whom the Software is
//   furnished to do so, subject to the following conditions:
//   
//   The above copyright notice and this permission notice shall be included in
//   all copies or substantial portions of the Software.
//   
//   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
//   IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
//   FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
//   AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
//   LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
//   OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
//   THE SOFTWARE.

#ifndef __PLISTFLOW_VALUE_H__
#define __PLISTFLOW_VALUE_H__

#include <boost/cstdint.hpp>
#include <boost/variant.hpp>

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "PlistDate.hpp"
#include "PlistInteger.hpp"

namespace PlistFlow {

class Value;
class Dictionary;

// Plist value types and their corresponding c++ types

typedef std::string string_type;
typedef Integer integer_type;
typedef double real_type;
typedef Dictionary dictionary_type;
typedef std::vector<Value> array_type;
typedef Date date_type;
typedef std::vector<unsigned char> data_type;
typedef bool boolean_type;
typedef Uid uid_type;

// One property list value.  The set of kinds is closed; consumers switch on
// type() and handle every case.
class Value {
 public:
  enum Type {
    ArrayType,
    DictionaryType,
    StringType,
    BooleanType,
    RealType,
    IntegerType,
    DataType,
    DateType,
    UidType
  };

  // Default-constructs an empty array.
  Value();
  Value(const Value& other);
  ~Value();
  Value& operator=(const Value& other);
  Value(Value&& other) noexcept;
  Value& operator=(Value&& other) noexcept;

  void swap(Value& other);

  Value(const array_type& value);
  Value(const dictionary_type& value);
  Value(const string_type& value);
  Value(const char* value);
  Value(bool value);
  Value(double value);
  Value(const integer_type& value);
  Value(int value);
  Value(unsigned value);
  Value(long value);
  Value(unsigned long value);
  Value(long long value);
  Value(unsigned long long value);
  Value(const data_type& value);
  Value(const date_type& value);
  Value(const uid_type& value);

  Type type() const;

  bool isArray() const { return type() == ArrayType; }
  bool isDictionary() const { return type() == DictionaryType; }
  bool isString() const { return type() == StringType; }
  bool isBoolean() const { return type() == BooleanType; }
  bool isReal() const { return type() == RealType; }
  bool isInteger() const { return type() == IntegerType; }
  bool isData() const { return type() == DataType; }
  bool isDate() const { return type() == DateType; }
  bool isUid() const { return type() == UidType; }

  // The accessors throw Error(TypeMismatch) when the value holds another
  // kind.
  const array_type& asArray() const;
  array_type& asArray();
  const dictionary_type& asDictionary() const;
  dictionary_type& asDictionary();
  const string_type& asString() const;
  bool asBoolean() const;
  double asReal() const;
  const integer_type& asInteger() const;
  const data_type& asData() const;
  const date_type& asDate() const;
  const uid_type& asUid() const;

  bool operator==(const Value& rhs) const;
  bool operator!=(const Value& rhs) const { return !(*this == rhs); }

 private:
  typedef boost::variant<boost::recursive_wrapper<array_type>,
                         boost::recursive_wrapper<dictionary_type>,
                         string_type,
                         bool,
                         double,
                         integer_type,
                         data_type,
                         date_type,
                         uid_type>
      storage_type;

  storage_type _storage;
};

const char* valueTypeName(Value::Type type);

// String keyed mapping that keeps keys in insertion order.
class Dictionary {
 public:
  typedef std::pair<std::string, Value> entry_type;
  typedef std::vector<entry_type>::iterator iterator;
  typedef std::vector<entry_type>::const_iterator const_iterator;

  Dictionary() {}

  // Inserts or replaces.  A replaced key keeps its original position.
  void insert(const std::string& key, const Value& value);

  // Returns true when the key was present.
  bool erase(const std::string& key);

  const Value* find(const std::string& key) const;
  Value* find(const std::string& key);

  bool contains(const std::string& key) const { return find(key) != 0; }

  // Throws Error(MissingField) when the key is absent.
  const Value& at(const std::string& key) const;

  Value& operator[](const std::string& key);

  std::size_t size() const { return _entries.size(); }
  bool empty() const { return _entries.empty(); }
  void reserve(std::size_t size) { _entries.reserve(size); }
  void clear() {
    _entries.clear();
    _index.clear();
  }

  iterator begin() { return _entries.begin(); }
  iterator end() { return _entries.end(); }
  const_iterator begin() const { return _entries.begin(); }
  const_iterator end() const { return _entries.end(); }

  // Entry order does not take part in equality.
  bool operator==(const Dictionary& rhs) const;
  bool operator!=(const Dictionary& rhs) const { return !(*this == rhs); }

 private:
  std::vector<entry_type> _entries;
  std::map<std::string, std::size_t> _index;
};

} // namespace PlistFlow

#endif
