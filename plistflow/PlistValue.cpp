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

#include "PlistValue.hpp"

#include "PlistError.hpp"

namespace PlistFlow {

namespace {

Error kindMismatch(Value::Type expected, Value::Type found) {
  return Error(TypeMismatch, std::string("Plist: expected ") +
                                 valueTypeName(expected) + " but value is " +
                                 valueTypeName(found));
}

} // namespace

Value::Value() : _storage(array_type()) {}
Value::Value(const Value& other) : _storage(other._storage) {}
Value::~Value() {}

Value& Value::operator=(const Value& other) {
  _storage = other._storage;
  return *this;
}

// Leaves other as an empty array.
Value::Value(Value&& other) noexcept : _storage(array_type()) {
  swap(other);
}

Value& Value::operator=(Value&& other) noexcept {
  swap(other);
  return *this;
}

void Value::swap(Value& other) {
  _storage.swap(other._storage);
}

Value::Value(const array_type& value) : _storage(value) {}
Value::Value(const dictionary_type& value) : _storage(value) {}
Value::Value(const string_type& value) : _storage(value) {}
Value::Value(const char* value) : _storage(string_type(value)) {}
Value::Value(bool value) : _storage(value) {}
Value::Value(double value) : _storage(value) {}
Value::Value(const integer_type& value) : _storage(value) {}
Value::Value(int value) : _storage(integer_type(value)) {}
Value::Value(unsigned value) : _storage(integer_type(value)) {}
Value::Value(long value) : _storage(integer_type(value)) {}
Value::Value(unsigned long value) : _storage(integer_type(value)) {}
Value::Value(long long value) : _storage(integer_type(value)) {}
Value::Value(unsigned long long value) : _storage(integer_type(value)) {}
Value::Value(const data_type& value) : _storage(value) {}
Value::Value(const date_type& value) : _storage(value) {}
Value::Value(const uid_type& value) : _storage(value) {}

Value::Type Value::type() const {
  return static_cast<Type>(_storage.which());
}

const array_type& Value::asArray() const {
  if (type() != ArrayType)
    throw kindMismatch(ArrayType, type());
  return boost::get<array_type>(_storage);
}

array_type& Value::asArray() {
  if (type() != ArrayType)
    throw kindMismatch(ArrayType, type());
  return boost::get<array_type>(_storage);
}

const dictionary_type& Value::asDictionary() const {
  if (type() != DictionaryType)
    throw kindMismatch(DictionaryType, type());
  return boost::get<dictionary_type>(_storage);
}

dictionary_type& Value::asDictionary() {
  if (type() != DictionaryType)
    throw kindMismatch(DictionaryType, type());
  return boost::get<dictionary_type>(_storage);
}

const string_type& Value::asString() const {
  if (type() != StringType)
    throw kindMismatch(StringType, type());
  return boost::get<string_type>(_storage);
}

bool Value::asBoolean() const {
  if (type() != BooleanType)
    throw kindMismatch(BooleanType, type());
  return boost::get<bool>(_storage);
}

double Value::asReal() const {
  if (type() != RealType)
    throw kindMismatch(RealType, type());
  return boost::get<double>(_storage);
}

const integer_type& Value::asInteger() const {
  if (type() != IntegerType)
    throw kindMismatch(IntegerType, type());
  return boost::get<integer_type>(_storage);
}

const data_type& Value::asData() const {
  if (type() != DataType)
    throw kindMismatch(DataType, type());
  return boost::get<data_type>(_storage);
}

const date_type& Value::asDate() const {
  if (type() != DateType)
    throw kindMismatch(DateType, type());
  return boost::get<date_type>(_storage);
}

const uid_type& Value::asUid() const {
  if (type() != UidType)
    throw kindMismatch(UidType, type());
  return boost::get<uid_type>(_storage);
}

bool Value::operator==(const Value& rhs) const {
  if (type() != rhs.type())
    return false;

  switch (type()) {
  case ArrayType:
    return asArray() == rhs.asArray();
  case DictionaryType:
    return asDictionary() == rhs.asDictionary();
  case StringType:
    return asString() == rhs.asString();
  case BooleanType:
    return asBoolean() == rhs.asBoolean();
  case RealType:
    return asReal() == rhs.asReal();
  case IntegerType:
    return asInteger() == rhs.asInteger();
  case DataType:
    return asData() == rhs.asData();
  case DateType:
    return asDate() == rhs.asDate();
  case UidType:
    return asUid() == rhs.asUid();
  }
  return false;
}

const char* valueTypeName(Value::Type type) {
  switch (type) {
  case Value::ArrayType:
    return "Array";
  case Value::DictionaryType:
    return "Dictionary";
  case Value::StringType:
    return "String";
  case Value::BooleanType:
    return "Boolean";
  case Value::RealType:
    return "Real";
  case Value::IntegerType:
    return "Integer";
  case Value::DataType:
    return "Data";
  case Value::DateType:
    return "Date";
  case Value::UidType:
    return "Uid";
  }
  return "Unknown";
}

void Dictionary::insert(const std::string& key, const Value& value) {
  (*this)[key] = value;
}

bool Dictionary::erase(const std::string& key) {
  std::map<std::string, std::size_t>::iterator found = _index.find(key);
  if (found == _index.end())
    return false;

  const std::size_t position = found->second;
  _entries.erase(_entries.begin() + position);
  _index.erase(found);
  for (std::map<std::string, std::size_t>::iterator it = _index.begin();
       it != _index.end();
       ++it) {
    if (it->second > position)
      --it->second;
  }
  return true;
}

const Value* Dictionary::find(const std::string& key) const {
  std::map<std::string, std::size_t>::const_iterator found = _index.find(key);
  if (found == _index.end())
    return 0;
  return &_entries[found->second].second;
}

Value* Dictionary::find(const std::string& key) {
  std::map<std::string, std::size_t>::iterator found = _index.find(key);
  if (found == _index.end())
    return 0;
  return &_entries[found->second].second;
}

const Value& Dictionary::at(const std::string& key) const {
  const Value* value = find(key);
  if (!value)
    throw Error(MissingField, "Plist: dictionary has no key " + key);
  return *value;
}

Value& Dictionary::operator[](const std::string& key) {
  Value* value = find(key);
  if (value)
    return *value;
  _index[key] = _entries.size();
  _entries.push_back(entry_type(key, Value()));
  return _entries.back().second;
}

bool Dictionary::operator==(const Dictionary& rhs) const {
  if (size() != rhs.size())
    return false;

  for (const_iterator it = _entries.begin(); it != _entries.end(); ++it) {
    const Value* other = rhs.find(it->first);
    if (!other || *other != it->second)
      return false;
  }
  return true;
}

} // namespace PlistFlow
