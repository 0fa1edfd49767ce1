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

#include "PlistValueEvents.hpp"

#include "PlistError.hpp"

#include <algorithm>

namespace PlistFlow {

namespace {

// Upper bound for preallocation from an untrusted size hint.
const boost::uint64_t kMaxReserve = 1024;

} // namespace

ValueReader::ValueReader(const Value& value) : _root(value), _started(false) {}

bool ValueReader::next(Event& event) {
  if (!_started) {
    _started = true;
    event = handleValue(_root);
    return true;
  }

  if (_stack.empty())
    return false;

  StackItem& item = _stack.back();
  if (item.collection->isArray()) {
    const array_type& array = item.collection->asArray();
    if (item.position < array.size()) {
      // handleValue may push, which invalidates item
      const Value& element = array[item.position++];
      event = handleValue(element);
    } else {
      _stack.pop_back();
      event = Event::endCollection();
    }
    return true;
  }

  const dictionary_type& dict = item.collection->asDictionary();
  if (item.valuePending) {
    item.valuePending = false;
    const Value& value = (dict.begin() + (item.position - 1))->second;
    event = handleValue(value);
  } else if (item.position < dict.size()) {
    const std::string& key = (dict.begin() + item.position)->first;
    ++item.position;
    item.valuePending = true;
    event = Event::string(key);
  } else {
    _stack.pop_back();
    event = Event::endCollection();
  }
  return true;
}

Event ValueReader::handleValue(const Value& value) {
  switch (value.type()) {
  case Value::ArrayType: {
    StackItem item = {&value, 0, false};
    _stack.push_back(item);
    return Event::startArray(
        static_cast<boost::uint64_t>(value.asArray().size()));
  }
  case Value::DictionaryType: {
    StackItem item = {&value, 0, false};
    _stack.push_back(item);
    return Event::startDictionary(
        static_cast<boost::uint64_t>(value.asDictionary().size()));
  }
  case Value::StringType:
    return Event::string(value.asString());
  case Value::BooleanType:
    return Event::boolean(value.asBoolean());
  case Value::RealType:
    return Event::real(value.asReal());
  case Value::IntegerType:
    return Event::integer(value.asInteger());
  case Value::DataType:
    return Event::data(value.asData());
  case Value::DateType:
    return Event::date(value.asDate());
  case Value::UidType:
    return Event::uid(value.asUid());
  }
  throw Error(InvalidData, "Plist: unknown value type");
}

ValueBuilder::ValueBuilder() : _complete(false) {}

void ValueBuilder::writeStartArray(Event::size_hint_type size) {
  startCollection(array_type(), size);
}

void ValueBuilder::writeStartDictionary(Event::size_hint_type size) {
  startCollection(dictionary_type(), size);
}

void ValueBuilder::writeEndCollection() {
  if (_stack.empty())
    throw Error(UnexpectedEvent,
                "Plist: EndCollection without an open collection");
  if (_stack.back().keyPending)
    throw Error(UnexpectedEvent, "Plist: dictionary key " +
                                     _stack.back().key + " has no value");

  Value collection;
  collection.swap(_stack.back().collection);
  _stack.pop_back();
  addValue(collection);
}

void ValueBuilder::writeBoolean(bool value) {
  Value v(value);
  addValue(v);
}

void ValueBuilder::writeData(const data_type& value) {
  Value v(value);
  addValue(v);
}

void ValueBuilder::writeDate(const Date& value) {
  Value v(value);
  addValue(v);
}

void ValueBuilder::writeInteger(const Integer& value) {
  Value v(value);
  addValue(v);
}

void ValueBuilder::writeReal(double value) {
  Value v(value);
  addValue(v);
}

void ValueBuilder::writeString(const std::string& value) {
  if (!_stack.empty() && _stack.back().collection.isDictionary() &&
      !_stack.back().keyPending) {
    _stack.back().key = value;
    _stack.back().keyPending = true;
    return;
  }

  Value v(value);
  addValue(v);
}

void ValueBuilder::writeUid(const Uid& value) {
  Value v(value);
  addValue(v);
}

const Value& ValueBuilder::value() const {
  if (!_complete)
    throw Error(UnexpectedEndOfEvents,
                "Plist: event stream ended before the value was complete");
  return _root;
}

void ValueBuilder::startCollection(const Value& collection,
                                   Event::size_hint_type size) {
  if (_complete)
    throw Error(UnexpectedEvent, "Plist: event after the complete value");
  if (!_stack.empty() && _stack.back().collection.isDictionary() &&
      !_stack.back().keyPending)
    throw Error(UnexpectedEvent, "Plist: dictionary key must be a string");

  StackItem item = {collection, std::string(), false};
  _stack.push_back(item);

  if (size) {
    std::size_t reserve =
        static_cast<std::size_t>(std::min(*size, kMaxReserve));
    if (_stack.back().collection.isArray())
      _stack.back().collection.asArray().reserve(reserve);
    else
      _stack.back().collection.asDictionary().reserve(reserve);
  }
}

void ValueBuilder::addValue(Value& value) {
  if (_complete)
    throw Error(UnexpectedEvent, "Plist: event after the complete value");

  if (_stack.empty()) {
    _root.swap(value);
    _complete = true;
    return;
  }

  StackItem& item = _stack.back();
  if (item.collection.isArray()) {
    array_type& array = item.collection.asArray();
    array.push_back(Value());
    array.back().swap(value);
    return;
  }

  if (!item.keyPending)
    throw Error(UnexpectedEvent, "Plist: dictionary key must be a string");
  item.collection.asDictionary()[item.key].swap(value);
  item.keyPending = false;
  item.key.clear();
}

Value readValue(EventReader& reader) {
  ValueBuilder builder;
  Event event;
  while (!builder.isComplete()) {
    if (!reader.next(event))
      throw Error(UnexpectedEndOfEvents,
                  "Plist: event stream ended before the value was complete");
    builder.write(event);
  }

  if (reader.next(event))
    throw Error(TrailingData, "Plist: unexpected " +
                                  std::string(eventTypeName(event.type())) +
                                  " event after the value");
  return builder.value();
}

} // namespace PlistFlow
