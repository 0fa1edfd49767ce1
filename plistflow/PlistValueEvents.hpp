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

#ifndef __PLISTFLOW_VALUE_EVENTS_H__
#define __PLISTFLOW_VALUE_EVENTS_H__

#include <string>
#include <vector>

#include "PlistEvent.hpp"
#include "PlistValue.hpp"

namespace PlistFlow {

// Walks a Value depth first and produces its events.  The value must outlive
// the reader.
class ValueReader : public EventReader {
 public:
  explicit ValueReader(const Value& value);

  bool next(Event& event);

 private:
  struct StackItem {
    const Value* collection;
    std::size_t position;
    bool valuePending;
  };

  Event handleValue(const Value& value);

  const Value& _root;
  bool _started;
  std::vector<StackItem> _stack;
};

// Builds a Value from the events written to it.
class ValueBuilder : public EventWriter {
 public:
  ValueBuilder();

  void writeStartArray(Event::size_hint_type size);
  void writeStartDictionary(Event::size_hint_type size);
  void writeEndCollection();

  void writeBoolean(bool value);
  void writeData(const data_type& value);
  void writeDate(const Date& value);
  void writeInteger(const Integer& value);
  void writeReal(double value);
  void writeString(const std::string& value);
  void writeUid(const Uid& value);

  // True once one complete value has been written.
  bool isComplete() const { return _complete; }

  // Throws Error(UnexpectedEndOfEvents) while the value is incomplete.
  const Value& value() const;

 private:
  struct StackItem {
    Value collection;
    std::string key;
    bool keyPending;
  };

  void startCollection(const Value& collection, Event::size_hint_type size);
  void addValue(Value& value);

  std::vector<StackItem> _stack;
  Value _root;
  bool _complete;
};

// Reads one value from the producer and requires the stream to end right
// after it.
Value readValue(EventReader& reader);

} // namespace PlistFlow

#endif
