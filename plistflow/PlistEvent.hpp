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

#ifndef __PLISTFLOW_EVENT_H__
#define __PLISTFLOW_EVENT_H__

#include <boost/cstdint.hpp>
#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include <iosfwd>
#include <string>

#include "PlistValue.hpp"

namespace PlistFlow {

enum EventType {
  StartArrayEvent,
  StartDictionaryEvent,
  EndCollectionEvent,
  BooleanEvent,
  DataEvent,
  DateEvent,
  IntegerEvent,
  RealEvent,
  StringEvent,
  UidEvent
};

const char* eventTypeName(EventType type);

// A plist flattened into a token stream.  Dictionary keys and values are
// represented as pairs of events:
//
//   StartDictionary
//   String("Height")   key
//   Real(181.2)        value
//   String("Age")      key
//   Integer(28)        value
//   EndCollection
class Event {
 public:
  typedef boost::optional<boost::uint64_t> size_hint_type;

  Event();

  // Collection sizes are hints for preallocation only and are never trusted
  // for bounds.
  static Event startArray(size_hint_type size = size_hint_type());
  static Event startDictionary(size_hint_type size = size_hint_type());
  static Event endCollection();

  static Event boolean(bool value);
  static Event data(const data_type& value);
  static Event date(const Date& value);
  static Event integer(const Integer& value);
  static Event real(double value);
  static Event string(const std::string& value);
  static Event uid(const Uid& value);

  EventType type() const { return _type; }

  size_hint_type sizeHint() const;
  bool asBoolean() const;
  const data_type& asData() const;
  const Date& asDate() const;
  const Integer& asInteger() const;
  double asReal() const;
  const std::string& asString() const;
  const Uid& asUid() const;

  bool operator==(const Event& rhs) const;
  bool operator!=(const Event& rhs) const { return !(*this == rhs); }

 private:
  typedef boost::variant<boost::blank, boost::uint64_t, bool, data_type,
                         Date, Integer, double, std::string, Uid>
      payload_type;

  Event(EventType type, const payload_type& payload)
      : _type(type), _payload(payload) {}

  EventType _type;
  payload_type _payload;
};

std::ostream& operator<<(std::ostream& stream, const Event& event);

// Producer role.  Emits the events of exactly one value in depth first order
// and then reports the end of the stream.  After next() has thrown, the
// stream is poisoned and every later call throws again.
class EventReader {
 public:
  virtual ~EventReader() {}

  // Stores the next event and returns true, or returns false once the value
  // is complete.
  virtual bool next(Event& event) = 0;
};

// Consumer role.  Accepts events in producer order.
class EventWriter {
 public:
  virtual ~EventWriter() {}

  void write(const Event& event);

  virtual void writeStartArray(Event::size_hint_type size) = 0;
  virtual void writeStartDictionary(Event::size_hint_type size) = 0;
  virtual void writeEndCollection() = 0;

  virtual void writeBoolean(bool value) = 0;
  virtual void writeData(const data_type& value) = 0;
  virtual void writeDate(const Date& value) = 0;
  virtual void writeInteger(const Integer& value) = 0;
  virtual void writeReal(double value) = 0;
  virtual void writeString(const std::string& value) = 0;
  virtual void writeUid(const Uid& value) = 0;
};

// Pumps every event the reader produces into the writer, e.g. to transcode
// between formats without building a Value.
void copyEvents(EventReader& reader, EventWriter& writer);

} // namespace PlistFlow

#endif
