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

#include "PlistEvent.hpp"

#include "PlistError.hpp"

#include <ostream>

namespace PlistFlow {

namespace {

Error wrongEventKind(EventType expected, EventType found) {
  return Error(TypeMismatch, std::string("Plist: expected ") +
                                 eventTypeName(expected) + " event but found " +
                                 eventTypeName(found));
}

} // namespace

const char* eventTypeName(EventType type) {
  switch (type) {
  case StartArrayEvent:
    return "StartArray";
  case StartDictionaryEvent:
    return "StartDictionary";
  case EndCollectionEvent:
    return "EndCollection";
  case BooleanEvent:
    return "Boolean";
  case DataEvent:
    return "Data";
  case DateEvent:
    return "Date";
  case IntegerEvent:
    return "Integer";
  case RealEvent:
    return "Real";
  case StringEvent:
    return "String";
  case UidEvent:
    return "Uid";
  }
  return "Unknown";
}

Event::Event() : _type(EndCollectionEvent) {}

Event Event::startArray(size_hint_type size) {
  if (size)
    return Event(StartArrayEvent, *size);
  return Event(StartArrayEvent, boost::blank());
}

Event Event::startDictionary(size_hint_type size) {
  if (size)
    return Event(StartDictionaryEvent, *size);
  return Event(StartDictionaryEvent, boost::blank());
}

Event Event::endCollection() {
  return Event(EndCollectionEvent, boost::blank());
}

Event Event::boolean(bool value) {
  return Event(BooleanEvent, value);
}

Event Event::data(const data_type& value) {
  return Event(DataEvent, value);
}

Event Event::date(const Date& value) {
  return Event(DateEvent, value);
}

Event Event::integer(const Integer& value) {
  return Event(IntegerEvent, value);
}

Event Event::real(double value) {
  return Event(RealEvent, value);
}

Event Event::string(const std::string& value) {
  return Event(StringEvent, value);
}

Event Event::uid(const Uid& value) {
  return Event(UidEvent, value);
}

Event::size_hint_type Event::sizeHint() const {
  if (_type != StartArrayEvent && _type != StartDictionaryEvent)
    throw wrongEventKind(StartArrayEvent, _type);
  if (const boost::uint64_t* size = boost::get<boost::uint64_t>(&_payload))
    return *size;
  return size_hint_type();
}

bool Event::asBoolean() const {
  if (_type != BooleanEvent)
    throw wrongEventKind(BooleanEvent, _type);
  return boost::get<bool>(_payload);
}

const data_type& Event::asData() const {
  if (_type != DataEvent)
    throw wrongEventKind(DataEvent, _type);
  return boost::get<data_type>(_payload);
}

const Date& Event::asDate() const {
  if (_type != DateEvent)
    throw wrongEventKind(DateEvent, _type);
  return boost::get<Date>(_payload);
}

const Integer& Event::asInteger() const {
  if (_type != IntegerEvent)
    throw wrongEventKind(IntegerEvent, _type);
  return boost::get<Integer>(_payload);
}

double Event::asReal() const {
  if (_type != RealEvent)
    throw wrongEventKind(RealEvent, _type);
  return boost::get<double>(_payload);
}

const std::string& Event::asString() const {
  if (_type != StringEvent)
    throw wrongEventKind(StringEvent, _type);
  return boost::get<std::string>(_payload);
}

const Uid& Event::asUid() const {
  if (_type != UidEvent)
    throw wrongEventKind(UidEvent, _type);
  return boost::get<Uid>(_payload);
}

bool Event::operator==(const Event& rhs) const {
  if (_type != rhs._type)
    return false;

  switch (_type) {
  case StartArrayEvent:
  case StartDictionaryEvent:
    return sizeHint() == rhs.sizeHint();
  case EndCollectionEvent:
    return true;
  case BooleanEvent:
    return asBoolean() == rhs.asBoolean();
  case DataEvent:
    return asData() == rhs.asData();
  case DateEvent:
    return asDate() == rhs.asDate();
  case IntegerEvent:
    return asInteger() == rhs.asInteger();
  case RealEvent:
    return asReal() == rhs.asReal();
  case StringEvent:
    return asString() == rhs.asString();
  case UidEvent:
    return asUid() == rhs.asUid();
  }
  return false;
}

std::ostream& operator<<(std::ostream& stream, const Event& event) {
  stream << eventTypeName(event.type());
  switch (event.type()) {
  case StartArrayEvent:
  case StartDictionaryEvent:
    if (event.sizeHint())
      stream << "(" << *event.sizeHint() << ")";
    break;
  case EndCollectionEvent:
    break;
  case BooleanEvent:
    stream << "(" << (event.asBoolean() ? "true" : "false") << ")";
    break;
  case DataEvent:
    stream << "(" << event.asData().size() << " bytes)";
    break;
  case DateEvent:
    stream << "(" << event.asDate().timeAsXMLConvention() << ")";
    break;
  case IntegerEvent:
    stream << "(" << event.asInteger().toString() << ")";
    break;
  case RealEvent:
    stream << "(" << event.asReal() << ")";
    break;
  case StringEvent:
    stream << "(\"" << event.asString() << "\")";
    break;
  case UidEvent:
    stream << "(" << event.asUid().get() << ")";
    break;
  }
  return stream;
}

void EventWriter::write(const Event& event) {
  switch (event.type()) {
  case StartArrayEvent:
    writeStartArray(event.sizeHint());
    break;
  case StartDictionaryEvent:
    writeStartDictionary(event.sizeHint());
    break;
  case EndCollectionEvent:
    writeEndCollection();
    break;
  case BooleanEvent:
    writeBoolean(event.asBoolean());
    break;
  case DataEvent:
    writeData(event.asData());
    break;
  case DateEvent:
    writeDate(event.asDate());
    break;
  case IntegerEvent:
    writeInteger(event.asInteger());
    break;
  case RealEvent:
    writeReal(event.asReal());
    break;
  case StringEvent:
    writeString(event.asString());
    break;
  case UidEvent:
    writeUid(event.asUid());
    break;
  }
}

void copyEvents(EventReader& reader, EventWriter& writer) {
  Event event;
  while (reader.next(event))
    writer.write(event);
}

} // namespace PlistFlow
