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

#ifndef __PLISTFLOW_SERIALIZE_H__
#define __PLISTFLOW_SERIALIZE_H__

#ifndef PLISTFLOW_ENABLE_SERIALIZE
#error "PlistSerialize.hpp requires the PLISTFLOW_WITH_SERIALIZE build option"
#endif

#include <boost/fusion/include/at_c.hpp>
#include <boost/fusion/include/is_sequence.hpp>
#include <boost/fusion/include/size.hpp>
#include <boost/fusion/include/struct.hpp>
#include <boost/fusion/include/value_at.hpp>
#include <boost/optional.hpp>
#include <boost/utility/enable_if.hpp>

#include <limits>
#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include "Plist.hpp"

namespace PlistFlow {

// Pull side of the structured bridge.  Wraps a producer with one event of
// lookahead and tracks the field path used in error messages.
class Deserializer {
 public:
  explicit Deserializer(EventReader& reader) : _reader(reader) {}

  const Event& peek() {
    if (!_peeked) {
      Event event;
      if (!_reader.next(event))
        throw fail(UnexpectedEndOfEvents,
                   "Plist: event stream ended before the value was complete");
      _peeked = event;
    }
    return *_peeked;
  }

  Event next() {
    Event event = peek();
    _peeked = boost::none;
    return event;
  }

  Event expect(EventType type) {
    Event event = next();
    if (event.type() != type)
      throw fail(TypeMismatch, std::string("Plist: expected ") +
                                   eventTypeName(type) + " but found " +
                                   eventTypeName(event.type()));
    return event;
  }

  bool hasMore() {
    if (_peeked)
      return true;
    Event event;
    if (!_reader.next(event))
      return false;
    _peeked = event;
    return true;
  }

  // Consumes one complete value, collections included.
  void skipValue() {
    std::size_t depth = 0;
    do {
      Event event = next();
      if (event.type() == StartArrayEvent ||
          event.type() == StartDictionaryEvent)
        ++depth;
      else if (event.type() == EndCollectionEvent)
        --depth;
    } while (depth > 0);
  }

  void enterField(const std::string& name) {
    _path.push_back(_path.empty() ? name : "." + name);
  }
  void enterIndex(std::size_t index) {
    _path.push_back("[" + std::to_string(index) + "]");
  }
  void leave() { _path.pop_back(); }

  std::string path() const {
    std::string joined;
    for (std::size_t i = 0; i < _path.size(); ++i)
      joined += _path[i];
    return joined;
  }

  Error fail(ErrorKind kind, const std::string& what) const {
    return Error(kind, what).atPath(path());
  }

 private:
  EventReader& _reader;
  boost::optional<Event> _peeked;
  std::vector<std::string> _path;
};

// Serialize<T> maps a host type onto events.  write() emits exactly one
// value; read() consumes exactly one.
template <typename T, typename Enable = void>
struct Serialize;

template <typename T>
struct IsOptional : std::false_type {};

template <typename T>
struct IsOptional<boost::optional<T> > : std::true_type {};

template <typename T>
bool isPresent(const T&) {
  return true;
}

template <typename T>
bool isPresent(const boost::optional<T>& value) {
  return static_cast<bool>(value);
}

template <typename T>
void toEvents(const T& value, EventWriter& writer) {
  Serialize<T>::write(writer, value);
}

template <typename T>
T fromEvents(EventReader& reader) {
  Deserializer deserializer(reader);
  T value;
  Serialize<T>::read(deserializer, value);
  if (deserializer.hasMore())
    throw Error(TrailingData, std::string("Plist: unexpected ") +
                                  eventTypeName(deserializer.peek().type()) +
                                  " event after the value");
  return value;
}

template <>
struct Serialize<bool> {
  static void write(EventWriter& writer, bool value) {
    writer.write(Event::boolean(value));
  }
  static void read(Deserializer& in, bool& value) {
    value = in.expect(BooleanEvent).asBoolean();
  }
};

template <typename T>
struct Serialize<
    T, typename boost::enable_if_c<std::is_integral<T>::value &&
                                   !std::is_same<T, bool>::value &&
                                   sizeof(T) <= 8>::type> {
  static void write(EventWriter& writer, T value) {
    writer.write(Event::integer(Integer::fromInt128(value)));
  }
  static void read(Deserializer& in, T& value) {
    const Integer integer = in.expect(IntegerEvent).asInteger();
    if (integer.value() < static_cast<int128_type>(std::numeric_limits<T>::min()) ||
        integer.value() > static_cast<int128_type>(std::numeric_limits<T>::max()))
      throw in.fail(IntegerOverflow, "Plist: integer " + integer.toString() +
                                         " does not fit the field type");
    value = static_cast<T>(integer.value());
  }
};

#ifdef PLISTFLOW_ENABLE_UNSTABLE_KINDS
template <>
struct Serialize<int128_type> {
  static void write(EventWriter& writer, int128_type value) {
    writer.write(Event::integer(Integer::fromInt128(value)));
  }
  static void read(Deserializer& in, int128_type& value) {
    value = in.expect(IntegerEvent).asInteger().value();
  }
};
#endif

template <typename T>
struct Serialize<
    T, typename boost::enable_if<std::is_floating_point<T> >::type> {
  static void write(EventWriter& writer, T value) {
    writer.write(Event::real(static_cast<double>(value)));
  }
  static void read(Deserializer& in, T& value) {
    value = static_cast<T>(in.expect(RealEvent).asReal());
  }
};

template <>
struct Serialize<std::string> {
  static void write(EventWriter& writer, const std::string& value) {
    writer.write(Event::string(value));
  }
  static void read(Deserializer& in, std::string& value) {
    value = in.expect(StringEvent).asString();
  }
};

// Raw bytes travel as Data, never as an array of integers.
template <>
struct Serialize<data_type> {
  static void write(EventWriter& writer, const data_type& value) {
    writer.write(Event::data(value));
  }
  static void read(Deserializer& in, data_type& value) {
    value = in.expect(DataEvent).asData();
  }
};

template <>
struct Serialize<Date> {
  static void write(EventWriter& writer, const Date& value) {
    writer.write(Event::date(value));
  }
  static void read(Deserializer& in, Date& value) {
    value = in.expect(DateEvent).asDate();
  }
};

template <>
struct Serialize<Uid> {
  static void write(EventWriter& writer, const Uid& value) {
    writer.write(Event::uid(value));
  }
  static void read(Deserializer& in, Uid& value) {
    value = in.expect(UidEvent).asUid();
  }
};

template <>
struct Serialize<Integer> {
  static void write(EventWriter& writer, const Integer& value) {
    writer.write(Event::integer(value));
  }
  static void read(Deserializer& in, Integer& value) {
    value = in.expect(IntegerEvent).asInteger();
  }
};

// Any sub-tree, unchanged.
template <>
struct Serialize<Value> {
  static void write(EventWriter& writer, const Value& value) {
    ValueReader reader(value);
    copyEvents(reader, writer);
  }
  static void read(Deserializer& in, Value& value) {
    ValueBuilder builder;
    while (!builder.isComplete())
      builder.write(in.next());
    value = builder.value();
  }
};

template <typename T>
struct Serialize<boost::optional<T> > {
  static void write(EventWriter& writer, const boost::optional<T>& value) {
    if (!value)
      throw Error(InvalidData,
                  "Plist: an empty optional has no representation");
    Serialize<T>::write(writer, *value);
  }
  static void read(Deserializer& in, boost::optional<T>& value) {
    T inner;
    Serialize<T>::read(in, inner);
    value = inner;
  }
};

template <typename T>
struct Serialize<std::vector<T> > {
  static void write(EventWriter& writer, const std::vector<T>& value) {
    writer.write(Event::startArray(static_cast<boost::uint64_t>(value.size())));
    for (typename std::vector<T>::const_iterator it = value.begin();
         it != value.end();
         ++it)
      Serialize<T>::write(writer, *it);
    writer.write(Event::endCollection());
  }
  static void read(Deserializer& in, std::vector<T>& value) {
    in.expect(StartArrayEvent);
    std::vector<T> elements;
    while (in.peek().type() != EndCollectionEvent) {
      in.enterIndex(elements.size());
      T element;
      Serialize<T>::read(in, element);
      elements.push_back(element);
      in.leave();
    }
    in.next();
    value.swap(elements);
  }
};

template <typename T>
struct Serialize<std::map<std::string, T> > {
  static void write(EventWriter& writer,
                    const std::map<std::string, T>& value) {
    writer.write(
        Event::startDictionary(static_cast<boost::uint64_t>(value.size())));
    for (typename std::map<std::string, T>::const_iterator it = value.begin();
         it != value.end();
         ++it) {
      writer.write(Event::string(it->first));
      Serialize<T>::write(writer, it->second);
    }
    writer.write(Event::endCollection());
  }
  static void read(Deserializer& in, std::map<std::string, T>& value) {
    in.expect(StartDictionaryEvent);
    std::map<std::string, T> entries;
    while (in.peek().type() != EndCollectionEvent) {
      const std::string key = in.expect(StringEvent).asString();
      in.enterField(key);
      Serialize<T>::read(in, entries[key]);
      in.leave();
    }
    in.next();
    value.swap(entries);
  }
};

// Fields of a BOOST_FUSION_ADAPT_STRUCT record, walked from index N.
template <typename T, int N,
          int Size = boost::fusion::result_of::size<T>::type::value>
struct RecordFields {
  typedef typename boost::fusion::result_of::value_at_c<T, N>::type
      member_type;
  typedef RecordFields<T, N + 1, Size> rest;

  static const char* name() {
    return boost::fusion::extension::struct_member_name<T, N>::call();
  }

  static void write(EventWriter& writer, const T& record) {
    const member_type& member = boost::fusion::at_c<N>(record);
    if (isPresent(member)) {
      writer.write(Event::string(name()));
      Serialize<member_type>::write(writer, member);
    }
    rest::write(writer, record);
  }

  static bool read(Deserializer& in, T& record, const std::string& key,
                   std::vector<bool>& seen) {
    if (key != name())
      return rest::read(in, record, key, seen);

    in.enterField(key);
    Serialize<member_type>::read(in, boost::fusion::at_c<N>(record));
    in.leave();
    seen[N] = true;
    return true;
  }

  static void checkRequired(Deserializer& in, const std::vector<bool>& seen) {
    if (!seen[N] && !IsOptional<member_type>::value) {
      in.enterField(name());
      throw in.fail(MissingField,
                    std::string("Plist: missing field ") + name());
    }
    rest::checkRequired(in, seen);
  }
};

template <typename T, int Size>
struct RecordFields<T, Size, Size> {
  static void write(EventWriter&, const T&) {}
  static bool read(Deserializer&, T&, const std::string&, std::vector<bool>&) {
    return false;
  }
  static void checkRequired(Deserializer&, const std::vector<bool>&) {}
};

template <typename T>
struct Serialize<
    T, typename boost::enable_if<boost::fusion::traits::is_sequence<T> >::type> {
  typedef RecordFields<T, 0> fields;

  static void write(EventWriter& writer, const T& value) {
    writer.write(Event::startDictionary());
    fields::write(writer, value);
    writer.write(Event::endCollection());
  }

  static void read(Deserializer& in, T& value) {
    in.expect(StartDictionaryEvent);

    T record;
    std::vector<bool> seen(boost::fusion::result_of::size<T>::type::value,
                           false);
    while (in.peek().type() != EndCollectionEvent) {
      const Event key = in.next();
      if (key.type() != StringEvent)
        throw in.fail(UnexpectedEvent, "Plist: dictionary key must be a string");
      if (!fields::read(in, record, key.asString(), seen))
        in.skipValue();
    }
    in.next();

    fields::checkRequired(in, seen);
    value = record;
  }
};

// Structured conveniences.  Plist type (binary or xml) automatically
// detected on read.

template <typename T>
void readPlist(const char* byteArray, int64_t size, T& message) {
  if (!byteArray || size <= 0)
    throw Error(TruncatedInput, "Plist: Empty plist data");

  if (isBinaryPlist(byteArray, size)) {
    BinaryReader reader(byteArray, static_cast<std::size_t>(size));
    message = fromEvents<T>(reader);
  } else {
    XmlReader reader(byteArray, static_cast<std::size_t>(size));
    message = fromEvents<T>(reader);
  }
}

template <typename T>
void writePlistBinary(std::ostream& stream, const T& message) {
  BinaryWriter writer(stream);
  toEvents(message, writer);
}

template <typename T>
void writePlistXML(std::ostream& stream, const T& message,
                   const XmlWriteOptions& options = XmlWriteOptions()) {
  XmlWriter writer(stream, options);
  toEvents(message, writer);
}

} // namespace PlistFlow

#endif
