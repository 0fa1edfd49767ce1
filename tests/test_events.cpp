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

#include <gtest/gtest.h>

#include <sstream>

#include "plistflow/PlistError.hpp"
#include "plistflow/PlistEvent.hpp"
#include "plistflow/PlistValueEvents.hpp"
#include "PlistTestHelpers.hpp"

namespace PlistFlow {

namespace {

Value sampleValue() {
  Dictionary dict;
  dict.insert("name", Value("plist"));
  dict.insert("count", Value(3));
  array_type list;
  list.push_back(Value(true));
  list.push_back(Value(Uid(9)));
  dict.insert("list", Value(list));
  return Value(dict);
}

} // namespace

TEST(EventTest, AccessorsCheckKind) {
  Event event = Event::integer(Integer(5));
  EXPECT_EQ(IntegerEvent, event.type());
  EXPECT_EQ(Integer(5), event.asInteger());
  EXPECT_THROW(event.asString(), Error);
  EXPECT_FALSE(event.sizeHint());

  Event start = Event::startArray(4);
  ASSERT_TRUE(start.sizeHint());
  EXPECT_EQ(4u, *start.sizeHint());
}

TEST(EventTest, Printable) {
  std::ostringstream out;
  out << Event::string("key");
  EXPECT_NE(std::string::npos, out.str().find("String"));
}

TEST(ValueReaderTest, WalksDictionaryInOrder) {
  Value value = sampleValue();
  ValueReader reader(value);
  std::vector<Event> events = readAllEvents(reader);

  std::vector<Event> expected;
  expected.push_back(Event::startDictionary(3));
  expected.push_back(Event::string("name"));
  expected.push_back(Event::string("plist"));
  expected.push_back(Event::string("count"));
  expected.push_back(Event::integer(Integer(3)));
  expected.push_back(Event::string("list"));
  expected.push_back(Event::startArray(2));
  expected.push_back(Event::boolean(true));
  expected.push_back(Event::uid(Uid(9)));
  expected.push_back(Event::endCollection());
  expected.push_back(Event::endCollection());
  EXPECT_EQ(expected, events);
}

TEST(ValueReaderTest, ScalarRootIsOneEvent) {
  Value value(2.5);
  ValueReader reader(value);
  std::vector<Event> events = readAllEvents(reader);
  ASSERT_EQ(1u, events.size());
  EXPECT_EQ(Event::real(2.5), events[0]);
}

TEST(ValueBuilderTest, RoundTripsThroughEvents) {
  Value original = sampleValue();
  ValueReader reader(original);
  EXPECT_EQ(original, readValue(reader));
}

TEST(ValueBuilderTest, BuildsSingleEntryDictionary) {
  EventList events;
  events << Event::startDictionary(1) << Event::string("a")
         << Event::boolean(true) << Event::endCollection();

  Dictionary expected;
  expected.insert("a", Value(true));
  EXPECT_EQ(Value(expected), readValue(events));
}

TEST(ValueBuilderTest, RejectsMisnesting) {
  ValueBuilder builder;
  EXPECT_THROW(builder.write(Event::endCollection()), Error);

  ValueBuilder keyed;
  keyed.write(Event::startDictionary());
  try {
    keyed.write(Event::integer(Integer(1)));
    FAIL() << "expected an Error";
  } catch (const Error& e) {
    EXPECT_EQ(UnexpectedEvent, e.kind());
  }

  ValueBuilder dangling;
  dangling.write(Event::startDictionary());
  dangling.write(Event::string("key"));
  EXPECT_THROW(dangling.write(Event::endCollection()), Error);

  ValueBuilder done;
  done.write(Event::boolean(false));
  EXPECT_TRUE(done.isComplete());
  EXPECT_THROW(done.write(Event::boolean(true)), Error);
}

TEST(ValueBuilderTest, IncompleteValue) {
  ValueBuilder builder;
  builder.write(Event::startArray());
  EXPECT_FALSE(builder.isComplete());
  EXPECT_THROW(builder.value(), Error);

  EventList events;
  events << Event::startArray() << Event::boolean(true);
  try {
    readValue(events);
    FAIL() << "expected an Error";
  } catch (const Error& e) {
    EXPECT_EQ(UnexpectedEndOfEvents, e.kind());
  }
}

TEST(ValueBuilderTest, TrailingEvents) {
  EventList events;
  events << Event::boolean(true) << Event::boolean(false);
  try {
    readValue(events);
    FAIL() << "expected an Error";
  } catch (const Error& e) {
    EXPECT_EQ(TrailingData, e.kind());
  }
}

TEST(CopyEventsTest, PumpsEveryEvent) {
  Value original = sampleValue();
  ValueReader reader(original);
  EventRecorder recorder;
  copyEvents(reader, recorder);

  ValueReader again(original);
  EXPECT_EQ(readAllEvents(again), recorder.events);
}

} // namespace PlistFlow
