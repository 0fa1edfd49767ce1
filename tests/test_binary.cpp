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

#include <limits>
#include <sstream>

#include "plistflow/Plist.hpp"
#include "PlistTestHelpers.hpp"

namespace PlistFlow {

namespace {

typedef std::vector<unsigned char> bytes_type;

bytes_type encode(const Value& value) {
  std::ostringstream stream;
  writePlistBinary(stream, value);
  const std::string out = stream.str();
  return bytes_type(out.begin(), out.end());
}

Value decode(const bytes_type& plist) {
  BinaryReader reader(plist);
  return readValue(reader);
}

ErrorKind decodeError(const bytes_type& plist) {
  try {
    decode(plist);
  } catch (const Error& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected an Error";
  return Io;
}

bytes_type object(unsigned char marker) { return bytes_type(1, marker); }

bytes_type object(unsigned char marker, const std::string& payload) {
  bytes_type out(1, marker);
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

bytes_type collection(unsigned char marker,
                      const std::vector<boost::uint64_t>& refs,
                      unsigned refSize) {
  bytes_type out(1, marker);
  for (std::size_t i = 0; i < refs.size(); ++i)
    appendBigEndian(out, refs[i], refSize);
  return out;
}

boost::uint64_t trailerField(const bytes_type& plist, std::size_t field) {
  boost::uint64_t value = 0;
  const std::size_t start = plist.size() - 32 + field;
  for (std::size_t i = 0; i < 8; ++i)
    value = (value << 8) | plist[start + i];
  return value;
}

} // namespace

TEST(BinaryReaderTest, SingleEntryDictionary) {
  std::vector<bytes_type> objects;
  objects.push_back(object(0xD1, std::string("\x01\x02", 2)));
  objects.push_back(object(0x51, "a"));
  objects.push_back(object(0x09));
  bytes_type plist = buildBinaryPlist(objects, 1, 1);

  BinaryReader reader(plist);
  std::vector<Event> events = readAllEvents(reader);

  std::vector<Event> expected;
  expected.push_back(Event::startDictionary(1));
  expected.push_back(Event::string("a"));
  expected.push_back(Event::boolean(true));
  expected.push_back(Event::endCollection());
  EXPECT_EQ(expected, events);

  Dictionary dict;
  dict.insert("a", Value(true));
  Value value = decode(plist);
  EXPECT_EQ(Value(dict), value);

  // the writer produces the same layout for the same value
  EXPECT_EQ(plist, encode(value));
  EXPECT_EQ(value, decode(encode(value)));
}

TEST(BinaryReaderTest, AllOffsetAndReferenceWidths) {
  const unsigned widths[] = {1, 2, 3, 4, 8};
  for (std::size_t o = 0; o < 5; ++o) {
    for (std::size_t r = 0; r < 5; ++r) {
      std::vector<boost::uint64_t> refs;
      refs.push_back(1);
      refs.push_back(2);

      std::vector<bytes_type> objects;
      objects.push_back(collection(0xA2, refs, widths[r]));
      objects.push_back(object(0x09));
      objects.push_back(object(0x51, "a"));
      bytes_type plist = buildBinaryPlist(objects, widths[o], widths[r]);

      array_type expected;
      expected.push_back(Value(true));
      expected.push_back(Value("a"));
      EXPECT_EQ(Value(expected), decode(plist))
          << "offset size " << widths[o] << ", ref size " << widths[r];
    }
  }
}

TEST(BinaryReaderTest, ShortInputIsTruncated) {
  bytes_type plist = toBytes("bplist00");
  plist.resize(20, 0);
  EXPECT_EQ(TruncatedInput, decodeError(plist));
  EXPECT_EQ(TruncatedInput, decodeError(bytes_type()));

  try {
    decode(plist);
  } catch (const Error& e) {
    ASSERT_TRUE(e.offset());
    EXPECT_EQ(0u, *e.offset());
  }
}

TEST(BinaryReaderTest, MalformedHeader) {
  std::vector<bytes_type> objects(1, object(0x09));
  bytes_type plist = buildBinaryPlist(objects, 1, 1);
  plist[7] = '1';
  EXPECT_EQ(MalformedHeader, decodeError(plist));
}

TEST(BinaryReaderTest, UnsupportedWidth) {
  std::vector<bytes_type> objects(1, object(0x09));
  EXPECT_EQ(UnsupportedWidth, decodeError(buildBinaryPlist(objects, 5, 1)));
  EXPECT_EQ(UnsupportedWidth, decodeError(buildBinaryPlist(objects, 1, 0)));
}

TEST(BinaryReaderTest, ReferencesOutOfRange) {
  std::vector<bytes_type> objects;
  objects.push_back(object(0x08));
  EXPECT_EQ(InvalidObjectReference,
            decodeError(buildBinaryPlist(objects, 1, 1, 1)));

  std::vector<boost::uint64_t> refs(1, 5);
  objects[0] = collection(0xA1, refs, 1);
  EXPECT_EQ(InvalidObjectReference, decodeError(buildBinaryPlist(objects, 1, 1)));
}

TEST(BinaryReaderTest, ObjectOffsetOutOfBounds) {
  std::vector<boost::uint64_t> refs(1, 1);
  std::vector<bytes_type> objects;
  objects.push_back(collection(0xA1, refs, 1));
  objects.push_back(object(0x09));
  bytes_type plist = buildBinaryPlist(objects, 1, 1);

  const boost::uint64_t offsetTable = trailerField(plist, 24);
  plist[offsetTable + 1] = 0xF0;
  EXPECT_EQ(ObjectOffsetOutOfBounds, decodeError(plist));

  plist[offsetTable + 1] = 0x02;
  EXPECT_EQ(ObjectOffsetOutOfBounds, decodeError(plist));
}

TEST(BinaryReaderTest, CyclesAreRejected) {
  std::vector<boost::uint64_t> refs(1, 0);
  std::vector<bytes_type> objects(1, collection(0xA1, refs, 1));
  EXPECT_EQ(InvalidObjectReference, decodeError(buildBinaryPlist(objects, 1, 1)));

  // a shared child is not a cycle
  refs.assign(2, 1);
  objects[0] = collection(0xA2, refs, 1);
  objects.push_back(object(0x09));
  array_type expected(2, Value(true));
  EXPECT_EQ(Value(expected), decode(buildBinaryPlist(objects, 1, 1)));
}

TEST(BinaryReaderTest, DictionaryKeysMustBeStrings) {
  std::vector<bytes_type> objects;
  objects.push_back(object(0xD1, std::string("\x01\x02", 2)));
  objects.push_back(object(0x09));
  objects.push_back(object(0x09));
  EXPECT_EQ(InvalidData, decodeError(buildBinaryPlist(objects, 1, 1)));
}

TEST(BinaryReaderTest, BytesAfterOffsetTable) {
  std::vector<bytes_type> objects(1, object(0x09));
  bytes_type plist = buildBinaryPlist(objects, 1, 1);
  plist.insert(plist.end() - 32, 0x00);
  EXPECT_EQ(TrailingData, decodeError(plist));
}

TEST(BinaryReaderTest, ErrorsPoisonTheReader) {
  std::vector<boost::uint64_t> refs(1, 7);
  std::vector<bytes_type> objects(1, collection(0xA1, refs, 1));
  BinaryReader reader(buildBinaryPlist(objects, 1, 1));

  Event event;
  ASSERT_TRUE(reader.next(event));
  EXPECT_EQ(StartArrayEvent, event.type());
  EXPECT_THROW(reader.next(event), Error);
  try {
    reader.next(event);
    FAIL() << "expected an Error";
  } catch (const Error& e) {
    EXPECT_EQ(InvalidObjectReference, e.kind());
  }
}

TEST(BinaryReaderTest, Utf16Strings) {
  std::vector<bytes_type> objects;
  objects.push_back(object(0x62, std::string("\x00\xe9\x00t", 4)));
  EXPECT_EQ(Value("\xc3\xa9t"), decode(buildBinaryPlist(objects, 1, 1)));

  objects[0] = object(0x62, std::string("\xd8\x3d\xde\x00", 4));
  EXPECT_EQ(Value("\xf0\x9f\x98\x80"), decode(buildBinaryPlist(objects, 1, 1)));

  // unpaired surrogate
  objects[0] = object(0x61, std::string("\xd8\x3d", 2));
  EXPECT_EQ(InvalidData, decodeError(buildBinaryPlist(objects, 1, 1)));
}

TEST(BinaryReaderTest, WideIntegers) {
  std::vector<bytes_type> objects;
  objects.push_back(object(0x14, std::string(16, '\xff')));
  EXPECT_EQ(Value(-1), decode(buildBinaryPlist(objects, 1, 1)));

  std::string twoTo64(16, '\0');
  twoTo64[7] = 1;
  objects[0] = object(0x14, twoTo64);
  EXPECT_EQ(Value(Integer::fromInt128(static_cast<int128_type>(1) << 64)),
            decode(buildBinaryPlist(objects, 1, 1)));

  // 32 bytes, the high half is sign extension
  objects[0] = object(0x15, std::string(16, '\0') + twoTo64);
  EXPECT_EQ(Value(Integer::fromInt128(static_cast<int128_type>(1) << 64)),
            decode(buildBinaryPlist(objects, 1, 1)));

  std::string tooWide(32, '\0');
  tooWide[3] = 1;
  objects[0] = object(0x15, tooWide);
  EXPECT_EQ(IntegerOverflow, decodeError(buildBinaryPlist(objects, 1, 1)));
}

TEST(BinaryReaderTest, DatesOutsideCalendarRange) {
  std::vector<bytes_type> objects;
  objects.push_back(object(0x33, std::string(8, '\0')));
  EXPECT_EQ(Value(Date(1, 1, 2001, 0, 0, 0)),
            decode(buildBinaryPlist(objects, 1, 1)));

  objects[0] = object(0x33, std::string("\x7e\x37\xe4\x3c\x88\x00\x75\x9c", 8));
  EXPECT_EQ(InvalidData, decodeError(buildBinaryPlist(objects, 1, 1)));

  objects[0] = object(0x33, std::string("\xc2\x6d\x1a\x94\xa2\x00\x00\x00", 8));
  EXPECT_EQ(InvalidData, decodeError(buildBinaryPlist(objects, 1, 1)));
}

TEST(BinaryWriterTest, InternsEqualLeaves) {
  Dictionary dict;
  for (int i = 0; i < 5; ++i) {
    std::ostringstream key;
    key << "key" << i;
    dict.insert(key.str(), Value("same"));
  }

  bytes_type plist = encode(Value(dict));
  // one dictionary, five keys and a single shared value
  EXPECT_EQ(7u, trailerField(plist, 8));

  Value decoded = decode(plist);
  ASSERT_EQ(5u, decoded.asDictionary().size());
  for (Dictionary::const_iterator it = decoded.asDictionary().begin();
       it != decoded.asDictionary().end();
       ++it)
    EXPECT_EQ(Value("same"), it->second);
}

TEST(BinaryWriterTest, RoundTripsEveryKind) {
  Dictionary dict;
  dict.insert("string", Value("hello"));
  dict.insert("unicode", Value("gr\xc3\xbc\xc3\x9f dich"));
  dict.insert("empty", Value(""));
  dict.insert("true", Value(true));
  dict.insert("false", Value(false));
  dict.insert("real", Value(3.25));
  dict.insert("negative", Value(-1));
  dict.insert("min", Value(std::numeric_limits<boost::int64_t>::min()));
  dict.insert("max", Value(std::numeric_limits<boost::uint64_t>::max()));
  dict.insert("date", Value(Date::fromAppleEpoch(338610664.5)));
  dict.insert("data", Value(data_type(40, 0x5A)));
  dict.insert("uid", Value(Uid(70000)));
  dict.insert("emptyArray", Value(array_type()));
  dict.insert("emptyDict", Value(Dictionary()));

  array_type many;
  for (int i = 0; i < 300; ++i)
    many.push_back(Value(i));
  dict.insert("many", Value(many));

  Value original(dict);
  EXPECT_EQ(original, decode(encode(original)));
}

TEST(BinaryWriterTest, ScalarRoot) {
  EXPECT_EQ(Value("alone"), decode(encode(Value("alone"))));
  EXPECT_EQ(Value(Uid(1)), decode(encode(Value(Uid(1)))));
}

TEST(BinaryWriterTest, NonAsciiStringsUseUtf16) {
  bytes_type plist = encode(Value("\xc3\xa9"));
  EXPECT_EQ(0x61, plist[8]);
}

TEST(BinaryWriterTest, RejectsBadEventStreams) {
  std::ostringstream stream;

  BinaryWriter keyed(stream);
  keyed.write(Event::startDictionary());
  try {
    keyed.write(Event::integer(Integer(1)));
    FAIL() << "expected an Error";
  } catch (const Error& e) {
    EXPECT_EQ(UnexpectedEvent, e.kind());
  }

  BinaryWriter unopened(stream);
  EXPECT_THROW(unopened.write(Event::endCollection()), Error);

  BinaryWriter done(stream);
  done.write(Event::boolean(true));
  EXPECT_TRUE(done.isComplete());
  EXPECT_THROW(done.write(Event::boolean(false)), Error);
}

#ifndef PLISTFLOW_ENABLE_UNSTABLE_KINDS
TEST(BinaryWriterTest, RejectsIntegersOutside64Bits) {
  Value wide(Integer::fromInt128(static_cast<int128_type>(1) << 64));
  try {
    encode(wide);
    FAIL() << "expected an Error";
  } catch (const Error& e) {
    EXPECT_EQ(IntegerOverflow, e.kind());
  }
}
#else
TEST(BinaryWriterTest, WritesIntegersOutside64Bits) {
  Value wide(Integer::fromInt128(-(static_cast<int128_type>(1) << 100)));
  EXPECT_EQ(wide, decode(encode(wide)));
}
#endif

TEST(PlistTest, ReadsBinaryThroughEntryPoint) {
  std::vector<char> plist;
  writePlistBinary(plist, Value("entry"));
  ASSERT_TRUE(isBinaryPlist(&plist[0], plist.size()));

  Value value;
  readPlist(&plist[0], plist.size(), value);
  EXPECT_EQ(Value("entry"), value);

  std::istringstream stream(std::string(plist.begin(), plist.end()));
  Value fromStream;
  readPlist(stream, fromStream);
  EXPECT_EQ(value, fromStream);
}

} // namespace PlistFlow
