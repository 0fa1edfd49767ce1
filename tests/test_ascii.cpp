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

#include <string>
#include <vector>

#include "plistflow/Plist.hpp"
#include "PlistTestHelpers.hpp"

namespace PlistFlow {

namespace {

const char kAnimals[] =
    "// Animals, old style\n"
    "{\n"
    "    AnimalColors = {\n"
    "        lamb = black;   /* a comment */\n"
    "        pig = pink;\n"
    "    };\n"
    "    AnimalSounds = {\n"
    "        Lisa = \"Why is the worm talking like a lamb?\";\n"
    "        lamb = baa;\n"
    "    };\n"
    "    Counts = (1, 2.5, -3, );\n"
    "    Blob = <0fbd77 1c>;\n"
    "}\n";

Value parseAscii(const std::string& text) {
  AsciiReader reader(text.data(), text.size());
  return readValue(reader);
}

ErrorKind asciiError(const std::string& text) {
  try {
    parseAscii(text);
  } catch (const Error& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected an Error";
  return Io;
}

} // namespace

TEST(AsciiReaderTest, EventsForNestedDictionaries) {
  const std::string text = "{ a = { b = c; }; d = (e); }";
  AsciiReader reader(text.data(), text.size());

  std::vector<Event> expected;
  expected.push_back(Event::startDictionary());
  expected.push_back(Event::string("a"));
  expected.push_back(Event::startDictionary());
  expected.push_back(Event::string("b"));
  expected.push_back(Event::string("c"));
  expected.push_back(Event::endCollection());
  expected.push_back(Event::string("d"));
  expected.push_back(Event::startArray());
  expected.push_back(Event::string("e"));
  expected.push_back(Event::endCollection());
  expected.push_back(Event::endCollection());
  EXPECT_EQ(expected, readAllEvents(reader));
}

TEST(AsciiReaderTest, ParsesAnimals) {
  Value value = parseAscii(kAnimals);
  const Dictionary& dict = value.asDictionary();

  EXPECT_EQ("AnimalColors", dict.begin()->first);
  EXPECT_EQ(Value("pink"), dict.at("AnimalColors").asDictionary().at("pig"));
  EXPECT_EQ(Value("Why is the worm talking like a lamb?"),
            dict.at("AnimalSounds").asDictionary().at("Lisa"));

  // numbers stay strings
  array_type counts;
  counts.push_back(Value("1"));
  counts.push_back(Value("2.5"));
  counts.push_back(Value("-3"));
  EXPECT_EQ(Value(counts), dict.at("Counts"));

  data_type blob;
  blob.push_back(0x0f);
  blob.push_back(0xbd);
  blob.push_back(0x77);
  blob.push_back(0x1c);
  EXPECT_EQ(Value(blob), dict.at("Blob"));
}

TEST(AsciiReaderTest, QuotedStringEscapes) {
  EXPECT_EQ(Value("tab\there \"q\" back\\slash"),
            parseAscii("\"tab\\there \\\"q\\\" back\\\\slash\""));
  EXPECT_EQ(Value("\xc3\xa9"), parseAscii("\"\\U00e9\""));
  EXPECT_EQ(Value("\xc3\xa9"), parseAscii("\"\\351\""));
  EXPECT_EQ(Value("\xf0\x9f\x98\x80"), parseAscii("\"\\UD83D\\UDE00\""));
  EXPECT_EQ(Value("\xe6\x97\xa5"), parseAscii("\"\xe6\x97\xa5\""));
  EXPECT_EQ(Value(""), parseAscii("\"\""));
  EXPECT_EQ(Value(array_type()), parseAscii("( )"));
  EXPECT_EQ(Value(Dictionary()), parseAscii("{}"));
}

TEST(AsciiReaderTest, RejectsMalformedInput) {
  EXPECT_EQ(TruncatedInput, asciiError(""));
  EXPECT_EQ(TruncatedInput, asciiError("{ a = b;"));
  EXPECT_EQ(TruncatedInput, asciiError("(a, b"));
  EXPECT_EQ(TruncatedInput, asciiError("\"open"));
  EXPECT_EQ(TruncatedInput, asciiError("/* open"));
  EXPECT_EQ(InvalidData, asciiError("{ a = b }"));
  EXPECT_EQ(InvalidData, asciiError("{ a b; }"));
  EXPECT_EQ(InvalidData, asciiError("{ <00> = b; }"));
  EXPECT_EQ(InvalidData, asciiError("(a b)"));
  EXPECT_EQ(InvalidData, asciiError("(, a)"));
  EXPECT_EQ(InvalidData, asciiError("<0fb>"));
  EXPECT_EQ(InvalidData, asciiError("<0fzz>"));
  EXPECT_EQ(InvalidData, asciiError("\"\\UD83D\""));
  EXPECT_EQ(InvalidData, asciiError("\"\\U12\""));
  EXPECT_EQ(InvalidData, asciiError("\"\xff\""));
  EXPECT_EQ(TrailingData, asciiError("a b"));
}

TEST(AsciiReaderTest, ErrorsCarryTheOffset) {
  const std::string text = "(a, b; c)";
  AsciiReader reader(text.data(), text.size());
  Event event;
  ASSERT_TRUE(reader.next(event));
  ASSERT_TRUE(reader.next(event));
  ASSERT_TRUE(reader.next(event));
  try {
    reader.next(event);
    FAIL() << "expected an Error";
  } catch (const Error& e) {
    EXPECT_EQ(InvalidData, e.kind());
    ASSERT_TRUE(e.offset());
    EXPECT_EQ(5u, *e.offset());
  }
  EXPECT_THROW(reader.next(event), Error);
}

TEST(PlistTest, DetectsAsciiPlists) {
  EXPECT_TRUE(looksLikeAsciiPlist(kAnimals, sizeof(kAnimals) - 1));
  EXPECT_TRUE(looksLikeAsciiPlist("  <0fbd 77>", 11));
  EXPECT_FALSE(looksLikeAsciiPlist("<?xml version=\"1.0\"?>", 21));
  EXPECT_FALSE(looksLikeAsciiPlist("<dict></dict>", 13));

  Value fromAscii;
  readPlist(kAnimals, sizeof(kAnimals) - 1, fromAscii);
  EXPECT_EQ(parseAscii(kAnimals), fromAscii);

  // transcodes to the formats that can be written
  std::vector<char> binary;
  writePlistBinary(binary, fromAscii);
  Value fromBinary;
  readPlist(&binary[0], binary.size(), fromBinary);
  EXPECT_EQ(fromAscii, fromBinary);
}

} // namespace PlistFlow
