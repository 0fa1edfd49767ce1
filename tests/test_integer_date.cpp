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

#include "plistflow/PlistDate.hpp"
#include "plistflow/PlistError.hpp"
#include "plistflow/PlistInteger.hpp"

namespace PlistFlow {

TEST(IntegerTest, ParsesDecimalAndHex) {
  EXPECT_EQ(Integer(42), Integer::fromString("42"));
  EXPECT_EQ(Integer(-42), Integer::fromString("-42"));
  EXPECT_EQ(Integer(42), Integer::fromString("+42"));
  EXPECT_EQ(Integer(255), Integer::fromString("0xff"));
  EXPECT_EQ(Integer(std::numeric_limits<boost::uint64_t>::max()),
            Integer::fromString("18446744073709551615"));
  EXPECT_EQ(Integer(std::numeric_limits<boost::int64_t>::min()),
            Integer::fromString("-9223372036854775808"));
}

TEST(IntegerTest, RejectsGarbage) {
  EXPECT_THROW(Integer::fromString(""), Error);
  EXPECT_THROW(Integer::fromString("-"), Error);
  EXPECT_THROW(Integer::fromString("12a"), Error);
  EXPECT_THROW(Integer::fromString("0x"), Error);

  try {
    Integer::fromString("1.5");
    FAIL() << "expected an Error";
  } catch (const Error& e) {
    EXPECT_EQ(InvalidData, e.kind());
  }
}

#ifndef PLISTFLOW_ENABLE_UNSTABLE_KINDS
TEST(IntegerTest, RejectsValuesOutside64Bits) {
  try {
    Integer::fromString("18446744073709551616");
    FAIL() << "expected an Error";
  } catch (const Error& e) {
    EXPECT_EQ(IntegerOverflow, e.kind());
  }
  EXPECT_THROW(Integer::fromString("-9223372036854775809"), Error);
}
#endif

TEST(IntegerTest, SignedAndUnsignedViews) {
  Integer big(std::numeric_limits<boost::uint64_t>::max());
  EXPECT_FALSE(big.asSigned());
  ASSERT_TRUE(big.asUnsigned());
  EXPECT_EQ(std::numeric_limits<boost::uint64_t>::max(), *big.asUnsigned());

  Integer negative(-1);
  EXPECT_FALSE(negative.asUnsigned());
  ASSERT_TRUE(negative.asSigned());
  EXPECT_EQ(-1, *negative.asSigned());
}

TEST(IntegerTest, WideValues) {
  int128_type wide = static_cast<int128_type>(1) << 100;
  Integer integer = Integer::fromInt128(wide);
  EXPECT_FALSE(integer.fitsIn64Bits());
  EXPECT_EQ("1267650600228229401496703205376", integer.toString());
  EXPECT_EQ("-5", Integer(-5).toString());
  EXPECT_TRUE(Integer(-5) < Integer(3));
}

TEST(DateTest, AppleEpochConversions) {
  Date date(1, 1, 2001, 0, 0, 0);
  EXPECT_DOUBLE_EQ(0.0, date.timeAsAppleEpoch());
  EXPECT_DOUBLE_EQ(Date::kAppleEpochOffset, date.timeAsEpoch());

  Date later = Date::fromAppleEpoch(86400.5);
  EXPECT_DOUBLE_EQ(86400.5, later.timeAsAppleEpoch());
  EXPECT_TRUE(date < later);
  EXPECT_DOUBLE_EQ(86400.5, later.timeAsEpoch() - date.timeAsEpoch());
}

TEST(DateTest, XmlConvention) {
  Date date(7, 30, 2011, 14, 5, 9);
  EXPECT_EQ("2011-07-30T14:05:09Z", date.timeAsXMLConvention());

  Date parsed;
  parsed.setTimeFromXMLConvention("2011-07-30T14:05:09Z");
  EXPECT_EQ(date, parsed);

  Date beforeEpoch(12, 31, 1969, 23, 59, 59);
  EXPECT_EQ("1969-12-31T23:59:59Z", beforeEpoch.timeAsXMLConvention());
}

TEST(DateTest, RejectsBadInput) {
  Date date;
  EXPECT_THROW(date.setTimeFromXMLConvention("yesterday"), Error);
  EXPECT_THROW(date.setTimeFromXMLConvention("2011-02-30T00:00:00Z"), Error);
  EXPECT_THROW(date.setTimeFromXMLConvention("2011-01-01T00:00:00"), Error);
  EXPECT_THROW(date.setTimeFromAppleEpoch(std::numeric_limits<double>::quiet_NaN()),
               Error);
}

TEST(DateTest, CalendarRange) {
  EXPECT_EQ("0000-01-01T00:00:00Z",
            Date(1, 1, 0, 0, 0, 0).timeAsXMLConvention());
  EXPECT_EQ("9999-12-31T23:59:59Z",
            Date(12, 31, 9999, 23, 59, 59).timeAsXMLConvention());

  Date date;
  try {
    date.setTimeFromAppleEpoch(1e300);
    FAIL() << "expected an Error";
  } catch (const Error& e) {
    EXPECT_EQ(InvalidData, e.kind());
  }
  EXPECT_THROW(Date(1, 1, 10000, 0, 0, 0), Error);
}

} // namespace PlistFlow
