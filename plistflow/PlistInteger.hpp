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

#ifndef __PLISTFLOW_INTEGER_H__
#define __PLISTFLOW_INTEGER_H__

#include <boost/config.hpp>
#include <boost/cstdint.hpp>
#include <boost/optional.hpp>

#include <string>

#ifndef BOOST_HAS_INT128
#error "PlistFlow requires a compiler with a native 128-bit integer type"
#endif

namespace PlistFlow {

typedef boost::int128_type int128_type;
typedef boost::uint128_type uint128_type;

// A plist integer.  Values are stored as signed 128-bit integers so that both
// the full int64_t and the full uint64_t range are representable.
class Integer {
 public:
  Integer() : _value(0) {}
  Integer(int value) : _value(value) {}
  Integer(unsigned value) : _value(value) {}
  Integer(long value) : _value(value) {}
  Integer(unsigned long value) : _value(value) {}
  Integer(long long value) : _value(value) {}
  Integer(unsigned long long value) : _value(value) {}

  static Integer fromInt128(int128_type value) {
    Integer integer;
    integer._value = value;
    return integer;
  }

  // Parses a decimal string (tried as int64_t first, then uint64_t) or a 0x
  // prefixed hexadecimal string, which is always unsigned.
  static Integer fromString(const std::string& text);

  boost::optional<boost::int64_t> asSigned() const;
  boost::optional<boost::uint64_t> asUnsigned() const;

  int128_type value() const { return _value; }

  // True when the value lies inside [INT64_MIN, UINT64_MAX].
  bool fitsIn64Bits() const;

  std::string toString() const;

  bool operator==(const Integer& rhs) const { return _value == rhs._value; }
  bool operator!=(const Integer& rhs) const { return _value != rhs._value; }
  bool operator<(const Integer& rhs) const { return _value < rhs._value; }

 private:
  int128_type _value;
};

// A keyed-archiver object reference.  Only the binary format can carry it.
class Uid {
 public:
  Uid() : _value(0) {}
  explicit Uid(boost::uint64_t value) : _value(value) {}

  boost::uint64_t get() const { return _value; }

  bool operator==(const Uid& rhs) const { return _value == rhs._value; }
  bool operator!=(const Uid& rhs) const { return _value != rhs._value; }

 private:
  boost::uint64_t _value;
};

} // namespace PlistFlow

#endif
