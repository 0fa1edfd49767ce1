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

#include "PlistInteger.hpp"

#include "PlistError.hpp"

#include <algorithm>
#include <limits>

namespace PlistFlow {

namespace {

const uint128_type kInt128Max = static_cast<uint128_type>(-1) >> 1;

int digitValue(char c, unsigned base) {
  int digit = -1;
  if (c >= '0' && c <= '9')
    digit = c - '0';
  else if (c >= 'a' && c <= 'f')
    digit = c - 'a' + 10;
  else if (c >= 'A' && c <= 'F')
    digit = c - 'A' + 10;
  return digit >= 0 && static_cast<unsigned>(digit) < base ? digit : -1;
}

// Accumulates the magnitude of text[begin..) in the given base, failing when
// it exceeds limit.
uint128_type parseMagnitude(const std::string& text, std::size_t begin,
                            unsigned base, uint128_type limit) {
  if (begin >= text.size())
    throw Error(InvalidData, "Plist: invalid integer string '" + text + "'");

  uint128_type magnitude = 0;
  for (std::size_t i = begin; i < text.size(); ++i) {
    int digit = digitValue(text[i], base);
    if (digit < 0)
      throw Error(InvalidData, "Plist: invalid integer string '" + text + "'");
    if (magnitude > (limit - digit) / base)
      throw Error(IntegerOverflow,
                  "Plist: integer string out of range '" + text + "'");
    magnitude = magnitude * base + digit;
  }
  return magnitude;
}

} // namespace

Integer Integer::fromString(const std::string& text) {
#ifdef PLISTFLOW_ENABLE_UNSTABLE_KINDS
  const uint128_type positiveLimit = kInt128Max;
  const uint128_type negativeLimit = kInt128Max + 1;
#else
  const uint128_type positiveLimit = std::numeric_limits<boost::uint64_t>::max();
  const uint128_type negativeLimit =
      static_cast<uint128_type>(std::numeric_limits<boost::int64_t>::max()) +
      1;
#endif

  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    // NetBSD dialect adds the 0x numeric objects, which are always unsigned.
    uint128_type magnitude = parseMagnitude(
        text, 2, 16, std::min<uint128_type>(
                         positiveLimit,
                         std::numeric_limits<boost::uint64_t>::max()));
    return fromInt128(static_cast<int128_type>(magnitude));
  }

  bool negative = false;
  std::size_t begin = 0;
  if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
    negative = text[0] == '-';
    begin = 1;
  }

  uint128_type magnitude =
      parseMagnitude(text, begin, 10, negative ? negativeLimit : positiveLimit);
  if (!negative)
    return fromInt128(static_cast<int128_type>(magnitude));
  if (magnitude == kInt128Max + 1)
    return fromInt128(static_cast<int128_type>(kInt128Max + 1));
  return fromInt128(-static_cast<int128_type>(magnitude));
}

boost::optional<boost::int64_t> Integer::asSigned() const {
  if (_value >= std::numeric_limits<boost::int64_t>::min() &&
      _value <= std::numeric_limits<boost::int64_t>::max())
    return static_cast<boost::int64_t>(_value);
  return boost::none;
}

boost::optional<boost::uint64_t> Integer::asUnsigned() const {
  if (_value >= 0 && _value <= std::numeric_limits<boost::uint64_t>::max())
    return static_cast<boost::uint64_t>(_value);
  return boost::none;
}

bool Integer::fitsIn64Bits() const {
  return _value >= std::numeric_limits<boost::int64_t>::min() &&
         _value <= std::numeric_limits<boost::uint64_t>::max();
}

std::string Integer::toString() const {
  uint128_type magnitude = _value < 0
                               ? static_cast<uint128_type>(0) -
                                     static_cast<uint128_type>(_value)
                               : static_cast<uint128_type>(_value);

  std::string digits;
  do {
    digits += static_cast<char>('0' + static_cast<int>(magnitude % 10));
    magnitude /= 10;
  } while (magnitude != 0);

  if (_value < 0)
    digits += '-';
  std::reverse(digits.begin(), digits.end());
  return digits;
}

} // namespace PlistFlow
