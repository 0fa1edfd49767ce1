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

#ifndef __PLISTFLOW_DATE_H__
#define __PLISTFLOW_DATE_H__

#include <string>

namespace PlistFlow {

// A point in time with sub-second precision, stored as seconds since the
// unix epoch.  Only years 0 through 9999 are representable, the range the
// XML convention can spell.
class Date {
 public:
  Date() { setToCurrentTime(); }

  // UTC calendar fields.
  Date(int month, int day, int year, int hour24, int minute, int second) {
    set(month, day, year, hour24, minute, second);
  }

  void set(int month, int day, int year, int hour24, int minute, int second);

  void setToCurrentTime();

  // returns -1 : first < second, 0 : first = second, 1 : first > second
  static int compare(const Date& first, const Date& second);

  bool operator>(const Date& rhs) const { return compare(*this, rhs) == 1; }
  bool operator<(const Date& rhs) const { return compare(*this, rhs) == -1; }
  bool operator==(const Date& rhs) const { return compare(*this, rhs) == 0; }
  bool operator!=(const Date& rhs) const { return !(*this == rhs); }

  // iso 8601 date string convention, whole seconds in UTC
  std::string timeAsXMLConvention() const;
  void setTimeFromXMLConvention(const std::string& timeString);

  // Apple epoch is # of seconds since 01-01-2001. So we need to add the
  // number of seconds since 01-01-1970 which is proper unix epoch
  void setTimeFromAppleEpoch(double appleTime);
  // Throws Error(InvalidData) for timestamps outside the representable
  // years.
  void setTimeFromEpoch(double epochTime);

  double timeAsEpoch() const { return _time; }

  // We need to subtract the number of seconds between 01-01-2001 and
  // 01-01-1970 to get Apple epoch from unix epoch
  double timeAsAppleEpoch() const { return _time - kAppleEpochOffset; }

  static Date fromAppleEpoch(double appleTime);

  static const double kAppleEpochOffset;

 private:
  double _time;
};

} // namespace PlistFlow

#endif
