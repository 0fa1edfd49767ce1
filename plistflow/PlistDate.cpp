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

#include "PlistDate.hpp"

#include "PlistError.hpp"

#include <boost/cstdint.hpp>

#include <cmath>
#include <cstdio>
#include <ctime>

namespace PlistFlow {

const double Date::kAppleEpochOffset = 978307200.0;

namespace {

// Days since 1970-01-01 for a proleptic gregorian date.
boost::int64_t daysFromCivil(boost::int64_t year, unsigned month,
                             unsigned day) {
  year -= month <= 2;
  const boost::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const unsigned yearOfEra = static_cast<unsigned>(year - era * 400);
  const unsigned dayOfYear =
      (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const unsigned dayOfEra =
      yearOfEra * 365 + yearOfEra / 4 - yearOfEra / 100 + dayOfYear;
  return era * 146097 + static_cast<boost::int64_t>(dayOfEra) - 719468;
}

void civilFromDays(boost::int64_t days, boost::int64_t& year,
                   unsigned& month, unsigned& day) {
  days += 719468;
  const boost::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const unsigned dayOfEra = static_cast<unsigned>(days - era * 146097);
  const unsigned yearOfEra =
      (dayOfEra - dayOfEra / 1460 + dayOfEra / 36524 - dayOfEra / 146096) /
      365;
  const unsigned dayOfYear =
      dayOfEra - (365 * yearOfEra + yearOfEra / 4 - yearOfEra / 100);
  const unsigned monthIndex = (5 * dayOfYear + 2) / 153;
  day = dayOfYear - (153 * monthIndex + 2) / 5 + 1;
  month = monthIndex < 10 ? monthIndex + 3 : monthIndex - 9;
  year = static_cast<boost::int64_t>(yearOfEra) + era * 400 + (month <= 2);
}

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year))
    return 29;
  return days[month - 1];
}

} // namespace

void Date::set(int month, int day, int year, int hour24, int minute,
               int second) {
  setTimeFromEpoch(
      static_cast<double>(daysFromCivil(year, month, day)) * 86400.0 +
      hour24 * 3600.0 + minute * 60.0 + second);
}

void Date::setToCurrentTime() {
  _time = static_cast<double>(::time(NULL));
}

int Date::compare(const Date& first, const Date& second) {
  if (first._time < second._time)
    return -1;
  else if (first._time == second._time)
    return 0;
  else
    return 1;
}

std::string Date::timeAsXMLConvention() const {
  const double wholeSeconds = std::floor(_time);
  boost::int64_t days = static_cast<boost::int64_t>(
      std::floor(wholeSeconds / 86400.0));
  boost::int64_t secondsOfDay =
      static_cast<boost::int64_t>(wholeSeconds) - days * 86400;

  boost::int64_t year;
  unsigned month, day;
  civilFromDays(days, year, month, day);

  char result[64];
  std::snprintf(result, sizeof(result),
                "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                static_cast<long long>(year), month, day,
                static_cast<int>(secondsOfDay / 3600),
                static_cast<int>((secondsOfDay / 60) % 60),
                static_cast<int>(secondsOfDay % 60));
  return result;
}

void Date::setTimeFromXMLConvention(const std::string& timeString) {
  int year, month, day, hour24, minute, second;
  char zone = 0;
  char trailing = 0;
  if (std::sscanf(timeString.c_str(),
                  "%4d-%2d-%2dT%2d:%2d:%2d%c%c",
                  &year, &month, &day, &hour24, &minute, &second, &zone,
                  &trailing) != 7 ||
      zone != 'Z')
    throw Error(InvalidData, "Plist: invalid XML date " + timeString);

  if (month < 1 || month > 12 || day < 1 ||
      day > daysInMonth(year, month) || hour24 > 23 || minute > 59 ||
      second > 60 || hour24 < 0 || minute < 0 || second < 0)
    throw Error(InvalidData, "Plist: XML date out of range " + timeString);

  set(month, day, year, hour24, minute, second);
}

void Date::setTimeFromAppleEpoch(double appleTime) {
  setTimeFromEpoch(appleTime + kAppleEpochOffset);
}

void Date::setTimeFromEpoch(double epochTime) {
  if (!std::isfinite(epochTime))
    throw Error(InvalidData, "Plist: date is not a finite timestamp");

  static const double earliest =
      static_cast<double>(daysFromCivil(0, 1, 1)) * 86400.0;
  static const double latest =
      static_cast<double>(daysFromCivil(10000, 1, 1)) * 86400.0;
  if (epochTime < earliest || epochTime >= latest)
    throw Error(InvalidData, "Plist: date is outside the years 0 to 9999");
  _time = epochTime;
}

Date Date::fromAppleEpoch(double appleTime) {
  Date date;
  date.setTimeFromAppleEpoch(appleTime);
  return date;
}

} // namespace PlistFlow
