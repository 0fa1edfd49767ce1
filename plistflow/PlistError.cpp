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

#include "PlistError.hpp"

namespace PlistFlow {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
  case TruncatedInput:
    return "TruncatedInput";
  case MalformedHeader:
    return "MalformedHeader";
  case UnsupportedWidth:
    return "UnsupportedWidth";
  case InvalidObjectReference:
    return "InvalidObjectReference";
  case ObjectOffsetOutOfBounds:
    return "ObjectOffsetOutOfBounds";
  case IntegerOverflow:
    return "IntegerOverflow";
  case TrailingData:
    return "TrailingData";
  case InvalidData:
    return "InvalidData";
  case InvalidXml:
    return "InvalidXml";
  case UidNotSupportedInXml:
    return "UidNotSupportedInXml";
  case UnexpectedEvent:
    return "UnexpectedEvent";
  case UnexpectedEndOfEvents:
    return "UnexpectedEndOfEvents";
  case TypeMismatch:
    return "TypeMismatch";
  case MissingField:
    return "MissingField";
  case Io:
    return "Io";
  }
  return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& what)
    : runtime_error(what), _kind(kind) {}

Error::Error(ErrorKind kind, const std::string& what, boost::uint64_t offset)
    : runtime_error(what), _kind(kind), _offset(offset) {}

Error Error::atPath(const std::string& path) const {
  std::string message(runtime_error::what());
  if (_path.empty() && !path.empty())
    message += " at " + path;

  Error located(_kind, message);
  located._offset = _offset;
  located._path = path;
  return located;
}

} // namespace PlistFlow
