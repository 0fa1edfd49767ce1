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

#ifndef __PLISTFLOW_ERROR_H__
#define __PLISTFLOW_ERROR_H__

#include <boost/cstdint.hpp>
#include <boost/optional.hpp>

#include <stdexcept>
#include <string>

namespace PlistFlow {

enum ErrorKind {
  TruncatedInput,
  MalformedHeader,
  UnsupportedWidth,
  InvalidObjectReference,
  ObjectOffsetOutOfBounds,
  IntegerOverflow,
  TrailingData,
  InvalidData,
  InvalidXml,
  UidNotSupportedInXml,
  UnexpectedEvent,
  UnexpectedEndOfEvents,
  TypeMismatch,
  MissingField,
  Io
};

const char* errorKindName(ErrorKind kind);

// Every failure in the library is reported by throwing an Error.  The kind is
// stable and meant for programmatic checks, what() is for humans.
class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& what);
  Error(ErrorKind kind, const std::string& what, boost::uint64_t offset);

  ErrorKind kind() const { return _kind; }

  // Byte offset into the binary input, when the error came from the binary
  // reader.
  const boost::optional<boost::uint64_t>& offset() const { return _offset; }

  // Field path ("items[2].count") for structured deserialization errors,
  // empty otherwise.
  const std::string& path() const { return _path; }

  // Returns a copy of this error located at the given field path.
  Error atPath(const std::string& path) const;

 private:
  ErrorKind _kind;
  boost::optional<boost::uint64_t> _offset;
  std::string _path;
};

} // namespace PlistFlow

#endif
