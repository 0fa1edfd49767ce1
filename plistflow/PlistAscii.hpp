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

#ifndef __PLISTFLOW_ASCII_H__
#define __PLISTFLOW_ASCII_H__

#include <boost/optional.hpp>

#include <string>
#include <vector>

#include "PlistError.hpp"
#include "PlistEvent.hpp"

namespace PlistFlow {

// Produces the events of an old style (OpenStep) ASCII plist:
//
//   { Name = "Joe"; Pets = (cat, dog); Blob = <0fbd 77>; }
//
// The format only knows strings, data, arrays and dictionaries, so numbers
// and booleans come out as strings.  // and /* */ comments are skipped.
class AsciiReader : public EventReader {
 public:
  AsciiReader(const char* bytes, std::size_t size);

  bool next(Event& event);

 private:
  struct StackItem {
    bool dictionary;
    // dictionary: a key was read and '=' value is due
    bool valueTurn;
    // ';' after a dictionary value, ',' after an array element
    bool separatorDue;
  };

  bool readNext(Event& event);
  bool readInCollection(Event& event);
  Event readValue();
  std::string readString();
  std::string readQuotedString();
  std::string readUnquotedString();
  data_type readData();
  void skipWhitespace();
  void expect(char c);

  bool atEnd() const { return _position >= _size; }
  char peek() const { return _bytes[_position]; }

  Error error(ErrorKind kind, const std::string& what) const;

  const char* _bytes;
  std::size_t _size;
  std::size_t _position;
  std::vector<StackItem> _stack;
  bool _started;
  bool _finished;
  boost::optional<Error> _error;
};

// True when the first significant character of the buffer starts an ASCII
// plist rather than an XML document.
bool looksLikeAsciiPlist(const char* bytes, std::size_t size);

} // namespace PlistFlow

#endif
