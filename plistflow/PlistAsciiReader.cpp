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

#include "PlistAscii.hpp"

#include <boost/locale/encoding_utf.hpp>

#include <cctype>
#include <sstream>

namespace PlistFlow {

namespace {

bool isUnquotedChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' ||
         c == '+' || c == '/' || c == ':' || c == '.' || c == '-';
}

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

void flushUnits(std::u16string& units, std::string& out) {
  if (units.empty())
    return;
  out += boost::locale::conv::utf_to_utf<char>(
      units.data(), units.data() + units.size(), boost::locale::conv::stop);
  units.clear();
}

} // namespace

AsciiReader::AsciiReader(const char* bytes, std::size_t size)
    : _bytes(bytes), _size(size), _position(0), _started(false),
      _finished(false) {}

bool AsciiReader::next(Event& event) {
  if (_error)
    throw *_error;

  try {
    return readNext(event);
  } catch (const Error& e) {
    _error = e;
    throw;
  }
}

Error AsciiReader::error(ErrorKind kind, const std::string& what) const {
  std::ostringstream ss;
  ss << "Plist: " << what << " at byte " << _position;
  return Error(kind, ss.str(), _position);
}

bool AsciiReader::readNext(Event& event) {
  if (!_started) {
    _started = true;
    // UTF-8 byte order mark
    if (_size >= 3 && std::string(_bytes, 3) == "\xef\xbb\xbf")
      _position = 3;
    skipWhitespace();
    if (atEnd())
      throw error(TruncatedInput, "ASCII plist has no value");
    event = readValue();
    return true;
  }

  if (!_stack.empty())
    return readInCollection(event);

  if (!_finished) {
    _finished = true;
    skipWhitespace();
    if (!atEnd())
      throw error(TrailingData, "ASCII plist has data after the value");
  }
  return false;
}

bool AsciiReader::readInCollection(Event& event) {
  StackItem& item = _stack.back();
  skipWhitespace();

  if (item.dictionary) {
    if (item.separatorDue) {
      expect(';');
      item.separatorDue = false;
      skipWhitespace();
    }

    if (item.valueTurn) {
      expect('=');
      skipWhitespace();
      item.valueTurn = false;
      item.separatorDue = true;
      // readValue may push, which invalidates item
      event = readValue();
      return true;
    }

    if (atEnd())
      throw error(TruncatedInput, "ASCII dictionary is not closed");
    if (peek() == '}') {
      ++_position;
      _stack.pop_back();
      event = Event::endCollection();
      return true;
    }

    item.valueTurn = true;
    event = Event::string(readString());
    return true;
  }

  if (atEnd())
    throw error(TruncatedInput, "ASCII array is not closed");

  if (item.separatorDue && peek() != ')') {
    expect(',');
    skipWhitespace();
    if (atEnd())
      throw error(TruncatedInput, "ASCII array is not closed");
  }

  // a trailing comma before ')' is accepted
  if (peek() == ')') {
    ++_position;
    _stack.pop_back();
    event = Event::endCollection();
    return true;
  }

  item.separatorDue = true;
  event = readValue();
  return true;
}

Event AsciiReader::readValue() {
  if (atEnd())
    throw error(TruncatedInput, "ASCII plist value expected");

  switch (peek()) {
  case '{': {
    ++_position;
    StackItem item = {true, false, false};
    _stack.push_back(item);
    return Event::startDictionary();
  }
  case '(': {
    ++_position;
    StackItem item = {false, false, false};
    _stack.push_back(item);
    return Event::startArray();
  }
  case '<':
    return Event::data(readData());
  default:
    return Event::string(readString());
  }
}

std::string AsciiReader::readString() {
  if (atEnd())
    throw error(TruncatedInput, "ASCII string expected");
  if (peek() == '"')
    return readQuotedString();
  if (isUnquotedChar(peek()))
    return readUnquotedString();

  std::string what("unexpected character '");
  what += peek();
  throw error(InvalidData, what + "'");
}

std::string AsciiReader::readUnquotedString() {
  const std::size_t begin = _position;
  while (!atEnd() && isUnquotedChar(peek()))
    ++_position;
  return std::string(_bytes + begin, _position - begin);
}

std::string AsciiReader::readQuotedString() {
  const std::size_t begin = _position;
  ++_position;

  std::string result;
  std::u16string units;
  try {
    while (true) {
      if (atEnd()) {
        _position = begin;
        throw error(TruncatedInput, "ASCII string is not closed");
      }

      const char c = _bytes[_position++];
      if (c == '"')
        break;
      if (c != '\\') {
        flushUnits(units, result);
        result += c;
        continue;
      }

      if (atEnd())
        continue;
      const char escaped = _bytes[_position++];
      switch (escaped) {
      case 'a': units += u'\a'; break;
      case 'b': units += u'\b'; break;
      case 'f': units += u'\f'; break;
      case 'n': units += u'\n'; break;
      case 'r': units += u'\r'; break;
      case 't': units += u'\t'; break;
      case 'v': units += u'\v'; break;
      case 'U':
      case 'u': {
        unsigned value = 0;
        for (int i = 0; i < 4; ++i) {
          const int digit = atEnd() ? -1 : hexValue(peek());
          if (digit < 0)
            throw error(InvalidData, "ASCII \\U escape needs four hex digits");
          value = value * 16 + digit;
          ++_position;
        }
        units += static_cast<char16_t>(value);
        break;
      }
      default:
        if (escaped >= '0' && escaped <= '7') {
          // octal byte, taken as a Latin-1 code point
          unsigned value = escaped - '0';
          for (int i = 0; i < 2 && !atEnd() && peek() >= '0' && peek() <= '7';
               ++i)
            value = value * 8 + (_bytes[_position++] - '0');
          if (value > 0xFF)
            throw error(InvalidData, "ASCII octal escape out of range");
          units += static_cast<char16_t>(value);
        } else {
          // \" \\ \' and unknown escapes stand for the character itself
          flushUnits(units, result);
          result += escaped;
        }
      }
    }
    flushUnits(units, result);

    // the raw bytes must already be UTF-8
    boost::locale::conv::utf_to_utf<char>(result.data(),
                                          result.data() + result.size(),
                                          boost::locale::conv::stop);
  } catch (const boost::locale::conv::conversion_error&) {
    _position = begin;
    throw error(InvalidData, "ASCII string is not valid Unicode");
  }
  return result;
}

data_type AsciiReader::readData() {
  const std::size_t begin = _position;
  ++_position;

  data_type data;
  int high = -1;
  while (true) {
    if (atEnd()) {
      _position = begin;
      throw error(TruncatedInput, "ASCII data is not closed");
    }

    const char c = _bytes[_position++];
    if (c == '>')
      break;
    if (std::isspace(static_cast<unsigned char>(c)))
      continue;

    const int digit = hexValue(c);
    if (digit < 0) {
      --_position;
      throw error(InvalidData, "ASCII data holds a non hex character");
    }
    if (high < 0) {
      high = digit;
    } else {
      data.push_back(static_cast<unsigned char>(high * 16 + digit));
      high = -1;
    }
  }

  if (high >= 0)
    throw error(InvalidData, "ASCII data has an odd number of hex digits");
  return data;
}

void AsciiReader::skipWhitespace() {
  while (!atEnd()) {
    const char c = peek();
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++_position;
    } else if (c == '/' && _position + 1 < _size &&
               _bytes[_position + 1] == '/') {
      while (!atEnd() && peek() != '\n' && peek() != '\r')
        ++_position;
    } else if (c == '/' && _position + 1 < _size &&
               _bytes[_position + 1] == '*') {
      const std::size_t begin = _position;
      _position += 2;
      while (_position + 1 < _size &&
             !(_bytes[_position] == '*' && _bytes[_position + 1] == '/'))
        ++_position;
      if (_position + 1 >= _size) {
        _position = begin;
        throw error(TruncatedInput, "ASCII comment is not closed");
      }
      _position += 2;
    } else {
      return;
    }
  }
}

void AsciiReader::expect(char c) {
  if (atEnd()) {
    std::string what("'");
    what += c;
    throw error(TruncatedInput, what + "' expected at the end of input");
  }
  if (peek() != c) {
    std::string what("'");
    what += c;
    what += "' expected but found '";
    what += peek();
    throw error(InvalidData, what + "'");
  }
  ++_position;
}

bool looksLikeAsciiPlist(const char* bytes, std::size_t size) {
  std::size_t position = 0;
  if (size >= 3 && std::string(bytes, 3) == "\xef\xbb\xbf")
    position = 3;
  while (position < size &&
         std::isspace(static_cast<unsigned char>(bytes[position])))
    ++position;
  if (position >= size)
    return false;
  if (bytes[position] != '<')
    return true;

  // <0fbd 77> is data, <?xml, <!DOCTYPE and <plist are XML
  for (++position; position < size; ++position) {
    const char c = bytes[position];
    if (c == '>')
      return true;
    if (hexValue(c) < 0 && !std::isspace(static_cast<unsigned char>(c)))
      return false;
  }
  return false;
}

} // namespace PlistFlow
