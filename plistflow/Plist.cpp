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

#include "Plist.hpp"

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

namespace PlistFlow {

namespace {

const char kBinaryMagic[] = "bplist";

template <typename Writer>
void writeValue(Writer& writer, const Value& message) {
  ValueReader reader(message);
  copyEvents(reader, writer);
}

void openForWrite(std::ofstream& stream, const std::string& filename) {
  stream.open(filename.c_str(), std::ios::binary);
  if (!stream)
    throw Error(Io, "Can't open file.");
}

void closeAfterWrite(std::ofstream& stream) {
  stream.close();
  if (!stream)
    throw Error(Io, "Plist: failed to write file");
}

} // namespace

bool isBinaryPlist(const char* byteArray, int64_t size) {
  // a truncated magic still goes to the binary reader for a precise error
  const std::size_t length =
      static_cast<std::size_t>(std::min<int64_t>(size, 6));
  return byteArray && size > 0 &&
         std::memcmp(byteArray, kBinaryMagic, length) == 0;
}

void readPlist(const char* byteArray, int64_t size, Value& message) {
  if (!byteArray || size <= 0)
    throw Error(TruncatedInput, "Plist: Empty plist data");

  try {
    if (isBinaryPlist(byteArray, size)) {
      BOOST_LOG_TRIVIAL(debug) << "Plist: reading " << size
                               << " bytes of binary plist";
      BinaryReader reader(byteArray, static_cast<std::size_t>(size));
      message = readValue(reader);
    } else if (looksLikeAsciiPlist(byteArray,
                                   static_cast<std::size_t>(size))) {
      BOOST_LOG_TRIVIAL(debug) << "Plist: reading " << size
                               << " bytes of ASCII plist";
      AsciiReader reader(byteArray, static_cast<std::size_t>(size));
      message = readValue(reader);
    } else {
      BOOST_LOG_TRIVIAL(debug) << "Plist: reading " << size
                               << " bytes of XML plist";
      XmlReader reader(byteArray, static_cast<std::size_t>(size));
      message = readValue(reader);
    }
  } catch (const Error& e) {
    BOOST_LOG_TRIVIAL(debug) << "Plist: read failed ("
                             << errorKindName(e.kind()) << "): " << e.what();
    throw;
  }
}

void readPlist(std::istream& stream, Value& message) {
  std::vector<char> buffer((std::istreambuf_iterator<char>(stream)),
                           std::istreambuf_iterator<char>());
  if (stream.bad())
    throw Error(Io, "Plist: failed to read stream");

  readPlist(buffer.empty() ? 0 : &buffer[0],
            static_cast<int64_t>(buffer.size()), message);
}

void readPlist(const std::string& filename, Value& message) {
  std::ifstream stream(filename.c_str(), std::ios::binary);
  if (!stream)
    throw Error(Io, "Can't open file.");
  readPlist(stream, message);
}

void writePlistBinary(std::ostream& stream, const Value& message) {
  BinaryWriter writer(stream);
  writeValue(writer, message);
  BOOST_LOG_TRIVIAL(debug) << "Plist: wrote binary plist";
}

void writePlistBinary(std::vector<char>& plist, const Value& message) {
  std::ostringstream stream;
  writePlistBinary(stream, message);
  const std::string bytes = stream.str();
  plist.assign(bytes.begin(), bytes.end());
  BOOST_LOG_TRIVIAL(debug) << "Plist: binary plist is " << plist.size()
                           << " bytes";
}

void writePlistBinary(const std::string& filename, const Value& message) {
  std::ofstream stream;
  openForWrite(stream, filename);
  writePlistBinary(stream, message);
  closeAfterWrite(stream);
}

void writePlistXML(std::ostream& stream, const Value& message,
                   const XmlWriteOptions& options) {
  XmlWriter writer(stream, options);
  writeValue(writer, message);
  BOOST_LOG_TRIVIAL(debug) << "Plist: wrote XML plist";
}

void writePlistXML(std::vector<char>& plist, const Value& message,
                   const XmlWriteOptions& options) {
  std::ostringstream stream;
  writePlistXML(stream, message, options);
  const std::string bytes = stream.str();
  plist.assign(bytes.begin(), bytes.end());
  BOOST_LOG_TRIVIAL(debug) << "Plist: XML plist is " << plist.size()
                           << " bytes";
}

void writePlistXML(const std::string& filename, const Value& message,
                   const XmlWriteOptions& options) {
  std::ofstream stream;
  openForWrite(stream, filename);
  writePlistXML(stream, message, options);
  closeAfterWrite(stream);
}

} // namespace PlistFlow
