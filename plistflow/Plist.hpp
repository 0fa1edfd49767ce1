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

#ifndef __PLISTFLOW_H__
#define __PLISTFLOW_H__

#include <boost/cstdint.hpp>

#include <iosfwd>
#include <string>
#include <vector>

#include "PlistAscii.hpp"
#include "PlistBinary.hpp"
#include "PlistError.hpp"
#include "PlistEvent.hpp"
#include "PlistValue.hpp"
#include "PlistValueEvents.hpp"
#include "PlistXml.hpp"

namespace PlistFlow {

// Public read methods.  Plist type (binary, xml or old style ascii)
// automatically detected.

void readPlist(const char* byteArray, int64_t size, Value& message);
void readPlist(std::istream& stream, Value& message);
void readPlist(const std::string& filename, Value& message);

// True when the buffer carries the binary plist magic.
bool isBinaryPlist(const char* byteArray, int64_t size);

// Public binary write methods.

void writePlistBinary(std::ostream& stream, const Value& message);
void writePlistBinary(std::vector<char>& plist, const Value& message);
void writePlistBinary(const std::string& filename, const Value& message);

// Public XML write methods.

void writePlistXML(std::ostream& stream, const Value& message,
                   const XmlWriteOptions& options = XmlWriteOptions());
void writePlistXML(std::vector<char>& plist, const Value& message,
                   const XmlWriteOptions& options = XmlWriteOptions());
void writePlistXML(const std::string& filename, const Value& message,
                   const XmlWriteOptions& options = XmlWriteOptions());

} // namespace PlistFlow

#endif
