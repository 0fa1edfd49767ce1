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

#ifndef __PLISTFLOW_BASE64_H__
#define __PLISTFLOW_BASE64_H__

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <cctype>
#include <string>

#include "PlistError.hpp"
#include "PlistValue.hpp"

namespace PlistFlow {

inline std::string encodeBase64(const data_type& data) {
  using namespace boost::archive::iterators;
  typedef base64_from_binary<transform_width<data_type::const_iterator, 6, 8> >
      iterator;

  std::string encoded(iterator(data.begin()), iterator(data.end()));
  encoded.append((3 - data.size() % 3) % 3, '=');
  return encoded;
}

// Whitespace anywhere in the text is ignored.
inline data_type decodeBase64(const std::string& text) {
  using namespace boost::archive::iterators;
  typedef transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>
      iterator;

  std::string packed;
  packed.reserve(text.size());
  for (std::string::const_iterator it = text.begin(); it != text.end(); ++it)
    if (!std::isspace(static_cast<unsigned char>(*it)))
      packed.push_back(*it);

  if (packed.size() % 4 != 0)
    throw Error(InvalidData, "Plist: base64 data has a bad length");

  std::size_t padding = 0;
  while (padding < 2 && padding < packed.size() &&
         packed[packed.size() - 1 - padding] == '=')
    ++padding;
  if (packed.find('=') < packed.size() - padding)
    throw Error(InvalidData, "Plist: base64 padding in the middle of data");
  packed.replace(packed.size() - padding, padding, padding, 'A');

  data_type decoded;
  try {
    decoded.assign(iterator(packed.begin()), iterator(packed.end()));
  } catch (const dataflow_exception& e) {
    throw Error(InvalidData, std::string("Plist: bad base64 data: ") + e.what());
  }
  decoded.resize(decoded.size() - padding);
  return decoded;
}

} // namespace PlistFlow

#endif
