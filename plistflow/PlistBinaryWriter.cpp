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

#include "PlistBinary.hpp"

#include <boost/locale/encoding_utf.hpp>

#include <cstring>
#include <ostream>

namespace PlistFlow {

namespace {

// Smallest of 1, 2, 4 and 8 bytes that can hold value.
unsigned byteCount(boost::uint64_t value) {
  if (value <= 0xFF)
    return 1;
  if (value <= 0xFFFF)
    return 2;
  if (value <= 0xFFFFFFFFULL)
    return 4;
  return 8;
}

void appendBigEndian(std::vector<unsigned char>& out, boost::uint64_t value,
                     unsigned width) {
  for (unsigned n = width; n > 0; --n)
    out.push_back(static_cast<unsigned char>((value >> (8 * (n - 1))) & 0xFF));
}

void appendIntegerObject(std::vector<unsigned char>& out, int128_type value) {
  if (value >= 0 && value <= 0xFFFFFFFFLL) {
    const unsigned width = byteCount(static_cast<boost::uint64_t>(value));
    // marker low nibble is log2 of the width
    out.push_back(static_cast<unsigned char>(
        0x10 | (width == 1 ? 0 : width == 2 ? 1 : 2)));
    appendBigEndian(out, static_cast<boost::uint64_t>(value), width);
  } else if (value >= INT64_MIN && value <= INT64_MAX) {
    out.push_back(0x13);
    appendBigEndian(out, static_cast<boost::uint64_t>(value), 8);
  } else {
    const uint128_type bits = static_cast<uint128_type>(value);
    out.push_back(0x14);
    appendBigEndian(out, static_cast<boost::uint64_t>(bits >> 64), 8);
    appendBigEndian(out, static_cast<boost::uint64_t>(bits), 8);
  }
}

void appendMarkerWithSize(std::vector<unsigned char>& out,
                          unsigned char type,
                          boost::uint64_t size) {
  if (size < 15) {
    out.push_back(static_cast<unsigned char>(type | size));
  } else {
    out.push_back(static_cast<unsigned char>(type | 0x0F));
    appendIntegerObject(out, static_cast<int128_type>(size));
  }
}

void appendDouble(std::vector<unsigned char>& out, double value) {
  boost::uint64_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  appendBigEndian(out, bits, 8);
}

bool isAscii(const std::string& value) {
  for (std::string::const_iterator it = value.begin(); it != value.end(); ++it)
    if (static_cast<unsigned char>(*it) > 0x7F)
      return false;
  return true;
}

} // namespace

BinaryWriter::BinaryWriter(std::ostream& stream)
    : _stream(stream), _root(0), _complete(false) {}

void BinaryWriter::writeStartArray(Event::size_hint_type) {
  startCollection(false);
}

void BinaryWriter::writeStartDictionary(Event::size_hint_type) {
  startCollection(true);
}

void BinaryWriter::writeEndCollection() {
  if (_complete || _stack.empty())
    throw Error(UnexpectedEvent,
                "Plist: EndCollection without an open collection");

  const Object& top = _objects[_stack.back()];
  if (top.dictionary && top.refs.size() % 2 != 0)
    throw Error(UnexpectedEvent, "Plist: dictionary key has no value");

  _stack.pop_back();
  if (_stack.empty())
    finish();
}

void BinaryWriter::writeBoolean(bool value) {
  std::vector<unsigned char> encoded(1, value ? 0x09 : 0x08);
  addLeaf(encoded, false);
}

void BinaryWriter::writeData(const data_type& value) {
  std::vector<unsigned char> encoded;
  appendMarkerWithSize(encoded, 0x40, value.size());
  encoded.insert(encoded.end(), value.begin(), value.end());
  addLeaf(encoded, false);
}

void BinaryWriter::writeDate(const Date& value) {
  std::vector<unsigned char> encoded(1, 0x33);
  appendDouble(encoded, value.timeAsAppleEpoch());
  addLeaf(encoded, false);
}

void BinaryWriter::writeInteger(const Integer& value) {
#ifndef PLISTFLOW_ENABLE_UNSTABLE_KINDS
  if (!value.fitsIn64Bits())
    throw Error(IntegerOverflow, "Plist: integer " + value.toString() +
                                     " is outside the 64-bit range");
#endif
  std::vector<unsigned char> encoded;
  appendIntegerObject(encoded, value.value());
  addLeaf(encoded, false);
}

void BinaryWriter::writeReal(double value) {
  std::vector<unsigned char> encoded(1, 0x23);
  appendDouble(encoded, value);
  addLeaf(encoded, false);
}

void BinaryWriter::writeString(const std::string& value) {
  std::vector<unsigned char> encoded;
  if (isAscii(value)) {
    appendMarkerWithSize(encoded, 0x50, value.size());
    encoded.insert(encoded.end(), value.begin(), value.end());
  } else {
    std::u16string characters;
    try {
      characters = boost::locale::conv::utf_to_utf<char16_t>(
          value.data(), value.data() + value.size(), boost::locale::conv::stop);
    } catch (const boost::locale::conv::conversion_error&) {
      throw Error(InvalidData, "Plist: string is not valid UTF-8");
    }

    appendMarkerWithSize(encoded, 0x60, characters.size());
    for (std::size_t i = 0; i < characters.size(); ++i)
      appendBigEndian(encoded, characters[i], 2);
  }
  addLeaf(encoded, true);
}

void BinaryWriter::writeUid(const Uid& value) {
  const unsigned width = byteCount(value.get());
  std::vector<unsigned char> encoded(
      1, static_cast<unsigned char>(0x80 | (width - 1)));
  appendBigEndian(encoded, value.get(), width);
  addLeaf(encoded, false);
}

void BinaryWriter::startCollection(bool dictionary) {
  if (_complete)
    throw Error(UnexpectedEvent, "Plist: event after the complete value");

  Object object;
  object.collection = true;
  object.dictionary = dictionary;

  const boost::uint64_t index = _objects.size();
  addRef(index, false);
  _objects.push_back(object);
  _stack.push_back(index);
}

void BinaryWriter::addLeaf(const std::vector<unsigned char>& encoded,
                           bool isString) {
  if (_complete)
    throw Error(UnexpectedEvent, "Plist: event after the complete value");

  std::map<std::vector<unsigned char>, boost::uint64_t>::const_iterator
      interned = _interned.find(encoded);
  if (interned != _interned.end()) {
    addRef(interned->second, isString);
  } else {
    const boost::uint64_t index = _objects.size();
    addRef(index, isString);

    Object object;
    object.leaf = encoded;
    object.collection = false;
    object.dictionary = false;
    _objects.push_back(object);
    _interned[encoded] = index;
  }

  if (_stack.empty())
    finish();
}

void BinaryWriter::addRef(boost::uint64_t ref, bool isString) {
  if (_stack.empty()) {
    _root = ref;
    return;
  }

  Object& parent = _objects[_stack.back()];
  if (parent.dictionary && parent.refs.size() % 2 == 0 && !isString)
    throw Error(UnexpectedEvent, "Plist: dictionary key must be a string");
  parent.refs.push_back(ref);
}

void BinaryWriter::finish() {
  const boost::uint64_t numObjects = _objects.size();
  const unsigned objRefSize = byteCount(numObjects);

  std::vector<unsigned char> out;
  out.insert(out.end(), "bplist00", "bplist00" + 8);

  std::vector<boost::uint64_t> offsetTable;
  offsetTable.reserve(_objects.size());
  for (std::vector<Object>::const_iterator it = _objects.begin();
       it != _objects.end();
       ++it) {
    offsetTable.push_back(out.size());
    if (!it->collection) {
      out.insert(out.end(), it->leaf.begin(), it->leaf.end());
    } else if (!it->dictionary) {
      appendMarkerWithSize(out, 0xA0, it->refs.size());
      for (std::size_t i = 0; i < it->refs.size(); ++i)
        appendBigEndian(out, it->refs[i], objRefSize);
    } else {
      const std::size_t count = it->refs.size() / 2;
      appendMarkerWithSize(out, 0xD0, count);
      for (std::size_t i = 0; i < count; ++i)
        appendBigEndian(out, it->refs[2 * i], objRefSize);
      for (std::size_t i = 0; i < count; ++i)
        appendBigEndian(out, it->refs[2 * i + 1], objRefSize);
    }
  }

  const boost::uint64_t offsetTableOffset = out.size();
  const unsigned offsetByteSize = byteCount(offsetTableOffset);
  for (std::size_t i = 0; i < offsetTable.size(); ++i)
    appendBigEndian(out, offsetTable[i], offsetByteSize);

  // 5 unused bytes and the sort version
  out.insert(out.end(), 6, 0);
  out.push_back(static_cast<unsigned char>(offsetByteSize));
  out.push_back(static_cast<unsigned char>(objRefSize));
  appendBigEndian(out, numObjects, 8);
  appendBigEndian(out, _root, 8);
  appendBigEndian(out, offsetTableOffset, 8);

  _stream.write(reinterpret_cast<const char*>(&out[0]), out.size());
  if (!_stream)
    throw Error(Io, "Plist: failed to write binary plist");

  _objects.clear();
  _interned.clear();
  _complete = true;
}

} // namespace PlistFlow
