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
#include <sstream>

namespace PlistFlow {

namespace {

const std::size_t kHeaderSize = 8;
const std::size_t kTrailerSize = 32;

bool isSupportedWidth(unsigned width) {
  return width == 1 || width == 2 || width == 3 || width == 4 || width == 8;
}

std::string describeRef(const char* what, boost::uint64_t ref) {
  std::stringstream ss;
  ss << "Plist: " << what << " " << ref;
  return ss.str();
}

} // namespace

BinaryReader::BinaryReader(const char* bytes, std::size_t size)
    : _bytes(reinterpret_cast<const unsigned char*>(bytes),
             reinterpret_cast<const unsigned char*>(bytes) + size),
      _offsetByteSize(0),
      _objRefSize(0),
      _numObjects(0),
      _topObject(0),
      _offsetTableOffset(0),
      _started(false),
      _finished(false) {}

BinaryReader::BinaryReader(const std::vector<unsigned char>& bytes)
    : _bytes(bytes),
      _offsetByteSize(0),
      _objRefSize(0),
      _numObjects(0),
      _topObject(0),
      _offsetTableOffset(0),
      _started(false),
      _finished(false) {}

bool BinaryReader::next(Event& event) {
  if (_error)
    throw *_error;

  try {
    return readNext(event);
  } catch (const Error& e) {
    _error = e;
    throw;
  }
}

bool BinaryReader::readNext(Event& event) {
  if (!_started) {
    readTrailer();
    _started = true;
    event = readObject(_topObject, false);
    return true;
  }

  if (_finished)
    return false;

  if (_stack.empty()) {
    _finished = true;
    return false;
  }

  StackItem& item = _stack.back();
  if (item.position == item.refs.size()) {
    _resolving[item.objectRef] = false;
    _stack.pop_back();
    event = Event::endCollection();
    return true;
  }

  // Dictionary refs alternate key and value.
  const bool dictionaryKey = item.dictionary && item.position % 2 == 0;
  const boost::uint64_t ref = item.refs[item.position++];
  event = readObject(ref, dictionaryKey);
  return true;
}

void BinaryReader::readTrailer() {
  if (_bytes.size() < kHeaderSize + kTrailerSize)
    throw Error(TruncatedInput,
                "Plist: binary plist is shorter than its header and trailer",
                0);

  if (std::memcmp(&_bytes[0], "bplist00", kHeaderSize) != 0)
    throw Error(MalformedHeader, "Plist: missing bplist00 header", 0);

  const boost::uint64_t trailer = _bytes.size() - kTrailerSize;

  // Trailer starts with 5 unused bytes and the sort version.
  _offsetByteSize = _bytes[trailer + 6];
  _objRefSize = _bytes[trailer + 7];
  if (!isSupportedWidth(_offsetByteSize))
    throw Error(UnsupportedWidth,
                describeRef("unsupported offset size", _offsetByteSize),
                trailer + 6);
  if (!isSupportedWidth(_objRefSize))
    throw Error(UnsupportedWidth,
                describeRef("unsupported object reference size", _objRefSize),
                trailer + 7);

  _numObjects = readUnsigned(trailer + 8, 8);
  _topObject = readUnsigned(trailer + 16, 8);
  _offsetTableOffset = readUnsigned(trailer + 24, 8);

  if (_topObject >= _numObjects)
    throw Error(InvalidObjectReference,
                describeRef("top object out of range", _topObject),
                trailer + 16);

  if (_offsetTableOffset < kHeaderSize || _offsetTableOffset > trailer)
    throw Error(ObjectOffsetOutOfBounds,
                describeRef("offset table starts out of bounds at",
                            _offsetTableOffset),
                trailer + 24);

  const boost::uint64_t available = trailer - _offsetTableOffset;
  if (_numObjects > available / _offsetByteSize)
    throw Error(TruncatedInput, "Plist: offset table runs into the trailer",
                _offsetTableOffset);
  if (_numObjects * _offsetByteSize != available)
    throw Error(TrailingData,
                "Plist: unexpected bytes between offset table and trailer",
                _offsetTableOffset + _numObjects * _offsetByteSize);

  _offsetTable.resize(static_cast<std::size_t>(_numObjects));
  for (boost::uint64_t i = 0; i < _numObjects; ++i)
    _offsetTable[i] =
        readUnsigned(_offsetTableOffset + i * _offsetByteSize, _offsetByteSize);

  _resolving.assign(static_cast<std::size_t>(_numObjects), false);
}

Event BinaryReader::readObject(boost::uint64_t objectRef, bool dictionaryKey) {
  if (objectRef >= _numObjects)
    throw Error(InvalidObjectReference,
                describeRef("object reference out of range", objectRef));
  if (_resolving[objectRef])
    throw Error(InvalidObjectReference,
                describeRef("cyclic reference to object", objectRef));

  const boost::uint64_t offset = _offsetTable[objectRef];
  if (offset < kHeaderSize || offset >= _offsetTableOffset)
    throw Error(ObjectOffsetOutOfBounds,
                describeRef("object offset out of bounds", offset), offset);

  const unsigned char marker = _bytes[offset];
  boost::uint64_t position = offset + 1;

  if (dictionaryKey && (marker & 0xF0) != 0x50 && (marker & 0xF0) != 0x60)
    throw Error(InvalidData, "Plist: dictionary key is not a string", offset);

  switch (marker & 0xF0) {
  case 0x00: {
    if (marker == 0x08)
      return Event::boolean(false);
    if (marker == 0x09)
      return Event::boolean(true);
    // null (0x00) and fill (0x0F) are in the format but are not values
    std::stringstream ss;
    ss << "Plist: unsupported singleton marker 0x" << std::hex
       << static_cast<int>(marker);
    throw Error(InvalidData, ss.str(), offset);
  }
  case 0x10: {
    position = offset;
    return Event::integer(readInteger(position));
  }
  case 0x20: {
    if (marker == 0x22) {
      checkRange(position, 4);
      boost::uint32_t bits =
          static_cast<boost::uint32_t>(readUnsigned(position, 4));
      float value;
      std::memcpy(&value, &bits, sizeof(value));
      return Event::real(value);
    }
    if (marker == 0x23) {
      checkRange(position, 8);
      boost::uint64_t bits = readUnsigned(position, 8);
      double value;
      std::memcpy(&value, &bits, sizeof(value));
      return Event::real(value);
    }
    throw Error(InvalidData, "Plist: unsupported real width", offset);
  }
  case 0x30: {
    if (marker != 0x33)
      throw Error(InvalidData, "Plist: unsupported date width", offset);
    // date always an 8 byte float starting after full byte header
    checkRange(position, 8);
    boost::uint64_t bits = readUnsigned(position, 8);
    double appleTime;
    std::memcpy(&appleTime, &bits, sizeof(appleTime));
    try {
      return Event::date(Date::fromAppleEpoch(appleTime));
    } catch (const Error& e) {
      throw Error(e.kind(), e.what(), offset);
    }
  }
  case 0x40: {
    const boost::uint64_t length = readSize(marker, position);
    checkRange(position, length);
    const unsigned char* begin = &_bytes[0] + position;
    return Event::data(data_type(begin, begin + length));
  }
  case 0x50: {
    const boost::uint64_t length = readSize(marker, position);
    checkRange(position, length);
    const char* begin = reinterpret_cast<const char*>(&_bytes[0] + position);
    try {
      return Event::string(boost::locale::conv::utf_to_utf<char>(
          begin, begin + length, boost::locale::conv::stop));
    } catch (const boost::locale::conv::conversion_error&) {
      throw Error(InvalidData, "Plist: string is not valid UTF-8", offset);
    }
  }
  case 0x60: {
    // The size counts UTF-16 code units, not bytes.
    const boost::uint64_t units = readSize(marker, position);
    if (units > _offsetTableOffset / 2)
      throw Error(TruncatedInput, "Plist: UTF-16 string runs past object table",
                  offset);
    checkRange(position, units * 2);

    std::u16string characters(static_cast<std::size_t>(units), u'\0');
    for (boost::uint64_t i = 0; i < units; ++i)
      characters[i] =
          static_cast<char16_t>(readUnsigned(position + i * 2, 2));
    try {
      return Event::string(boost::locale::conv::utf_to_utf<char>(
          characters.data(), characters.data() + characters.size(),
          boost::locale::conv::stop));
    } catch (const boost::locale::conv::conversion_error&) {
      throw Error(InvalidData, "Plist: string is not valid UTF-16", offset);
    }
  }
  case 0x80: {
    const unsigned width = (marker & 0x0F) + 1;
    if (width > 8)
      throw Error(IntegerOverflow, "Plist: UID wider than 64 bits", offset);
    checkRange(position, width);
    return Event::uid(Uid(readUnsigned(position, width)));
  }
  case 0xA0: {
    const boost::uint64_t count = readSize(marker, position);
    StackItem item;
    item.objectRef = objectRef;
    item.refs = readRefs(position, count);
    item.position = 0;
    item.dictionary = false;
    _stack.push_back(item);
    _resolving[objectRef] = true;
    return Event::startArray(count);
  }
  case 0xD0: {
    const boost::uint64_t count = readSize(marker, position);
    if (count > _offsetTableOffset / 2)
      throw Error(TruncatedInput, "Plist: dictionary runs past object table",
                  offset);

    // Keys are stored before values; events need them interleaved.
    std::vector<boost::uint64_t> refs = readRefs(position, count * 2);
    StackItem item;
    item.objectRef = objectRef;
    item.refs.reserve(refs.size());
    for (boost::uint64_t i = 0; i < count; ++i) {
      item.refs.push_back(refs[i]);
      item.refs.push_back(refs[count + i]);
    }
    item.position = 0;
    item.dictionary = true;
    _stack.push_back(item);
    _resolving[objectRef] = true;
    return Event::startDictionary(count);
  }
  }

  std::stringstream ss;
  ss << "Plist: unsupported object marker 0x" << std::hex
     << static_cast<int>(marker);
  throw Error(InvalidData, ss.str(), offset);
}

boost::uint64_t BinaryReader::readUnsigned(boost::uint64_t position,
                                           unsigned width) const {
  if (position > _bytes.size() || width > _bytes.size() - position)
    throw Error(TruncatedInput, "Plist: unexpected end of data", position);

  boost::uint64_t result = 0;
  for (unsigned n = 0; n < width; ++n)
    result = (result << 8) + _bytes[position + n];
  return result;
}

Integer BinaryReader::readInteger(boost::uint64_t& position) const {
  const boost::uint64_t start = position;
  checkRange(position, 1);
  const unsigned char marker = _bytes[position];
  if ((marker & 0xF0) != 0x10)
    throw Error(InvalidData, "Plist: expected an integer object", start);

  const boost::uint64_t width = static_cast<boost::uint64_t>(1)
                                << (marker & 0x0F);
  checkRange(position + 1, width);
  const boost::uint64_t payload = position + 1;
  position = payload + width;

  // 1, 2 and 4 byte integers are unsigned, 8 bytes are signed.
  if (width < 8)
    return Integer(static_cast<unsigned long long>(
        readUnsigned(payload, static_cast<unsigned>(width))));
  if (width == 8)
    return Integer(static_cast<long long>(readUnsigned(payload, 8)));

  // Wider integers are two's complement; only the low 128 bits may carry
  // information, anything above must be sign extension.
  const boost::uint64_t low = payload + width - 16;
  const uint128_type magnitude =
      (static_cast<uint128_type>(readUnsigned(low, 8)) << 64) |
      readUnsigned(low + 8, 8);
  const int128_type value = static_cast<int128_type>(magnitude);
  const unsigned char extension = value < 0 ? 0xFF : 0x00;
  for (boost::uint64_t i = payload; i < low; ++i) {
    if (_bytes[i] != extension)
      throw Error(IntegerOverflow,
                  "Plist: integer does not fit in 128 bits", start);
  }
  return Integer::fromInt128(value);
}

boost::uint64_t BinaryReader::readSize(unsigned char marker,
                                       boost::uint64_t& position) const {
  if ((marker & 0x0F) != 0x0F)
    return marker & 0x0F;

  const boost::uint64_t start = position;
  boost::optional<boost::uint64_t> size = readInteger(position).asUnsigned();
  if (!size)
    throw Error(InvalidData, "Plist: invalid object size", start);
  return *size;
}

std::vector<boost::uint64_t> BinaryReader::readRefs(
    boost::uint64_t position, boost::uint64_t count) const {
  if (count > _offsetTableOffset / _objRefSize)
    throw Error(TruncatedInput, "Plist: collection runs past object table",
                position);
  checkRange(position, count * _objRefSize);

  std::vector<boost::uint64_t> refs;
  refs.reserve(static_cast<std::size_t>(count));
  for (boost::uint64_t i = 0; i < count; ++i)
    refs.push_back(readUnsigned(position + i * _objRefSize, _objRefSize));
  return refs;
}

void BinaryReader::checkRange(boost::uint64_t position,
                              boost::uint64_t length) const {
  if (position > _offsetTableOffset || length > _offsetTableOffset - position)
    throw Error(TruncatedInput, "Plist: object runs past the object table",
                position);
}

} // namespace PlistFlow
