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

#ifndef __PLISTFLOW_BINARY_H__
#define __PLISTFLOW_BINARY_H__

#include <boost/cstdint.hpp>
#include <boost/optional.hpp>

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "PlistError.hpp"
#include "PlistEvent.hpp"

namespace PlistFlow {

// Decodes a bplist00 buffer into events.  The container keeps its widths and
// root index in a trailer at the end of the file, so the whole buffer has to
// be available up front.
//
// https://opensource.apple.com/source/CF/CF-550/CFBinaryPList.c
class BinaryReader : public EventReader {
 public:
  BinaryReader(const char* bytes, std::size_t size);
  explicit BinaryReader(const std::vector<unsigned char>& bytes);

  bool next(Event& event);

 private:
  struct StackItem {
    boost::uint64_t objectRef;
    std::vector<boost::uint64_t> refs;
    std::size_t position;
    bool dictionary;
  };

  bool readNext(Event& event);
  void readTrailer();
  Event readObject(boost::uint64_t objectRef, bool dictionaryKey);

  boost::uint64_t readUnsigned(boost::uint64_t position, unsigned width) const;
  Integer readInteger(boost::uint64_t& position) const;
  boost::uint64_t readSize(unsigned char marker, boost::uint64_t& position) const;
  std::vector<boost::uint64_t> readRefs(boost::uint64_t position,
                                        boost::uint64_t count) const;
  void checkRange(boost::uint64_t position, boost::uint64_t length) const;

  std::vector<unsigned char> _bytes;

  unsigned _offsetByteSize;
  unsigned _objRefSize;
  boost::uint64_t _numObjects;
  boost::uint64_t _topObject;
  boost::uint64_t _offsetTableOffset;
  std::vector<boost::uint64_t> _offsetTable;

  std::vector<StackItem> _stack;
  std::vector<bool> _resolving;
  bool _started;
  bool _finished;
  boost::optional<Error> _error;
};

// Encodes the events of one value as a bplist00 file.  Objects are collected
// as the events arrive; the file is written to the stream when the root
// value completes.
//
// Adapted from https://hg.python.org/cpython/file/3.4/Lib/plistlib.py
class BinaryWriter : public EventWriter {
 public:
  explicit BinaryWriter(std::ostream& stream);

  void writeStartArray(Event::size_hint_type size);
  void writeStartDictionary(Event::size_hint_type size);
  void writeEndCollection();

  void writeBoolean(bool value);
  void writeData(const data_type& value);
  void writeDate(const Date& value);
  void writeInteger(const Integer& value);
  void writeReal(double value);
  void writeString(const std::string& value);
  void writeUid(const Uid& value);

  // True once the root value completed and the file was written.
  bool isComplete() const { return _complete; }

 private:
  struct Object {
    // Encoded bytes for leaves, empty for collections.
    std::vector<unsigned char> leaf;
    // Child indices; dictionaries alternate key and value.
    std::vector<boost::uint64_t> refs;
    bool collection;
    bool dictionary;
  };

  void startCollection(bool dictionary);
  void addLeaf(const std::vector<unsigned char>& encoded, bool isString);
  void addRef(boost::uint64_t ref, bool isString);
  void finish();

  std::ostream& _stream;
  std::vector<Object> _objects;
  std::map<std::vector<unsigned char>, boost::uint64_t> _interned;
  std::vector<boost::uint64_t> _stack;
  boost::uint64_t _root;
  bool _complete;
};

} // namespace PlistFlow

#endif
