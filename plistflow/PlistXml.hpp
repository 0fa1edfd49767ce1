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

#ifndef __PLISTFLOW_XML_H__
#define __PLISTFLOW_XML_H__

#include <boost/optional.hpp>

#include <pugixml.hpp>

#include <iosfwd>
#include <string>
#include <vector>

#include "PlistError.hpp"
#include "PlistEvent.hpp"

namespace PlistFlow {

struct XmlWriteOptions {
  XmlWriteOptions() : indent_char('\t'), indent_amount(1), root_element(true) {}

  char indent_char;
  // 0 writes everything on one line.
  unsigned indent_amount;
  // Write the XML prologue, DOCTYPE and <plist version="1.0"> around the
  // value.
  bool root_element;
};

// Produces the events of an XML plist.  The value is taken from the <plist>
// element, or from the document element when there is none.
class XmlReader : public EventReader {
 public:
  XmlReader(const char* bytes, std::size_t size);

  bool next(Event& event);

 private:
  struct StackItem {
    pugi::xml_node next;
    bool dictionary;
    bool keyTurn;
    std::string key;
  };

  bool readNext(Event& event);
  pugi::xml_node findRoot();
  Event readElement(const pugi::xml_node& node);

  const char* _bytes;
  std::size_t _size;
  pugi::xml_document _doc;
  std::vector<StackItem> _stack;
  bool _started;
  boost::optional<Error> _error;
};

// Writes the events of one value as an XML plist.  The document is saved to
// the stream when the root value completes.
class XmlWriter : public EventWriter {
 public:
  explicit XmlWriter(std::ostream& stream,
                     const XmlWriteOptions& options = XmlWriteOptions());

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

  bool isComplete() const { return _complete; }

 private:
  struct StackItem {
    pugi::xml_node node;
    bool dictionary;
    bool keyTurn;
  };

  pugi::xml_node addValue(const char* name);
  void addText(const char* name, const std::string& text);
  void finishValue();

  std::ostream& _stream;
  XmlWriteOptions _options;
  pugi::xml_document _doc;
  pugi::xml_node _root;
  std::vector<StackItem> _stack;
  bool _complete;
};

} // namespace PlistFlow

#endif
