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

#include "PlistXml.hpp"

#include <cmath>
#include <cstdlib>
#include <locale>
#include <ostream>
#include <sstream>

#include "PlistBase64.hpp"

namespace PlistFlow {

namespace {

// Shortest decimal form that reads back as the same double.
std::string formatReal(double value) {
  if (std::isnan(value))
    return "nan";
  if (std::isinf(value))
    return value > 0 ? "+infinity" : "-infinity";

  std::string text;
  for (int precision = 15; precision <= 17; ++precision) {
    std::ostringstream stream;
    stream.imbue(std::locale::classic());
    stream.precision(precision);
    stream << value;
    text = stream.str();
    if (std::strtod(text.c_str(), 0) == value)
      break;
  }
  return text;
}

} // namespace

XmlWriter::XmlWriter(std::ostream& stream, const XmlWriteOptions& options)
    : _stream(stream), _options(options), _complete(false) {
  if (_options.root_element) {
    pugi::xml_node decl = _doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    _doc.append_child(pugi::node_doctype)
        .set_value("plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
                   "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\"");

    _root = _doc.append_child("plist");
    _root.append_attribute("version") = "1.0";
  } else {
    _root = _doc;
  }
}

void XmlWriter::writeStartArray(Event::size_hint_type) {
  StackItem item = {addValue("array"), false, false};
  _stack.push_back(item);
}

void XmlWriter::writeStartDictionary(Event::size_hint_type) {
  StackItem item = {addValue("dict"), true, true};
  _stack.push_back(item);
}

void XmlWriter::writeEndCollection() {
  if (_complete || _stack.empty())
    throw Error(UnexpectedEvent,
                "Plist: EndCollection without an open collection");
  if (_stack.back().dictionary && !_stack.back().keyTurn)
    throw Error(UnexpectedEvent, "Plist: dictionary key has no value");

  _stack.pop_back();
  finishValue();
}

void XmlWriter::writeBoolean(bool value) {
  addValue(value ? "true" : "false");
  finishValue();
}

void XmlWriter::writeData(const data_type& value) {
  addText("data", encodeBase64(value));
}

void XmlWriter::writeDate(const Date& value) {
  addText("date", value.timeAsXMLConvention());
}

void XmlWriter::writeInteger(const Integer& value) {
#ifndef PLISTFLOW_ENABLE_UNSTABLE_KINDS
  if (!value.fitsIn64Bits())
    throw Error(IntegerOverflow, "Plist: integer " + value.toString() +
                                     " is outside the 64-bit range");
#endif
  addText("integer", value.toString());
}

void XmlWriter::writeReal(double value) {
  addText("real", formatReal(value));
}

void XmlWriter::writeString(const std::string& value) {
  if (value.find('\0') != std::string::npos)
    throw Error(InvalidData, "Plist: XML cannot carry a string containing NUL");
  if (!_complete && !_stack.empty() && _stack.back().dictionary &&
      _stack.back().keyTurn) {
    _stack.back().keyTurn = false;
    _stack.back().node.append_child("key").append_child(pugi::node_pcdata)
        .set_value(value.c_str());
    return;
  }
  addText("string", value);
}

void XmlWriter::writeUid(const Uid&) {
  throw Error(UidNotSupportedInXml, "Plist: UID values have no XML form");
}

pugi::xml_node XmlWriter::addValue(const char* name) {
  if (_complete)
    throw Error(UnexpectedEvent, "Plist: event after the complete value");

  if (_stack.empty())
    return _root.append_child(name);

  StackItem& item = _stack.back();
  if (item.dictionary) {
    if (item.keyTurn)
      throw Error(UnexpectedEvent, "Plist: dictionary key must be a string");
    item.keyTurn = true;
  }
  return item.node.append_child(name);
}

void XmlWriter::addText(const char* name, const std::string& text) {
  pugi::xml_node node = addValue(name);
  if (!text.empty())
    node.append_child(pugi::node_pcdata).set_value(text.c_str());
  finishValue();
}

void XmlWriter::finishValue() {
  if (!_stack.empty())
    return;

  const std::string indent(_options.indent_amount, _options.indent_char);
  unsigned int flags = pugi::format_no_declaration;
  flags |= _options.indent_amount == 0 ? pugi::format_raw : pugi::format_indent;

  _doc.save(_stream, indent.c_str(), flags, pugi::encoding_utf8);
  if (_options.indent_amount == 0)
    _stream << '\n';
  if (!_stream)
    throw Error(Io, "Plist: failed to write XML plist");
  _complete = true;
}

} // namespace PlistFlow
