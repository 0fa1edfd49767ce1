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

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

#include "PlistBase64.hpp"

namespace PlistFlow {

namespace {

pugi::xml_node nextElement(pugi::xml_node node) {
  while (node && node.type() != pugi::node_element)
    node = node.next_sibling();
  return node;
}

std::string trim(const std::string& text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    --end;
  return text.substr(begin, end - begin);
}

double parseReal(const std::string& raw) {
  std::string text = trim(raw);
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

  if (lower == "nan")
    return std::numeric_limits<double>::quiet_NaN();
  if (lower == "inf" || lower == "+inf" || lower == "infinity" ||
      lower == "+infinity")
    return std::numeric_limits<double>::infinity();
  if (lower == "-inf" || lower == "-infinity")
    return -std::numeric_limits<double>::infinity();

  char* end = 0;
  double value = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size())
    throw Error(InvalidData, "Plist: invalid XML real " + raw);
  return value;
}

} // namespace

XmlReader::XmlReader(const char* bytes, std::size_t size)
    : _bytes(bytes), _size(size), _started(false) {}

bool XmlReader::next(Event& event) {
  if (_error)
    throw *_error;

  try {
    return readNext(event);
  } catch (const Error& e) {
    _error = e;
    throw;
  }
}

bool XmlReader::readNext(Event& event) {
  if (!_started) {
    _started = true;
    event = readElement(findRoot());
    return true;
  }

  if (_stack.empty())
    return false;

  StackItem& item = _stack.back();
  pugi::xml_node node = item.next;
  if (!node) {
    if (item.dictionary && !item.keyTurn)
      throw Error(InvalidData, "Plist: XML dictionary value expected for key " +
                                   item.key + " but not found");
    _stack.pop_back();
    event = Event::endCollection();
    return true;
  }
  item.next = nextElement(node.next_sibling());

  if (item.dictionary) {
    if (item.keyTurn) {
      if (std::string("key") != node.name())
        throw Error(InvalidData,
                    "Plist: XML dictionary key expected but not found");
      item.keyTurn = false;
      item.key = node.child_value();
      event = Event::string(item.key);
      return true;
    }

    if (std::string("key") == node.name())
      throw Error(InvalidData, "Plist: XML dictionary value expected for key " +
                                   item.key + " but found another key node");
    item.keyTurn = true;
  }

  // readElement may push, which invalidates item
  event = readElement(node);
  return true;
}

pugi::xml_node XmlReader::findRoot() {
  pugi::xml_parse_result result = _doc.load_buffer(
      _bytes, _size, pugi::parse_default | pugi::parse_ws_pcdata_single);
  if (!result)
    throw Error(InvalidXml, std::string("Plist: XML parsed with error ") +
                                result.description());

  pugi::xml_node plist = _doc.child("plist");
  pugi::xml_node root =
      plist ? nextElement(plist.first_child()) : _doc.document_element();
  if (!root)
    throw Error(InvalidXml, "Plist: XML document has no value");
  if (nextElement(root.next_sibling()))
    throw Error(TrailingData, "Plist: XML document has more than one value");
  return root;
}

Event XmlReader::readElement(const pugi::xml_node& node) {
  const std::string nodeName = node.name();

  if ("dict" == nodeName) {
    StackItem item = {nextElement(node.first_child()), true, true,
                      std::string()};
    _stack.push_back(item);
    return Event::startDictionary();
  }
  if ("array" == nodeName) {
    StackItem item = {nextElement(node.first_child()), false, false,
                      std::string()};
    _stack.push_back(item);
    return Event::startArray();
  }
  if ("string" == nodeName)
    return Event::string(node.child_value());
  if ("integer" == nodeName)
    return Event::integer(Integer::fromString(trim(node.child_value())));
  if ("real" == nodeName)
    return Event::real(parseReal(node.child_value()));
  if ("true" == nodeName)
    return Event::boolean(true);
  if ("false" == nodeName)
    return Event::boolean(false);
  if ("date" == nodeName) {
    Date date;
    date.setTimeFromXMLConvention(trim(node.child_value()));
    return Event::date(date);
  }
  if ("data" == nodeName)
    return Event::data(decodeBase64(node.child_value()));

  throw Error(InvalidData, "Plist: XML unknown node type " + nodeName);
}

} // namespace PlistFlow
