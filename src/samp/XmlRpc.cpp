#include "XmlRpc.hpp"

namespace ds9samp {
namespace {
string typeName(XmlRpcValue::Type type) {
  switch (type) {
    case XmlRpcValue::Type::NIL:
      return "nil";
    case XmlRpcValue::Type::STRING:
      return "string";
    case XmlRpcValue::Type::INT:
      return "int";
    case XmlRpcValue::Type::BOOLEAN:
      return "boolean";
    case XmlRpcValue::Type::DOUBLE:
      return "double";
    case XmlRpcValue::Type::ARRAY:
      return "array";
    case XmlRpcValue::Type::STRUCT:
      return "struct";
  }
  return "unknown";
}

string escapeXml(const string& s) {
  string retval;
  retval.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&':
        retval += "&amp;";
        break;
      case '<':
        retval += "&lt;";
        break;
      case '>':
        retval += "&gt;";
        break;
      default:
        retval += c;
    }
  }
  return retval;
}

void appendUtf8(string& out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += char(codepoint);
  } else if (codepoint < 0x800) {
    out += char(0xC0 | (codepoint >> 6));
    out += char(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += char(0xE0 | (codepoint >> 12));
    out += char(0x80 | ((codepoint >> 6) & 0x3F));
    out += char(0x80 | (codepoint & 0x3F));
  } else {
    out += char(0xF0 | (codepoint >> 18));
    out += char(0x80 | ((codepoint >> 12) & 0x3F));
    out += char(0x80 | ((codepoint >> 6) & 0x3F));
    out += char(0x80 | (codepoint & 0x3F));
  }
}

string decodeEntities(const string& s) {
  string retval;
  size_t pos = 0;
  while (pos < s.size()) {
    if (s[pos] != '&') {
      retval += s[pos++];
      continue;
    }
    auto end = s.find(';', pos);
    if (end == string::npos) {
      throw XmlRpcException("Unterminated entity in '" + s + "'");
    }
    string entity = s.substr(pos + 1, end - pos - 1);
    if (entity == "lt") {
      retval += '<';
    } else if (entity == "gt") {
      retval += '>';
    } else if (entity == "amp") {
      retval += '&';
    } else if (entity == "quot") {
      retval += '"';
    } else if (entity == "apos") {
      retval += '\'';
    } else if (entity.size() > 1 && entity[0] == '#') {
      try {
        uint32_t codepoint =
            (entity[1] == 'x' || entity[1] == 'X')
                ? uint32_t(std::stoul(entity.substr(2), nullptr, 16))
                : uint32_t(std::stoul(entity.substr(1)));
        appendUtf8(retval, codepoint);
      } catch (const std::logic_error& le) {
        throw XmlRpcException("Invalid character reference &" + entity + ";");
      }
    } else {
      throw XmlRpcException("Unknown entity &" + entity + ";");
    }
    pos = end + 1;
  }
  return retval;
}

struct XmlTag {
  string name;
  bool closing = false;
  bool selfClosing = false;
};

string describeTag(const XmlTag& tag) {
  return string("<") + (tag.closing ? "/" : "") + tag.name +
         (tag.selfClosing ? "/" : "") + ">";
}

/**
 * @brief Pull reader for the subset of XML that XML-RPC documents use:
 * elements, text, entities, prolog and comments. No CDATA or DTDs.
 */
class XmlReader {
 public:
  explicit XmlReader(const string& _xml) : xml(_xml), pos(0) {}

  XmlTag readTag() {
    skipMarkup();
    if (pos >= xml.size() || xml[pos] != '<') {
      throw XmlRpcException("Expected an element at offset " +
                            to_string(pos));
    }
    auto end = xml.find('>', pos);
    if (end == string::npos) {
      throw XmlRpcException("Unterminated element at offset " +
                            to_string(pos));
    }
    string body = xml.substr(pos + 1, end - pos - 1);
    pos = end + 1;

    XmlTag tag;
    if (!body.empty() && body[0] == '/') {
      tag.closing = true;
      body = body.substr(1);
    }
    if (!body.empty() && body.back() == '/') {
      tag.selfClosing = true;
      body.pop_back();
    }
    // Attributes are not part of XML-RPC, drop them
    tag.name = trim(body.substr(0, body.find_first_of(" \t\r\n")));
    return tag;
  }

  string readText() {
    auto end = xml.find('<', pos);
    if (end == string::npos) {
      end = xml.size();
    }
    string raw = xml.substr(pos, end - pos);
    pos = end;
    return decodeEntities(raw);
  }

  void expectOpen(const string& name) {
    auto tag = readTag();
    if (tag.closing || tag.selfClosing || tag.name != name) {
      throw XmlRpcException("Expected <" + name + "> but found " +
                            describeTag(tag));
    }
  }

  void expectClose(const string& name) {
    auto tag = readTag();
    if (!tag.closing || tag.name != name) {
      throw XmlRpcException("Expected </" + name + "> but found " +
                            describeTag(tag));
    }
  }

 private:
  void skipMarkup() {
    while (true) {
      while (pos < xml.size() && isspace((unsigned char)xml[pos])) {
        ++pos;
      }
      if (xml.compare(pos, 2, "<?") == 0) {
        skipPast("?>");
      } else if (xml.compare(pos, 4, "<!--") == 0) {
        skipPast("-->");
      } else {
        return;
      }
    }
  }

  void skipPast(const string& terminator) {
    auto end = xml.find(terminator, pos);
    if (end == string::npos) {
      throw XmlRpcException("Missing " + terminator);
    }
    pos = end + terminator.size();
  }

  const string& xml;
  size_t pos;
};

XmlRpcValue readValue(XmlReader& reader);
XmlRpcValue readValueBody(XmlReader& reader, const XmlTag& open);

XmlRpcValue parseTypedValue(XmlReader& reader, const XmlTag& tag) {
  const string& type = tag.name;
  if (type == "nil") {
    if (!tag.selfClosing) {
      reader.expectClose("nil");
    }
    return XmlRpcValue();
  }
  if (type == "array") {
    XmlRpcValue result = XmlRpcValue::array();
    if (tag.selfClosing) {
      return result;
    }
    auto data = reader.readTag();
    if (data.closing || data.name != "data") {
      throw XmlRpcException("Expected <data> but found " + describeTag(data));
    }
    if (!data.selfClosing) {
      while (true) {
        auto next = reader.readTag();
        if (next.closing && next.name == "data") {
          break;
        }
        if (next.closing || next.name != "value") {
          throw XmlRpcException("Expected <value> but found " +
                                describeTag(next));
        }
        result.push(readValueBody(reader, next));
      }
    }
    reader.expectClose("array");
    return result;
  }
  if (type == "struct") {
    XmlRpcValue result = XmlRpcValue::structure();
    if (tag.selfClosing) {
      return result;
    }
    while (true) {
      auto next = reader.readTag();
      if (next.closing && next.name == "struct") {
        break;
      }
      if (next.closing || next.selfClosing || next.name != "member") {
        throw XmlRpcException("Expected <member> but found " +
                              describeTag(next));
      }
      reader.expectOpen("name");
      string name = reader.readText();
      reader.expectClose("name");
      result.set(name, readValue(reader));
      reader.expectClose("member");
    }
    return result;
  }

  string text;
  if (!tag.selfClosing) {
    text = reader.readText();
    reader.expectClose(type);
  }
  if (type == "string") {
    return XmlRpcValue(text);
  }
  try {
    if (type == "int" || type == "i4" || type == "i8") {
      return XmlRpcValue::fromInt(std::stoll(trim(text)));
    }
    if (type == "double") {
      return XmlRpcValue::fromDouble(std::stod(trim(text)));
    }
  } catch (const std::logic_error& le) {
    throw XmlRpcException("Invalid <" + type + "> value '" + text + "'");
  }
  if (type == "boolean") {
    string flag = trim(text);
    if (flag == "1" || flag == "true") {
      return XmlRpcValue::fromBool(true);
    }
    if (flag == "0" || flag == "false") {
      return XmlRpcValue::fromBool(false);
    }
    throw XmlRpcException("Invalid <boolean> value '" + text + "'");
  }
  throw XmlRpcException("Unsupported XML-RPC type <" + type + ">");
}

// Reads what follows an opened <value>; a value without a type element is a
// string
XmlRpcValue readValueBody(XmlReader& reader, const XmlTag& open) {
  if (open.selfClosing) {
    return XmlRpcValue(string());
  }
  string text = reader.readText();
  auto tag = reader.readTag();
  if (tag.closing) {
    if (tag.name != "value") {
      throw XmlRpcException("Unexpected " + describeTag(tag));
    }
    return XmlRpcValue(text);
  }
  XmlRpcValue value = parseTypedValue(reader, tag);
  reader.expectClose("value");
  return value;
}

XmlRpcValue readValue(XmlReader& reader) {
  auto open = reader.readTag();
  if (open.closing || open.name != "value") {
    throw XmlRpcException("Expected <value> but found " + describeTag(open));
  }
  return readValueBody(reader, open);
}

void encodeValue(const XmlRpcValue& value, string& out) {
  out += "<value>";
  switch (value.getType()) {
    case XmlRpcValue::Type::NIL:
      out += "<nil/>";
      break;
    case XmlRpcValue::Type::STRING:
      out += "<string>" + escapeXml(value.asString()) + "</string>";
      break;
    case XmlRpcValue::Type::INT:
      if (value.asInt() >= INT32_MIN && value.asInt() <= INT32_MAX) {
        out += "<int>" + to_string(value.asInt()) + "</int>";
      } else {
        out += "<i8>" + to_string(value.asInt()) + "</i8>";
      }
      break;
    case XmlRpcValue::Type::BOOLEAN:
      out += string("<boolean>") + (value.asBool() ? "1" : "0") + "</boolean>";
      break;
    case XmlRpcValue::Type::DOUBLE: {
      std::ostringstream ss;
      ss.precision(17);
      ss << value.asDouble();
      out += "<double>" + ss.str() + "</double>";
      break;
    }
    case XmlRpcValue::Type::ARRAY:
      out += "<array><data>";
      for (const auto& element : value.asArray()) {
        encodeValue(element, out);
      }
      out += "</data></array>";
      break;
    case XmlRpcValue::Type::STRUCT:
      out += "<struct>";
      for (const auto& name : value.memberNames()) {
        out += "<member><name>" + escapeXml(name) + "</name>";
        encodeValue(value[name], out);
        out += "</member>";
      }
      out += "</struct>";
      break;
  }
  out += "</value>";
}

const string XML_PROLOG = "<?xml version=\"1.0\"?>\n";
}  // namespace

XmlRpcValue XmlRpcValue::fromInt(int64_t i) {
  XmlRpcValue value;
  value.type = Type::INT;
  value.intValue = i;
  return value;
}

XmlRpcValue XmlRpcValue::fromBool(bool b) {
  XmlRpcValue value;
  value.type = Type::BOOLEAN;
  value.boolValue = b;
  return value;
}

XmlRpcValue XmlRpcValue::fromDouble(double d) {
  XmlRpcValue value;
  value.type = Type::DOUBLE;
  value.doubleValue = d;
  return value;
}

XmlRpcValue XmlRpcValue::array(const vector<XmlRpcValue>& elements) {
  XmlRpcValue value;
  value.type = Type::ARRAY;
  value.elements = elements;
  return value;
}

XmlRpcValue XmlRpcValue::structure() {
  XmlRpcValue value;
  value.type = Type::STRUCT;
  return value;
}

void XmlRpcValue::requireType(Type expected, const char* name) const {
  if (type != expected) {
    throw XmlRpcException(string("Expected an XML-RPC ") + name +
                          " but found " + typeName(type));
  }
}

const string& XmlRpcValue::asString() const {
  requireType(Type::STRING, "string");
  return stringValue;
}

int64_t XmlRpcValue::asInt() const {
  requireType(Type::INT, "int");
  return intValue;
}

bool XmlRpcValue::asBool() const {
  requireType(Type::BOOLEAN, "boolean");
  return boolValue;
}

double XmlRpcValue::asDouble() const {
  requireType(Type::DOUBLE, "double");
  return doubleValue;
}

const vector<XmlRpcValue>& XmlRpcValue::asArray() const {
  requireType(Type::ARRAY, "array");
  return elements;
}

XmlRpcValue& XmlRpcValue::push(const XmlRpcValue& element) {
  requireType(Type::ARRAY, "array");
  elements.push_back(element);
  return *this;
}

XmlRpcValue& XmlRpcValue::set(const string& name, const XmlRpcValue& value) {
  requireType(Type::STRUCT, "struct");
  for (size_t i = 0; i < names.size(); ++i) {
    if (names[i] == name) {
      elements[i] = value;
      return *this;
    }
  }
  names.push_back(name);
  elements.push_back(value);
  return *this;
}

const vector<string>& XmlRpcValue::memberNames() const {
  requireType(Type::STRUCT, "struct");
  return names;
}

const XmlRpcValue* XmlRpcValue::find(const string& name) const {
  requireType(Type::STRUCT, "struct");
  for (size_t i = 0; i < names.size(); ++i) {
    if (names[i] == name) {
      return &elements[i];
    }
  }
  return NULL;
}

const XmlRpcValue& XmlRpcValue::operator[](const string& name) const {
  auto member = find(name);
  if (member == NULL) {
    throw XmlRpcException("Missing struct member '" + name + "'");
  }
  return *member;
}

bool XmlRpcValue::operator==(const XmlRpcValue& other) const {
  if (type != other.type) {
    return false;
  }
  switch (type) {
    case Type::NIL:
      return true;
    case Type::STRING:
      return stringValue == other.stringValue;
    case Type::INT:
      return intValue == other.intValue;
    case Type::BOOLEAN:
      return boolValue == other.boolValue;
    case Type::DOUBLE:
      return doubleValue == other.doubleValue;
    case Type::ARRAY:
      return elements == other.elements;
    case Type::STRUCT:
      return names == other.names && elements == other.elements;
  }
  return false;
}

string encodeMethodCall(const string& method,
                        const vector<XmlRpcValue>& params) {
  string out = XML_PROLOG + "<methodCall><methodName>" + escapeXml(method) +
               "</methodName><params>";
  for (const auto& param : params) {
    out += "<param>";
    encodeValue(param, out);
    out += "</param>";
  }
  out += "</params></methodCall>\n";
  return out;
}

string encodeMethodResponse(const XmlRpcValue& value) {
  string out = XML_PROLOG + "<methodResponse><params><param>";
  encodeValue(value, out);
  out += "</param></params></methodResponse>\n";
  return out;
}

string encodeFault(int code, const string& message) {
  auto fault = XmlRpcValue::structure();
  fault.set("faultCode", XmlRpcValue::fromInt(code));
  fault.set("faultString", message);
  string out = XML_PROLOG + "<methodResponse><fault>";
  encodeValue(fault, out);
  out += "</fault></methodResponse>\n";
  return out;
}

pair<string, vector<XmlRpcValue>> decodeMethodCall(const string& xml) {
  XmlReader reader(xml);
  reader.expectOpen("methodCall");
  reader.expectOpen("methodName");
  string method = trim(reader.readText());
  reader.expectClose("methodName");

  vector<XmlRpcValue> params;
  auto tag = reader.readTag();
  if (tag.name == "params" && !tag.closing) {
    if (!tag.selfClosing) {
      while (true) {
        auto next = reader.readTag();
        if (next.closing && next.name == "params") {
          break;
        }
        if (next.closing || next.selfClosing || next.name != "param") {
          throw XmlRpcException("Expected <param> but found " +
                                describeTag(next));
        }
        params.push_back(readValue(reader));
        reader.expectClose("param");
      }
    }
    reader.expectClose("methodCall");
  } else if (!tag.closing || tag.name != "methodCall") {
    throw XmlRpcException("Unexpected " + describeTag(tag) + " in methodCall");
  }
  return make_pair(method, params);
}

XmlRpcValue decodeMethodResponse(const string& xml) {
  XmlReader reader(xml);
  reader.expectOpen("methodResponse");
  auto tag = reader.readTag();
  if (tag.name == "fault" && !tag.closing && !tag.selfClosing) {
    auto fault = readValue(reader);
    int code = 0;
    string message = "Unknown XML-RPC fault";
    if (fault.getType() == XmlRpcValue::Type::STRUCT) {
      auto faultCode = fault.find("faultCode");
      if (faultCode && faultCode->getType() == XmlRpcValue::Type::INT) {
        code = int(faultCode->asInt());
      }
      auto faultString = fault.find("faultString");
      if (faultString && faultString->getType() == XmlRpcValue::Type::STRING) {
        message = faultString->asString();
      }
    }
    throw XmlRpcFault(code, message);
  }
  if (tag.name != "params" || tag.closing || tag.selfClosing) {
    throw XmlRpcException("Expected <params> but found " + describeTag(tag));
  }
  reader.expectOpen("param");
  XmlRpcValue value = readValue(reader);
  reader.expectClose("param");
  reader.expectClose("params");
  reader.expectClose("methodResponse");
  return value;
}
}  // namespace ds9samp
