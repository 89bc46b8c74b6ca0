#ifndef __DS9SAMP_XML_RPC__
#define __DS9SAMP_XML_RPC__

#include "Headers.hpp"

namespace ds9samp {
/**
 * @brief Thrown when an XML-RPC document cannot be encoded or decoded, or when
 * a value is read as the wrong type.
 */
class XmlRpcException : public std::runtime_error {
 public:
  explicit XmlRpcException(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A <fault> returned in place of a method response.
 */
class XmlRpcFault : public XmlRpcException {
 public:
  XmlRpcFault(int _code, const string& msg)
      : XmlRpcException(msg), code(_code) {}
  int getCode() const { return code; }

 private:
  int code;
};

/**
 * @brief A dynamically typed XML-RPC value.
 *
 * Struct members keep the order in which they were added or decoded, which
 * is how hub-reported ordering survives a round trip.
 */
class XmlRpcValue {
 public:
  enum class Type { NIL, STRING, INT, BOOLEAN, DOUBLE, ARRAY, STRUCT };

  XmlRpcValue() : type(Type::NIL) {}
  XmlRpcValue(const string& s) : type(Type::STRING), stringValue(s) {}
  XmlRpcValue(const char* s) : type(Type::STRING), stringValue(s) {}

  static XmlRpcValue fromInt(int64_t i);
  static XmlRpcValue fromBool(bool b);
  static XmlRpcValue fromDouble(double d);
  static XmlRpcValue array(const vector<XmlRpcValue>& elements = {});
  static XmlRpcValue structure();

  Type getType() const { return type; }
  bool isNil() const { return type == Type::NIL; }

  const string& asString() const;
  int64_t asInt() const;
  bool asBool() const;
  double asDouble() const;
  const vector<XmlRpcValue>& asArray() const;

  /** @brief Appends an array element. */
  XmlRpcValue& push(const XmlRpcValue& element);

  /** @brief Adds a struct member, replacing an existing one of that name. */
  XmlRpcValue& set(const string& name, const XmlRpcValue& value);

  /** @brief Member names in insertion order. */
  const vector<string>& memberNames() const;

  /** @return The member, or NULL when this struct has no such member. */
  const XmlRpcValue* find(const string& name) const;

  /** @throws XmlRpcException when the member is missing. */
  const XmlRpcValue& operator[](const string& name) const;

  bool operator==(const XmlRpcValue& other) const;
  bool operator!=(const XmlRpcValue& other) const { return !(*this == other); }

 private:
  void requireType(Type expected, const char* name) const;

  Type type;
  string stringValue;
  int64_t intValue = 0;
  bool boolValue = false;
  double doubleValue = 0.0;
  vector<XmlRpcValue> elements;
  vector<string> names;
};

string encodeMethodCall(const string& method, const vector<XmlRpcValue>& params);

string encodeMethodResponse(const XmlRpcValue& value);

string encodeFault(int code, const string& message);

/**
 * @brief Decodes a <methodCall> into its method name and parameters.
 * @throws XmlRpcException on malformed input.
 */
pair<string, vector<XmlRpcValue>> decodeMethodCall(const string& xml);

/**
 * @brief Decodes a <methodResponse>.
 * @throws XmlRpcFault when the response is a fault.
 * @throws XmlRpcException on malformed input.
 */
XmlRpcValue decodeMethodResponse(const string& xml);
}  // namespace ds9samp

#endif  // __DS9SAMP_XML_RPC__
