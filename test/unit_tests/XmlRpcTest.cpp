#include "TestHeaders.hpp"
#include "XmlRpc.hpp"

using namespace ds9samp;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Decode a registration response", "[XmlRpc]") {
  const string xml =
      "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      "<methodResponse>\n"
      "  <params>\n"
      "    <param>\n"
      "      <value>\n"
      "        <struct>\n"
      "          <member><name>samp.private-key</name>"
      "<value><string>k-123</string></value></member>\n"
      "          <member><name>samp.hub-id</name>"
      "<value>hub</value></member>\n"
      "          <member><name>samp.self-id</name>"
      "<value><string>c7</string></value></member>\n"
      "        </struct>\n"
      "      </value>\n"
      "    </param>\n"
      "  </params>\n"
      "</methodResponse>\n";

  auto value = decodeMethodResponse(xml);
  REQUIRE(value.getType() == XmlRpcValue::Type::STRUCT);
  REQUIRE(value.memberNames() ==
          vector<string>{"samp.private-key", "samp.hub-id", "samp.self-id"});
  REQUIRE(value["samp.private-key"].asString() == "k-123");
  // An untyped value is a string
  REQUIRE(value["samp.hub-id"].asString() == "hub");
  REQUIRE(value.find("samp.missing") == NULL);
  REQUIRE_THROWS_AS(value["samp.missing"], XmlRpcException);
}

TEST_CASE("Decode scalar and array values", "[XmlRpc]") {
  const string xml =
      "<methodResponse><params><param><value><array><data>"
      "<value><i4>42</i4></value>"
      "<value><int>-3</int></value>"
      "<value><boolean>1</boolean></value>"
      "<value><double>2.5</double></value>"
      "<value><string/></value>"
      "<value/>"
      "<value><nil/></value>"
      "</data></array></value></param></params></methodResponse>";

  auto value = decodeMethodResponse(xml);
  const auto& elements = value.asArray();
  REQUIRE(elements.size() == 7);
  REQUIRE(elements[0].asInt() == 42);
  REQUIRE(elements[1].asInt() == -3);
  REQUIRE(elements[2].asBool());
  REQUIRE(elements[3].asDouble() == 2.5);
  REQUIRE(elements[4].asString().empty());
  REQUIRE(elements[5].asString().empty());
  REQUIRE(elements[6].isNil());
  REQUIRE_THROWS_AS(elements[0].asString(), XmlRpcException);
}

TEST_CASE("Entities are decoded", "[XmlRpc]") {
  const string xml =
      "<methodResponse><params><param><value><string>"
      "a &lt;b&gt; &amp; &quot;c&quot; &apos;d&apos; &#65;&#x42;"
      "</string></value></param></params></methodResponse>";

  REQUIRE(decodeMethodResponse(xml).asString() ==
          "a <b> & \"c\" 'd' AB");
}

TEST_CASE("A fault is raised as XmlRpcFault", "[XmlRpc]") {
  const string xml = encodeFault(1, "No such client c99");
  try {
    decodeMethodResponse(xml);
    FAIL("Expected an XmlRpcFault");
  } catch (const XmlRpcFault& fault) {
    REQUIRE(fault.getCode() == 1);
    REQUIRE(string(fault.what()) == "No such client c99");
  }
}

TEST_CASE("Malformed responses are rejected", "[XmlRpc]") {
  REQUIRE_THROWS_AS(decodeMethodResponse(""), XmlRpcException);
  REQUIRE_THROWS_AS(decodeMethodResponse("<html>oops</html>"),
                    XmlRpcException);
  REQUIRE_THROWS_AS(
      decodeMethodResponse("<methodResponse><params><param><value>"
                           "<i4>forty</i4></value></param></params>"
                           "</methodResponse>"),
      XmlRpcException);
  REQUIRE_THROWS_AS(
      decodeMethodResponse("<methodResponse><params><param><value>"
                           "<string>&bogus;</string></value></param>"
                           "</params></methodResponse>"),
      XmlRpcException);
}

TEST_CASE("A method call is encoded with escaped text", "[XmlRpc]") {
  auto message = XmlRpcValue::structure();
  message.set("samp.mtype", "ds9.set");
  auto params = XmlRpcValue::structure();
  params.set("cmd", "regions command {circle 1 2 3 # text={a<b & c>d}}");
  message.set("samp.params", params);

  string xml = encodeMethodCall("samp.hub.callAndWait",
                                {"key", "c1", message, "10"});
  REQUIRE_THAT(xml, ContainsSubstring(
                        "<methodName>samp.hub.callAndWait</methodName>"));
  REQUIRE_THAT(xml, ContainsSubstring("a&lt;b &amp; c&gt;d"));
  REQUIRE_THAT(xml, !ContainsSubstring("a<b"));

  // What the hub side decodes is what was sent
  auto call = decodeMethodCall(xml);
  REQUIRE(call.first == "samp.hub.callAndWait");
  REQUIRE(call.second.size() == 4);
  REQUIRE(call.second[2] == message);
  REQUIRE(call.second[2]["samp.params"]["cmd"].asString() ==
          "regions command {circle 1 2 3 # text={a<b & c>d}}");
}

TEST_CASE("Struct members keep their order and can be replaced",
          "[XmlRpc]") {
  auto value = XmlRpcValue::structure();
  value.set("z", "1").set("a", "2").set("m", "3");
  value.set("a", XmlRpcValue::fromInt(4));

  REQUIRE(value.memberNames() == vector<string>{"z", "a", "m"});
  REQUIRE(value["a"].asInt() == 4);
  REQUIRE_THROWS_AS(value.push("x"), XmlRpcException);
}
