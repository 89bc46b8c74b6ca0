#include "ColorPolicy.hpp"
#include "Ds9SampDriver.hpp"
#include "ErrorBoundary.hpp"
#include "FakeSampHub.hpp"
#include "SampHubConnector.hpp"
#include "TestHeaders.hpp"

using namespace ds9samp;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("List the DS9 clients of a hub", "[SampHubConnector]") {
  FakeSampHub hub({{"c1", "ds9"}, {"c3", "topcat"}, {"c56", "DS9"}});
  SampHubConnector connector(hub.getLockFile());

  REQUIRE(connector.listClients() == vector<string>{"c1", "c56"});
  // Registered, asked and unregistered again
  REQUIRE(hub.getRegistered() == 0);
  auto methods = hub.getMethods();
  REQUIRE(methods.front() == "samp.hub.register");
  REQUIRE(methods.back() == "samp.hub.unregister");
}

TEST_CASE("Get and set through the hub", "[SampHubConnector]") {
  FakeSampHub hub({{"c1", "ds9"}}, {{"scale", "linear"}}, {"frame bogus"});
  SampHubConnector connector(hub.getLockFile());

  {
    auto session = connector.connect(nullopt);
    REQUIRE_THAT(session->describe(), ContainsSubstring("c1"));
    REQUIRE(hub.getRegistered() == 1);

    REQUIRE(session->get("scale", 7) == optional<string>("linear"));
    REQUIRE_FALSE(session->get("frame new", 7).has_value());
    REQUIRE_NOTHROW(session->set("frame delete all", 0));
    try {
      session->set("frame bogus", 7);
      FAIL("Expected a SampException");
    } catch (const SampException& se) {
      REQUIRE_THAT(se.what(), ContainsSubstring("Unknown command frame bogus"));
    }
  }
  REQUIRE(hub.getRegistered() == 0);

  auto messages = hub.getMessages();
  REQUIRE(messages.size() == 4);
  REQUIRE(messages[0] == vector<string>{"c1", "ds9.get", "scale", "7"});
  REQUIRE(messages[2] ==
          vector<string>{"c1", "ds9.set", "frame delete all", "0"});
}

TEST_CASE("Choosing the DS9 client", "[SampHubConnector]") {
  SECTION("several clients need a name") {
    FakeSampHub hub({{"c1", "ds9"}, {"c56", "ds9"}});
    SampHubConnector connector(hub.getLockFile());

    try {
      connector.connect(nullopt);
      FAIL("Expected a SampException");
    } catch (const SampException& se) {
      REQUIRE_THAT(se.what(), ContainsSubstring("there are 2: c1 c56"));
    }
    REQUIRE(hub.getRegistered() == 0);

    auto session = connector.connect(string("c56"));
    session->set("frame new", 10);
    REQUIRE(hub.getMessages()[0][0] == "c56");
  }

  SECTION("an unknown name") {
    FakeSampHub hub({{"c1", "ds9"}, {"c3", "topcat"}});
    SampHubConnector connector(hub.getLockFile());
    REQUIRE_THROWS_AS(connector.connect(string("c3")), SampException);
  }

  SECTION("no DS9 at all") {
    FakeSampHub hub({{"c3", "topcat"}});
    SampHubConnector connector(hub.getLockFile());
    try {
      connector.connect(nullopt);
      FAIL("Expected a SampException");
    } catch (const SampException& se) {
      REQUIRE_THAT(se.what(), ContainsSubstring("recognizes 'ds9.set'"));
    }
  }
}

TEST_CASE("A lockfile with the wrong secret", "[SampHubConnector]") {
  FakeSampHub hub({{"c1", "ds9"}});
  string pattern = GetTempDirectory() + string("ds9samp_bad_XXXXXXXX");
  string dir = string(mkdtemp(&pattern[0]));
  {
    std::ofstream out(dir + "/.samp");
    out << "samp.secret=wrong\n"
        << "samp.hub.xmlrpc.url=" << hub.getUrl() << "\n";
  }

  SampHubConnector connector(dir + "/.samp");
  REQUIRE_THROWS_AS(connector.listClients(), SampException);
  fs::remove_all(dir);
}

TEST_CASE("No hub running", "[SampHubConnector]") {
  string pattern = GetTempDirectory() + string("ds9samp_gone_XXXXXXXX");
  string dir = string(mkdtemp(&pattern[0]));
  {
    // Nothing listens on port 1
    std::ofstream out(dir + "/.samp");
    out << "samp.secret=s\n"
        << "samp.hub.xmlrpc.url=http://127.0.0.1:1/xmlrpc\n";
  }

  SampHubConnector connector(dir + "/.samp");
  REQUIRE_THROWS_AS(connector.listClients(), SampException);
  REQUIRE_THROWS_AS(SampHubConnector(dir + "/missing").listClients(),
                    SampException);
  fs::remove_all(dir);
}

TEST_CASE("A registration without a client id is withdrawn",
          "[SampHubConnector]") {
  FakeSampHub hub({{"c1", "ds9"}});
  hub.omitSelfId();
  SampHubConnector connector(hub.getLockFile());

  REQUIRE_THROWS_AS(connector.listClients(), SampException);
  REQUIRE(hub.getRegistered() == 0);
  REQUIRE(hub.getMethods() ==
          vector<string>{"samp.hub.register", "samp.hub.unregister"});
}

TEST_CASE("Control-c aborts a call that DS9 never answers",
          "[SampHubConnector]") {
  ::setenv(NO_COLOR_ENV.c_str(), "1", 1);
  FakeSampHub hub({{"c1", "ds9"}}, {}, {}, {"frame new"});
  SampHubConnector connector(hub.getLockFile());
  std::ostringstream out;
  std::ostringstream err;

  DriverSettings settings;
  settings.command = "frame new";
  // Wait forever: only the interrupt can end the call
  settings.timeout = 0;

  installInterruptHandler("get");
  std::thread interrupter([]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    ::kill(::getpid(), SIGINT);
  });
  auto start = std::chrono::steady_clock::now();
  int code = runWithErrorBoundary(
      "get", [&]() { runGet(settings, &connector, out); }, err);
  auto elapsed = std::chrono::steady_clock::now() - start;
  interrupter.join();
  clearInterrupt();
  ::signal(SIGINT, SIG_DFL);
  ::unsetenv(NO_COLOR_ENV.c_str());

  REQUIRE(code == 1);
  REQUIRE(err.str() == "# ds9samp_get: Keyboard interrupt (control c)\n");
  REQUIRE(out.str().empty());
  // The hub stalls for 10 seconds
  REQUIRE(elapsed < std::chrono::seconds(5));
  REQUIRE(hub.getRegistered() == 0);
  REQUIRE(hub.getMethods().back() == "samp.hub.unregister");
}
