#include "FakeHubConnector.hpp"
#include "GetExecutor.hpp"
#include "TestHeaders.hpp"

using namespace ds9samp;

namespace {
unique_ptr<Ds9Session> makeSession(shared_ptr<FakeSessionLog> log) {
  return unique_ptr<Ds9Session>(new FakeDs9Session(
      log, {{"scale", "linear"}, {"frame all", "1 3"}, {"blank", ""}},
      {"bogus"}));
}
}  // namespace

TEST_CASE("A reply is printed exactly", "[GetExecutor]") {
  auto log = make_shared<FakeSessionLog>();
  auto session = makeSession(log);
  std::ostringstream out;

  GetExecutor executor(session.get(), 10, false, out);
  executor.run("scale");

  REQUIRE(out.str() == "linear\n");
  REQUIRE(log->gets.size() == 1);
  REQUIRE(log->gets[0] == make_pair(string("scale"), 10));
}

TEST_CASE("The timeout is passed to the session", "[GetExecutor]") {
  auto log = make_shared<FakeSessionLog>();
  auto session = makeSession(log);
  std::ostringstream out;

  GetExecutor executor(session.get(), 0, false, out);
  executor.run("frame all");

  REQUIRE(out.str() == "1 3\n");
  REQUIRE(log->gets[0].second == 0);
}

TEST_CASE("No reply prints nothing", "[GetExecutor]") {
  auto log = make_shared<FakeSessionLog>();
  auto session = makeSession(log);
  std::ostringstream out;

  SECTION("absent reply") {
    GetExecutor executor(session.get(), 10, false, out);
    executor.run("frame new");
    REQUIRE(out.str().empty());
  }

  SECTION("empty reply") {
    GetExecutor executor(session.get(), 10, false, out);
    executor.run("blank");
    REQUIRE(out.str().empty());
  }

  SECTION("debug only notes the absence") {
    GetExecutor executor(session.get(), 10, true, out);
    executor.run("frame new");
    REQUIRE(out.str() ==
            "# Command: frame new\n"
            "# Command returned nothing.\n");
  }
}

TEST_CASE("A failing get propagates", "[GetExecutor]") {
  auto log = make_shared<FakeSessionLog>();
  auto session = makeSession(log);
  std::ostringstream out;

  GetExecutor executor(session.get(), 10, false, out);
  REQUIRE_THROWS_AS(executor.run("bogus"), SampException);
  REQUIRE(out.str().empty());
}
