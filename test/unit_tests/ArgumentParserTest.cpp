#include "ArgumentParser.hpp"
#include "ErrorBoundary.hpp"
#include "TestHeaders.hpp"

using namespace ds9samp;
using Catch::Matchers::ContainsSubstring;

namespace {
ParseAction parseArgs(ArgumentParser& parser, vector<const char*> args) {
  args.insert(args.begin(), "ds9samp_test");
  return parser.parse(int(args.size()), args.data());
}
}  // namespace

TEST_CASE("Command and defaults", "[ArgumentParser]") {
  ArgumentParser parser("ds9samp_get", "", true);

  REQUIRE(parseArgs(parser, {"scale"}) == ParseAction::RUN);
  const auto& invocation = parser.getInvocation();
  REQUIRE(invocation.command == "scale");
  REQUIRE_FALSE(invocation.client.has_value());
  REQUIRE_FALSE(invocation.timeout.has_value());
  REQUIRE_FALSE(invocation.debug);
  REQUIRE_FALSE(invocation.verbose.has_value());
  REQUIRE_FALSE(invocation.cfgfile.has_value());
}

TEST_CASE("Short and long options", "[ArgumentParser]") {
  ArgumentParser parser("ds9samp_set", "", true);

  SECTION("short") {
    REQUIRE(parseArgs(parser, {"-n", "c56", "-t", "0", "frame new"}) ==
            ParseAction::RUN);
    REQUIRE(parser.getInvocation().client == optional<string>("c56"));
    REQUIRE(parser.getInvocation().timeout == optional<int>(0));
    REQUIRE(parser.getInvocation().command == "frame new");
  }

  SECTION("long") {
    REQUIRE(parseArgs(parser, {"--name", "c1", "--timeout", "30", "--debug",
                               "--verbose", "2", "--cfgfile", "/tmp/x.ini",
                               "@commands"}) == ParseAction::RUN);
    const auto& invocation = parser.getInvocation();
    REQUIRE(invocation.client == optional<string>("c1"));
    REQUIRE(invocation.timeout == optional<int>(30));
    REQUIRE(invocation.debug);
    REQUIRE(invocation.verbose == optional<int>(2));
    REQUIRE(invocation.cfgfile == optional<string>("/tmp/x.ini"));
    REQUIRE(invocation.command == "@commands");
  }
}

TEST_CASE("An escaped newline reaches the command untouched",
          "[ArgumentParser]") {
  ArgumentParser parser("ds9samp_set", "", true);

  REQUIRE(parseArgs(parser, {"frame delete all\\nframe new"}) ==
          ParseAction::RUN);
  REQUIRE(parser.getInvocation().command == "frame delete all\\nframe new");
}

TEST_CASE("Version and help short-circuit", "[ArgumentParser]") {
  ArgumentParser parser("ds9samp_get", "Send a single command", true);

  REQUIRE(parseArgs(parser, {"--version"}) == ParseAction::SHOW_VERSION);
  // --version wins over a command
  REQUIRE(parseArgs(parser, {"--version", "scale"}) ==
          ParseAction::SHOW_VERSION);
  REQUIRE(parseArgs(parser, {"-h"}) == ParseAction::SHOW_HELP);
  REQUIRE_THAT(parser.help(), ContainsSubstring("Send a single command"));
  REQUIRE_THAT(parser.help(), ContainsSubstring("--timeout"));
}

TEST_CASE("Usage errors", "[ArgumentParser]") {
  ArgumentParser parser("ds9samp_get", "", true);

  SECTION("missing command") {
    REQUIRE_THROWS_AS(parseArgs(parser, {}), UsageException);
    try {
      parseArgs(parser, {"-n", "c1"});
      FAIL("Expected a usage error");
    } catch (const UsageException& ue) {
      REQUIRE_THAT(ue.what(), ContainsSubstring("command"));
      REQUIRE(ue.getUsage() == "usage: ds9samp_get [options] command");
    }
  }

  SECTION("timeout is not an integer") {
    REQUIRE_THROWS_AS(parseArgs(parser, {"-t", "soon", "scale"}),
                      UsageException);
  }

  SECTION("negative timeout") {
    REQUIRE_THROWS_AS(parseArgs(parser, {"--timeout=-1", "scale"}),
                      UsageException);
  }

  SECTION("timeout above the maximum") {
    REQUIRE_THROWS_AS(parseArgs(parser, {"-t", "604801", "scale"}),
                      UsageException);
    REQUIRE_THROWS_AS(parseArgs(parser, {"-t", "2147483647", "scale"}),
                      UsageException);
    REQUIRE_THROWS_AS(parseArgs(parser, {"-t", "99999999999", "scale"}),
                      UsageException);
  }

  SECTION("unknown option") {
    REQUIRE_THROWS_AS(parseArgs(parser, {"--bogus", "scale"}),
                      UsageException);
  }

  SECTION("two commands") {
    REQUIRE_THROWS_AS(parseArgs(parser, {"scale", "cmap"}), UsageException);
  }
}

TEST_CASE("The largest timeout is accepted", "[ArgumentParser]") {
  ArgumentParser parser("ds9samp_set", "", true);

  REQUIRE(parseArgs(parser, {"-t", "604800", "frame new"}) ==
          ParseAction::RUN);
  REQUIRE(parser.getInvocation().timeout == optional<int>(MAX_TIMEOUT_SECONDS));
}

TEST_CASE("list takes no command", "[ArgumentParser]") {
  ArgumentParser parser("ds9samp_list", "", false);

  REQUIRE(parseArgs(parser, {}) == ParseAction::RUN);
  REQUIRE(parseArgs(parser, {"--version"}) == ParseAction::SHOW_VERSION);
  REQUIRE(parser.usage() == "usage: ds9samp_list [options]");
  REQUIRE_THROWS_AS(parseArgs(parser, {"scale"}), UsageException);
  REQUIRE_THROWS_AS(parseArgs(parser, {"--name", "c1"}), UsageException);
}
