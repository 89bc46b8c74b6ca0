#include "ArgumentParser.hpp"

#include "ErrorBoundary.hpp"

namespace ds9samp {
ArgumentParser::ArgumentParser(const string& _programName,
                               const string& description, bool _takesCommand)
    : programName(_programName),
      takesCommand(_takesCommand),
      options(_programName, description) {
  options.positional_help(takesCommand ? "command" : "");
  options.custom_help("[options]");

  options.add_options()             //
      ("h,help", "Print help")      //
      ("version", "Print version")  //
      ;
  if (takesCommand) {
    options.add_options()  //
        ("n,name", "Name of DS9 client in the SAMP hub",
         cxxopts::value<string>(), "NAME")  //
        ("t,timeout", "Timeout in seconds (integer, use 0 to disable)",
         cxxopts::value<int>(), "SECONDS")                   //
        ("debug", "Provide debugging output")                //
        ("v,verbose", "Enable verbose logging",              //
         cxxopts::value<int>(), "LEVEL")                     //
        ("cfgfile", "Location of the config file",           //
         cxxopts::value<string>(), "PATH")                   //
        ("command", "DS9 command", cxxopts::value<vector<string>>())  //
        ;
    options.parse_positional({"command"});
  }
}

string ArgumentParser::usage() const {
  return "usage: " + programName +
         (takesCommand ? " [options] command" : " [options]");
}

string ArgumentParser::help() const { return options.help({}); }

ParseAction ArgumentParser::parse(int argc, const char* const* argv) {
  invocation = Invocation();
  try {
    auto result = options.parse(argc, argv);

    if (result.count("version")) {
      return ParseAction::SHOW_VERSION;
    }
    if (result.count("help")) {
      return ParseAction::SHOW_HELP;
    }
    if (!result.unmatched().empty()) {
      throw UsageException(
          "unrecognized arguments: " + join(result.unmatched(), " "), usage());
    }
    if (!takesCommand) {
      return ParseAction::RUN;
    }

    if (!result.count("command")) {
      throw UsageException("the following arguments are required: command",
                           usage());
    }
    auto commands = result["command"].as<vector<string>>();
    if (commands.size() > 1) {
      commands.erase(commands.begin());
      throw UsageException("unrecognized arguments: " + join(commands, " "),
                           usage());
    }
    invocation.command = commands[0];

    if (result.count("name")) {
      invocation.client = result["name"].as<string>();
    }
    if (result.count("timeout")) {
      int timeout = result["timeout"].as<int>();
      if (timeout < 0) {
        throw UsageException("argument -t/--timeout: must be 0 or positive",
                             usage());
      }
      if (timeout > MAX_TIMEOUT_SECONDS) {
        throw UsageException("argument -t/--timeout: must be at most " +
                                 to_string(MAX_TIMEOUT_SECONDS),
                             usage());
      }
      invocation.timeout = timeout;
    }
    invocation.debug = result.count("debug") > 0;
    if (result.count("verbose")) {
      invocation.verbose = result["verbose"].as<int>();
    }
    if (result.count("cfgfile")) {
      invocation.cfgfile = result["cfgfile"].as<string>();
    }
  } catch (const cxxopts::exceptions::exception& oe) {
    throw UsageException(oe.what(), usage());
  }
  return ParseAction::RUN;
}
}  // namespace ds9samp
