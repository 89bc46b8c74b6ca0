#ifndef __DS9SAMP_ARGUMENT_PARSER__
#define __DS9SAMP_ARGUMENT_PARSER__

#include <cxxopts.hpp>

#include "Headers.hpp"

namespace ds9samp {
/**
 * @brief Everything a get/set run needs from the command line.
 *
 * Optional members are unset when the option was not given so that
 * configuration defaults can still apply.
 */
struct Invocation {
  string command;
  optional<string> client;
  optional<int> timeout;
  bool debug = false;
  optional<int> verbose;
  optional<string> cfgfile;
};

enum class ParseAction { RUN, SHOW_HELP, SHOW_VERSION };

/**
 * @brief cxxopts front end shared by the three drivers.
 *
 * get/set take a positional command plus the connection options; list
 * (takesCommand == false) only knows --help and --version.
 */
class ArgumentParser {
 public:
  ArgumentParser(const string& programName, const string& description,
                 bool takesCommand);

  /**
   * @brief Parses argv.
   * @return What the driver should do next. --version and --help win over
   * everything else.
   * @throws UsageException for unknown options, malformed values, a missing
   * or extra positional argument, or a negative timeout.
   */
  ParseAction parse(int argc, const char* const* argv);

  /** @brief Valid after parse() returned RUN. */
  const Invocation& getInvocation() const { return invocation; }

  string usage() const;
  string help() const;

 protected:
  string programName;
  bool takesCommand;
  cxxopts::Options options;
  Invocation invocation;
};
}  // namespace ds9samp

#endif  // __DS9SAMP_ARGUMENT_PARSER__
