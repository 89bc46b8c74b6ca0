#ifndef __DS9SAMP_DRIVER_CONFIG__
#define __DS9SAMP_DRIVER_CONFIG__

#include "ArgumentParser.hpp"
#include "Headers.hpp"

namespace ds9samp {
/**
 * @brief Settings a get/set run uses once the command line and the config
 * file have been merged. The command line wins.
 */
struct DriverSettings {
  string command;
  optional<string> client;
  int timeout = DEFAULT_TIMEOUT_SECONDS;
  bool debug = false;
  int verbose = 0;
  /** @brief Directory for a per-run log file, empty to keep no log. */
  string logdir;
};

/**
 * @brief Optional ini file with defaults for the drivers.
 *
 * [Defaults]
 * name = c1
 * timeout = 30
 * [Debug]
 * verbose = 1
 * logdir = /tmp/ds9samp
 */
class DriverConfig {
 public:
  /** @brief <config home>/ds9samp/ds9samp.ini */
  static string defaultPath();

  /**
   * @brief Loads `path`. A missing file is fine unless `required` is set.
   * @throws std::runtime_error for a required file that is missing, a file
   * that cannot be parsed, or a malformed value.
   */
  static DriverConfig load(const string& path, bool required);

  /**
   * @brief Merges the invocation with the loaded defaults.
   */
  DriverSettings resolve(const Invocation& invocation) const;

  optional<string> defaultClient;
  optional<int> defaultTimeout;
  optional<int> verbose;
  optional<string> logdir;
};
}  // namespace ds9samp

#endif  // __DS9SAMP_DRIVER_CONFIG__
