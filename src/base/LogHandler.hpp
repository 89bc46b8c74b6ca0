#ifndef __DS9SAMP_LOG_HANDLER__
#define __DS9SAMP_LOG_HANDLER__

#include "Headers.hpp"

namespace ds9samp {
/**
 * @brief Configures easylogging++ so the drivers control where logs go.
 *
 * Two loggers are used: "stdout" carries every line meant for the user and
 * "default" carries internal diagnostics, which only reach a log file when a
 * log directory is configured.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging in `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool appendPid = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Keeps the default logger enabled but writing nowhere.
   */
  static void disableLogOutput(el::Configurations *defaultConf);

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   * @throws std::runtime_error when the directory or file cannot be created.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace ds9samp
#endif  // __DS9SAMP_LOG_HANDLER__
