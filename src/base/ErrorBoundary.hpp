#ifndef __DS9SAMP_ERROR_BOUNDARY__
#define __DS9SAMP_ERROR_BOUNDARY__

#include "Headers.hpp"

namespace ds9samp {
/**
 * @brief Thrown for malformed command-line arguments.
 *
 * Carries the usage line so the boundary can print it the way argument
 * parsers conventionally do.
 */
class UsageException : public std::exception {
 public:
  UsageException(const string& msg, const string& _usage)
      : message(msg), usage(_usage) {}
  const char* what() const noexcept override { return message.c_str(); }
  const string& getUsage() const { return usage; }

 private:
  std::string message;
  std::string usage;
};

/**
 * @brief Thrown at the next safe point after the user pressed control-c.
 */
class InterruptedException : public std::exception {
 public:
  const char* what() const noexcept override { return "Keyboard interrupt"; }
};

/** @brief Exit code for runtime failures and interrupts. */
const int EXIT_FAILURE_CODE = 1;
/** @brief Exit code for usage errors, as argument parsers conventionally use.
 */
const int EXIT_USAGE_CODE = 2;

/** @brief Builds "# ds9samp_<name>: ERROR <message>\n" with the prefix colored.
 */
string formatErrorMessage(const string& name, const string& message);

/** @brief Builds the message written when the user interrupts a driver. */
string formatInterruptMessage(const string& name);

/**
 * @brief Runs `operation` and turns whatever it throws into an exit code.
 *
 * This is the only place where a failure becomes a process exit status: main
 * returns the value directly. Diagnostics go to `err`.
 * @return 0 on success, 1 on failure or interrupt, 2 on a usage error.
 */
int runWithErrorBoundary(const string& name,
                         const std::function<void()>& operation,
                         std::ostream& err = std::cerr);

/**
 * @brief Installs the SIGINT handler for the driver called `name`.
 *
 * The first interrupt sets a flag that throwIfInterrupted() turns into an
 * InterruptedException, so the hub session is still released while
 * unwinding. The handler is installed without SA_RESTART, so a blocking read
 * of stdin returns early, and it shuts down the socket registered with
 * setInterruptibleSocket() so a pending hub call fails right away. A second
 * interrupt prints the interrupt message and exits immediately.
 */
void installInterruptHandler(const string& name);

/**
 * @brief Registers the socket of the hub call in progress, -1 for none.
 */
void setInterruptibleSocket(int fd);

/** @brief True once SIGINT has been received. */
bool interruptRequested();

/** @throws InterruptedException if SIGINT has been received. */
void throwIfInterrupted();

/** @brief Forgets any pending interrupt. */
void clearInterrupt();
}  // namespace ds9samp

#endif  // __DS9SAMP_ERROR_BOUNDARY__
