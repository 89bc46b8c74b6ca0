#ifndef __DS9SAMP_DRIVER__
#define __DS9SAMP_DRIVER__

#include "DriverConfig.hpp"
#include "Headers.hpp"
#include "HubConnector.hpp"

namespace ds9samp {
enum class DriverKind { GET, SET, LIST };

/** @brief "get", "set" or "list", as used in ds9samp_<name>. */
string driverName(DriverKind kind);

/** @brief Help text shown above the option list. */
string driverDescription(DriverKind kind);

/**
 * @brief Connects, sends `settings.command` as a ds9.get and prints the reply.
 */
void runGet(const DriverSettings& settings, HubConnector* hub,
            std::ostream& out);

/**
 * @brief Reads the commands named by `settings.command`, connects and sends
 * them as a batch of ds9.set calls.
 * @param in Read when the command is "@-".
 */
void runSet(const DriverSettings& settings, HubConnector* hub,
            std::istream& in, std::ostream& out);

/** @brief Prints the DS9 clients known to the hub. */
void runList(HubConnector* hub, std::ostream& out);

/**
 * @brief Complete driver: logging, interrupt handling, argument parsing and
 * the error boundary around the run.
 * @return The process exit code.
 */
int driverMain(DriverKind kind, int argc, char** argv);
}  // namespace ds9samp

#endif  // __DS9SAMP_DRIVER__
