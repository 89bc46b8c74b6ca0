#include "ErrorBoundary.hpp"

#include "ColorPolicy.hpp"

namespace ds9samp {
namespace {
volatile sig_atomic_t interruptCount = 0;
volatile sig_atomic_t interruptibleSocket = -1;
// Precomputed, the handler may only make async-signal-safe calls
string forcedExitMessage;

void InterruptSignalHandler(int signum) {
  interruptCount = interruptCount + 1;
  int fd = interruptibleSocket;
  if (fd >= 0) {
    // Wakes up the blocked recv() of the call in progress
    ::shutdown(fd, SHUT_RDWR);
  }
  if (interruptCount > 1) {
    // Nothing useful can be done if this write fails, we exit either way
    auto written =
        ::write(STDERR_FILENO, forcedExitMessage.data(), forcedExitMessage.size());
    (void)written;
    ::_exit(EXIT_FAILURE_CODE);
  }
}

string driverPrefix(const string& name) {
  return decorate("# ds9samp_" + name + ":");
}
}  // namespace

string formatErrorMessage(const string& name, const string& message) {
  return driverPrefix(name) + " ERROR " + message + "\n";
}

string formatInterruptMessage(const string& name) {
  return driverPrefix(name) + " Keyboard interrupt (control c)\n";
}

int runWithErrorBoundary(const string& name,
                         const std::function<void()>& operation,
                         std::ostream& err) {
  try {
    operation();
    return 0;
  } catch (const UsageException& ue) {
    err << ue.getUsage() << "\n"
        << "ds9samp_" << name << ": error: " << ue.what() << "\n";
    return EXIT_USAGE_CODE;
  } catch (const InterruptedException& ie) {
    LOG(INFO) << "Interrupted by user";
    err << formatInterruptMessage(name);
    return EXIT_FAILURE_CODE;
  } catch (const std::exception& e) {
    LOG(ERROR) << "ds9samp_" << name << " failed: " << e.what();
    err << formatErrorMessage(name, e.what());
    return EXIT_FAILURE_CODE;
  }
}

void installInterruptHandler(const string& name) {
  forcedExitMessage = formatInterruptMessage(name);
  interruptCount = 0;

  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = InterruptSignalHandler;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: blocking reads must return so the flag gets checked
  action.sa_flags = 0;
  if (::sigaction(SIGINT, &action, NULL) == -1) {
    throw std::runtime_error(string("Unable to install the SIGINT handler: ") +
                             strerror(errno));
  }
}

void setInterruptibleSocket(int fd) { interruptibleSocket = fd; }

bool interruptRequested() { return interruptCount > 0; }

void throwIfInterrupted() {
  if (interruptRequested()) {
    throw InterruptedException();
  }
}

void clearInterrupt() { interruptCount = 0; }
}  // namespace ds9samp
