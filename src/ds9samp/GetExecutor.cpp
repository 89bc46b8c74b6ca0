#include "GetExecutor.hpp"

#include "ErrorBoundary.hpp"

namespace ds9samp {
void GetExecutor::run(const string& command) {
  if (debug) {
    out << "# Command: " << command << endl;
  }
  auto reply = session->get(command, timeout);
  throwIfInterrupted();

  if (!reply || reply->empty()) {
    if (debug) {
      out << "# Command returned nothing." << endl;
    }
    return;
  }
  out << *reply << endl;
}
}  // namespace ds9samp
