#include "BatchExecutor.hpp"

#include "ErrorBoundary.hpp"

namespace ds9samp {
void BatchExecutor::run(const vector<string>& commands) {
  vector<string> failures;
  int sent = 0;
  for (size_t i = 0; i < commands.size(); ++i) {
    throwIfInterrupted();
    const string& command = commands[i];
    if (trim(command).empty()) {
      if (debug) {
        out << "# Skipping blank command " << (i + 1) << endl;
      }
      continue;
    }

    if (debug) {
      out << "# Command: " << command << endl;
    }
    ++sent;
    try {
      session->set(command, timeout);
    } catch (const SampException& se) {
      LOG(ERROR) << "Command '" << command << "' failed: " << se.what();
      failures.push_back("'" + command + "' (" + se.what() + ")");
    }
  }

  if (!failures.empty()) {
    throw BatchFailedException(
        to_string(failures.size()) + " of " + to_string(sent) +
            (sent == 1 ? " command failed: " : " commands failed: ") +
            join(failures, "; "),
        int(failures.size()), sent);
  }
}
}  // namespace ds9samp
