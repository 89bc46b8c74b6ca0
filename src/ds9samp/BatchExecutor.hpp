#ifndef __DS9SAMP_BATCH_EXECUTOR__
#define __DS9SAMP_BATCH_EXECUTOR__

#include "Headers.hpp"
#include "HubConnector.hpp"

namespace ds9samp {
/**
 * @brief Raised after a batch in which at least one command failed.
 */
class BatchFailedException : public std::runtime_error {
 public:
  BatchFailedException(const string& msg, int _failed, int _sent)
      : std::runtime_error(msg), failed(_failed), sent(_sent) {}
  int getFailed() const { return failed; }
  int getSent() const { return sent; }

 private:
  int failed;
  int sent;
};

/**
 * @brief Sends a batch of commands to DS9, one ds9.set per command.
 *
 * A failing command does not stop the batch: every non-blank command is
 * sent, and if any of them failed a BatchFailedException summarizing the
 * failures is thrown once the batch is done. An interrupt stops the batch
 * right away.
 */
class BatchExecutor {
 public:
  /**
   * @param timeout Seconds allowed for each command, 0 waits forever.
   * @param out Stream receiving the "# ..." debug traces.
   */
  BatchExecutor(Ds9Session* _session, int _timeout, bool _debug,
                std::ostream& _out)
      : session(_session), timeout(_timeout), debug(_debug), out(_out) {}

  /**
   * @throws BatchFailedException when one or more commands failed.
   * @throws InterruptedException when the user pressed control-c.
   */
  void run(const vector<string>& commands);

 protected:
  Ds9Session* session;
  const int timeout;
  const bool debug;
  std::ostream& out;
};
}  // namespace ds9samp

#endif  // __DS9SAMP_BATCH_EXECUTOR__
