#ifndef __DS9SAMP_GET_EXECUTOR__
#define __DS9SAMP_GET_EXECUTOR__

#include "Headers.hpp"
#include "HubConnector.hpp"

namespace ds9samp {
/**
 * @brief Sends one ds9.get and prints the reply.
 */
class GetExecutor {
 public:
  GetExecutor(Ds9Session* _session, int _timeout, bool _debug,
              std::ostream& _out)
      : session(_session), timeout(_timeout), debug(_debug), out(_out) {}

  /**
   * @brief Prints the reply followed by a newline, or nothing when DS9
   * returned nothing.
   * @throws SampException when the command fails.
   */
  void run(const string& command);

 protected:
  Ds9Session* session;
  const int timeout;
  const bool debug;
  std::ostream& out;
};
}  // namespace ds9samp

#endif  // __DS9SAMP_GET_EXECUTOR__
