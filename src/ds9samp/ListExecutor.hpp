#ifndef __DS9SAMP_LIST_EXECUTOR__
#define __DS9SAMP_LIST_EXECUTOR__

#include "Headers.hpp"
#include "HubConnector.hpp"

namespace ds9samp {
/**
 * @brief Raised when the hub has no DS9 client registered.
 */
class NoClientsException : public std::runtime_error {
 public:
  NoClientsException()
      : std::runtime_error(
            "There are no DS9 clients connected to the SAMP hub.") {}
};

/**
 * @brief Prints the DS9 clients registered with the hub.
 */
class ListExecutor {
 public:
  ListExecutor(HubConnector* _hub, std::ostream& _out)
      : hub(_hub), out(_out) {}

  /**
   * @throws NoClientsException when there is no DS9 client.
   */
  void run();

  /**
   * @brief "There is one DS9 client: c1" or "There are 2 DS9 clients: c1 c56"
   */
  static string summarize(const vector<string>& clients);

 protected:
  HubConnector* hub;
  std::ostream& out;
};
}  // namespace ds9samp

#endif  // __DS9SAMP_LIST_EXECUTOR__
