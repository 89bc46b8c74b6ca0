#ifndef __DS9SAMP_HUB_CONNECTOR__
#define __DS9SAMP_HUB_CONNECTOR__

#include "Headers.hpp"

namespace ds9samp {
/**
 * @brief Raised when the hub cannot be reached or a DS9 command fails.
 */
class SampException : public std::runtime_error {
 public:
  explicit SampException(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A connection to one DS9 client through the hub.
 *
 * The connection is released when the object is destroyed, so holding it in a
 * unique_ptr releases it on every exit path.
 */
class Ds9Session {
 public:
  virtual ~Ds9Session() {}

  /**
   * @brief Sends `command` and waits up to `timeout` seconds for the reply.
   * @param timeout Seconds to wait, 0 waits forever.
   * @return The reply, or nullopt when DS9 returned nothing.
   * @throws SampException when the command is rejected or times out.
   */
  virtual optional<string> get(const string& command, int timeout) = 0;

  /**
   * @brief Sends `command` without expecting a reply.
   * @throws SampException when the command is rejected or times out.
   */
  virtual void set(const string& command, int timeout) = 0;

  /** @brief Human readable description used in debug traces. */
  virtual string describe() const = 0;
};

/**
 * @brief Entry point to the hub: opens sessions and lists DS9 clients.
 */
class HubConnector {
 public:
  virtual ~HubConnector() {}

  /**
   * @brief Connects to the DS9 client called `clientName`, or to the only DS9
   * client when no name is given.
   * @throws SampException when there is no hub or no matching client.
   */
  virtual unique_ptr<Ds9Session> connect(const optional<string>& clientName) = 0;

  /**
   * @brief Returns the DS9 client ids registered with the hub, in hub order.
   */
  virtual vector<string> listClients() = 0;
};
}  // namespace ds9samp

#endif  // __DS9SAMP_HUB_CONNECTOR__
