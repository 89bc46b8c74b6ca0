#ifndef __DS9SAMP_SAMP_HUB_CONNECTOR__
#define __DS9SAMP_SAMP_HUB_CONNECTOR__

#include "Headers.hpp"
#include "HubConnector.hpp"
#include "SampLockFile.hpp"
#include "XmlRpcClient.hpp"

namespace ds9samp {
const string DS9_GET_MTYPE = "ds9.get";
const string DS9_SET_MTYPE = "ds9.set";
/** @brief samp.name that DS9 declares in its metadata. */
const string DS9_CLIENT_NAME = "ds9";

/**
 * @brief A registration with the hub through the SAMP Standard Profile.
 *
 * The constructor registers and declares metadata, the destructor
 * unregisters. The client is not callable: it only uses synchronous
 * callAndWait, which needs no callback server.
 */
class SampHubConnection {
 public:
  /**
   * @throws SampException when the hub refuses the registration.
   */
  explicit SampHubConnection(const SampLockInfo& lockInfo);

  virtual ~SampHubConnection();

  /**
   * @brief Calls a hub method, prepending the private key to `params`.
   */
  XmlRpcValue call(const string& method, vector<XmlRpcValue> params,
                   int timeout = DEFAULT_TIMEOUT_SECONDS);

  /**
   * @brief Ids of registered clients whose samp.name is "ds9", in hub order.
   */
  vector<string> findDs9Clients();

  /**
   * @brief Sends `{cmd: command}` with `mtype` to `recipientId` and waits.
   * @return The samp.result struct of a successful response.
   * @throws SampException when the hub times out or DS9 reports an error.
   */
  XmlRpcValue callAndWait(const string& recipientId, const string& mtype,
                          const string& command, int timeout);

  const string& getSelfId() const { return selfId; }
  const string& getHubUrl() const { return rpc->getUrl(); }

 protected:
  void declareMetadata();
  /** @brief Best effort, failures are only logged. */
  void unregister();

  unique_ptr<XmlRpcClient> rpc;
  string privateKey;
  string selfId;
};

/**
 * @brief Ds9Session that talks to one DS9 client through a hub connection.
 */
class SampDs9Session : public Ds9Session {
 public:
  SampDs9Session(unique_ptr<SampHubConnection> _connection,
                 const string& _clientId)
      : connection(std::move(_connection)), clientId(_clientId) {}

  optional<string> get(const string& command, int timeout) override;
  void set(const string& command, int timeout) override;
  string describe() const override;

 protected:
  unique_ptr<SampHubConnection> connection;
  string clientId;
};

/**
 * @brief HubConnector for a hub found through its lockfile.
 */
class SampHubConnector : public HubConnector {
 public:
  /** @brief Uses SAMP_HUB or $HOME/.samp, resolved on each call. */
  SampHubConnector() {}
  explicit SampHubConnector(const string& _lockFilePath)
      : lockFilePath(_lockFilePath) {}

  unique_ptr<Ds9Session> connect(const optional<string>& clientName) override;
  vector<string> listClients() override;

 protected:
  unique_ptr<SampHubConnection> openConnection();

  optional<string> lockFilePath;
};
}  // namespace ds9samp

#endif  // __DS9SAMP_SAMP_HUB_CONNECTOR__
