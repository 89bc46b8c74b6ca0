#ifndef __DS9SAMP_XML_RPC_CLIENT__
#define __DS9SAMP_XML_RPC_CLIENT__

#include "Headers.hpp"
#include "XmlRpc.hpp"

namespace httplib {
class Client;
}

namespace ds9samp {
/**
 * @brief Posts XML-RPC method calls to one endpoint over HTTP.
 */
class XmlRpcClient {
 public:
  /**
   * @param url Endpoint such as http://127.0.0.1:21012/xmlrpc
   * @throws SampException when the url is not an http url.
   */
  explicit XmlRpcClient(const string& url);

  virtual ~XmlRpcClient();

  /**
   * @brief Calls `method` and waits for the response.
   * @param timeout Seconds to wait for the response, 0 waits forever.
   * @throws SampException on transport errors and faults.
   */
  XmlRpcValue call(const string& method, const vector<XmlRpcValue>& params,
                   int timeout = DEFAULT_TIMEOUT_SECONDS);

  const string& getUrl() const { return url; }

  /**
   * @brief HTTP read timeout for a call with `timeout`: the timeout plus a
   * margin, clamped to what httplib can represent. 0 gives the clamp.
   */
  static time_t readTimeoutFor(int timeout);

 protected:
  string url;
  string path;
  unique_ptr<httplib::Client> httpClient;
};
}  // namespace ds9samp

#endif  // __DS9SAMP_XML_RPC_CLIENT__
