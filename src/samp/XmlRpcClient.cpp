#include "XmlRpcClient.hpp"

#include "ErrorBoundary.hpp"
#include "HubConnector.hpp"
#include "httplib.h"

namespace ds9samp {
namespace {
// Slack on top of the call timeout so the hub reports the timeout, not us
const int HTTP_TIMEOUT_MARGIN_SECONDS = 5;
// httplib waits in int milliseconds, this stays below INT_MAX once converted.
// Also used when the caller asked to wait forever.
const time_t MAX_READ_TIMEOUT_SECONDS = 2000000;
const time_t CONNECT_TIMEOUT_SECONDS = 5;
}  // namespace

XmlRpcClient::XmlRpcClient(const string& _url) : url(_url) {
  auto schemeEnd = url.find("://");
  if (schemeEnd == string::npos || url.substr(0, schemeEnd) != "http") {
    throw SampException("Unsupported hub url: " + url);
  }
  auto pathStart = url.find('/', schemeEnd + 3);
  string schemeHostPort = url.substr(0, pathStart);
  path = pathStart == string::npos ? "/" : url.substr(pathStart);
  httpClient.reset(new httplib::Client(schemeHostPort));
  httpClient->set_connection_timeout(CONNECT_TIMEOUT_SECONDS, 0);
  httpClient->set_socket_options(
      [](auto sock) { setInterruptibleSocket(int(sock)); });
}

time_t XmlRpcClient::readTimeoutFor(int timeout) {
  if (timeout <= 0) {
    return MAX_READ_TIMEOUT_SECONDS;
  }
  return std::min(time_t(timeout) + HTTP_TIMEOUT_MARGIN_SECONDS,
                  MAX_READ_TIMEOUT_SECONDS);
}

XmlRpcClient::~XmlRpcClient() {}

XmlRpcValue XmlRpcClient::call(const string& method,
                               const vector<XmlRpcValue>& params,
                               int timeout) {
  httpClient->set_read_timeout(readTimeoutFor(timeout), 0);

  string body = encodeMethodCall(method, params);
  VLOG(2) << "XML-RPC request to " << url << ": " << body;
  auto res = httpClient->Post(path, body, "text/xml");
  setInterruptibleSocket(-1);
  if (!res) {
    // The interrupt handler shut the socket down
    throwIfInterrupted();
    throw SampException("Unable to call " + method + " on the SAMP hub at " +
                        url + ": " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    throw SampException("The SAMP hub answered " + method + " with HTTP " +
                        to_string(res->status));
  }
  VLOG(2) << "XML-RPC response: " << res->body;

  try {
    return decodeMethodResponse(res->body);
  } catch (const XmlRpcFault& fault) {
    throw SampException(method + " failed: " + fault.what());
  } catch (const XmlRpcException& xre) {
    throw SampException("Invalid response to " + method + ": " + xre.what());
  }
}
}  // namespace ds9samp
