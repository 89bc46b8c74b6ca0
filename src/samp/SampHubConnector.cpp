#include "SampHubConnector.hpp"

namespace ds9samp {
namespace {
// Hub housekeeping calls should be quick
const int HUB_CALL_TIMEOUT_SECONDS = 10;

const string& requireString(const XmlRpcValue& value, const string& what) {
  if (value.getType() != XmlRpcValue::Type::STRING) {
    throw SampException("The SAMP hub sent an invalid " + what);
  }
  return value.asString();
}

string readRegistration(const XmlRpcValue& registration, const string& key,
                        const string& what) {
  try {
    return requireString(registration[key], what);
  } catch (const XmlRpcException& xre) {
    throw SampException(string("Invalid registration response: ") +
                        xre.what());
  }
}

string describeClients(const vector<string>& clients) {
  return clients.empty() ? "none" : join(clients, " ");
}
}  // namespace

SampHubConnection::SampHubConnection(const SampLockInfo& lockInfo)
    : rpc(new XmlRpcClient(lockInfo.xmlrpcUrl)) {
  auto registration = rpc->call("samp.hub.register", {lockInfo.secret},
                                HUB_CALL_TIMEOUT_SECONDS);
  privateKey = readRegistration(registration, "samp.private-key",
                                "registration private key");
  try {
    selfId = readRegistration(registration, "samp.self-id", "client id");
    LOG(INFO) << "Registered with the SAMP hub at " << lockInfo.xmlrpcUrl
              << " as " << selfId;
    declareMetadata();
  } catch (const std::exception&) {
    // The hub already holds the registration, the destructor will not run
    unregister();
    throw;
  }
}

SampHubConnection::~SampHubConnection() { unregister(); }

void SampHubConnection::declareMetadata() {
  auto metadata = XmlRpcValue::structure();
  metadata.set("samp.name", "ds9samp");
  metadata.set("samp.description.text",
               "Command-line access to DS9 through SAMP");
  metadata.set("ds9samp.version", DS9SAMP_VERSION);
  try {
    call("samp.hub.declareMetadata", {metadata}, HUB_CALL_TIMEOUT_SECONDS);
  } catch (const SampException& se) {
    // Only other clients look at our metadata
    LOG(WARNING) << "Unable to declare metadata: " << se.what();
  }
}

void SampHubConnection::unregister() {
  try {
    call("samp.hub.unregister", {}, HUB_CALL_TIMEOUT_SECONDS);
    LOG(INFO) << "Unregistered " << selfId << " from the SAMP hub";
  } catch (const std::exception& e) {
    // The hub drops stale clients on its own, so this is not fatal
    LOG(WARNING) << "Unable to unregister " << selfId
                 << " from the SAMP hub: " << e.what();
  }
}

XmlRpcValue SampHubConnection::call(const string& method,
                                    vector<XmlRpcValue> params, int timeout) {
  params.insert(params.begin(), XmlRpcValue(privateKey));
  return rpc->call(method, params, timeout);
}

vector<string> SampHubConnection::findDs9Clients() {
  auto registered =
      call("samp.hub.getRegisteredClients", {}, HUB_CALL_TIMEOUT_SECONDS);
  if (registered.getType() != XmlRpcValue::Type::ARRAY) {
    throw SampException("The SAMP hub sent an invalid client list");
  }

  vector<string> ds9Clients;
  for (const auto& client : registered.asArray()) {
    const string& clientId = requireString(client, "client id");
    auto metadata = call("samp.hub.getMetadata", {clientId},
                         HUB_CALL_TIMEOUT_SECONDS);
    if (metadata.getType() != XmlRpcValue::Type::STRUCT) {
      continue;
    }
    auto name = metadata.find("samp.name");
    if (name && name->getType() == XmlRpcValue::Type::STRING &&
        toLower(name->asString()) == DS9_CLIENT_NAME) {
      ds9Clients.push_back(clientId);
    }
  }
  VLOG(1) << "DS9 clients: " << describeClients(ds9Clients);
  return ds9Clients;
}

XmlRpcValue SampHubConnection::callAndWait(const string& recipientId,
                                           const string& mtype,
                                           const string& command,
                                           int timeout) {
  auto params = XmlRpcValue::structure();
  params.set("cmd", command);
  auto message = XmlRpcValue::structure();
  message.set("samp.mtype", mtype);
  message.set("samp.params", params);

  VLOG(1) << "Sending " << mtype << " '" << command << "' to " << recipientId;
  auto response = call("samp.hub.callAndWait",
                       {recipientId, message, to_string(timeout)}, timeout);
  if (response.getType() != XmlRpcValue::Type::STRUCT) {
    throw SampException("The SAMP hub sent an invalid response to " + mtype);
  }

  auto status = response.find("samp.status");
  string statusText =
      status && status->getType() == XmlRpcValue::Type::STRING
          ? status->asString()
          : "";
  if (statusText == "samp.error") {
    string errorText = "unknown error";
    auto error = response.find("samp.error");
    if (error && error->getType() == XmlRpcValue::Type::STRUCT) {
      auto text = error->find("samp.errortxt");
      if (text && text->getType() == XmlRpcValue::Type::STRING) {
        errorText = text->asString();
      }
    }
    throw SampException("DS9 returned an error for '" + command +
                        "': " + errorText);
  }
  if (statusText == "samp.warning") {
    LOG(WARNING) << "DS9 returned a warning for '" << command << "'";
  } else if (statusText != "samp.ok") {
    throw SampException("Unexpected status '" + statusText + "' for '" +
                        command + "'");
  }

  auto result = response.find("samp.result");
  if (result && result->getType() == XmlRpcValue::Type::STRUCT) {
    return *result;
  }
  return XmlRpcValue::structure();
}

optional<string> SampDs9Session::get(const string& command, int timeout) {
  auto result =
      connection->callAndWait(clientId, DS9_GET_MTYPE, command, timeout);
  auto value = result.find("value");
  if (value == NULL || value->getType() != XmlRpcValue::Type::STRING ||
      value->asString().empty()) {
    return nullopt;
  }
  return value->asString();
}

void SampDs9Session::set(const string& command, int timeout) {
  connection->callAndWait(clientId, DS9_SET_MTYPE, command, timeout);
}

string SampDs9Session::describe() const {
  return "DS9 client " + clientId + " via the SAMP hub at " +
         connection->getHubUrl() + " (registered as " +
         connection->getSelfId() + ")";
}

unique_ptr<SampHubConnection> SampHubConnector::openConnection() {
  string path = lockFilePath ? *lockFilePath : locateLockFile();
  return unique_ptr<SampHubConnection>(
      new SampHubConnection(readLockFile(path)));
}

unique_ptr<Ds9Session> SampHubConnector::connect(
    const optional<string>& clientName) {
  auto connection = openConnection();
  auto clients = connection->findDs9Clients();

  string target;
  if (clientName) {
    if (std::find(clients.begin(), clients.end(), *clientName) ==
        clients.end()) {
      throw SampException("Unable to find a DS9 client called '" +
                          *clientName +
                          "' (DS9 clients: " + describeClients(clients) + ")");
    }
    target = *clientName;
  } else if (clients.empty()) {
    throw SampException(
        "Unable to find a running SAMP client that recognizes '" +
        DS9_SET_MTYPE + "'");
  } else if (clients.size() > 1) {
    throw SampException("Unable to choose a DS9 client as there are " +
                        to_string(clients.size()) + ": " + join(clients, " ") +
                        ". Use --name to select one.");
  } else {
    target = clients[0];
  }

  return unique_ptr<Ds9Session>(
      new SampDs9Session(std::move(connection), target));
}

vector<string> SampHubConnector::listClients() {
  auto connection = openConnection();
  return connection->findDs9Clients();
}
}  // namespace ds9samp
