#include "ListExecutor.hpp"

namespace ds9samp {
string ListExecutor::summarize(const vector<string>& clients) {
  if (clients.empty()) {
    throw NoClientsException();
  }
  if (clients.size() == 1) {
    return "There is one DS9 client: " + clients[0];
  }
  return "There are " + to_string(clients.size()) +
         " DS9 clients: " + join(clients, " ");
}

void ListExecutor::run() {
  auto clients = hub->listClients();
  VLOG(1) << "Hub reported " << clients.size() << " DS9 client(s)";
  out << summarize(clients) << endl;
}
}  // namespace ds9samp
