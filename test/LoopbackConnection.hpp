#ifndef __PCD_LOOPBACK_CONNECTION__
#define __PCD_LOOPBACK_CONNECTION__

#include "TcpSocketHandler.hpp"
#include "TestHeaders.hpp"

namespace pcd {
/**
 * @brief A connected pair of TCP sockets over 127.0.0.1, each end owned by
 * its own TcpSocketHandler.
 */
class LoopbackConnection {
 public:
  LoopbackConnection()
      : serverHandler(new TcpSocketHandler()),
        clientHandler(new TcpSocketHandler()),
        endpoint("127.0.0.1", pickFreePort()),
        serverFd(-1),
        clientFd(-1),
        listenFd(-1) {
    set<int> listenFds = serverHandler->listen(endpoint);
    REQUIRE(listenFds.size() == 1);
    listenFd = *(listenFds.begin());
    pair<int, int> first = connectAnother();
    serverFd = first.first;
    clientFd = first.second;
  }

  ~LoopbackConnection() {
    serverHandler->stopListening(endpoint);
    for (auto it : extraPairs) {
      closeIfActive(serverHandler, it.first);
      closeIfActive(clientHandler, it.second);
    }
  }

  /**
   * @brief Opens one more connection to the same listener.  Both ends are
   * closed with this object.
   * @return The accepted (server side) fd and the client fd.
   */
  pair<int, int> connectAnother() {
    int client = clientHandler->connect(endpoint);
    REQUIRE(client > 0);
    int server = -1;
    REQUIRE(waitFor([this, &server]() {
      server = serverHandler->accept(listenFd);
      return server > 0;
    }));
    extraPairs.push_back(make_pair(server, client));
    return make_pair(server, client);
  }

  shared_ptr<TcpSocketHandler> serverHandler;
  shared_ptr<TcpSocketHandler> clientHandler;
  SocketEndpoint endpoint;
  int serverFd;
  int clientFd;

 protected:
  int listenFd;
  vector<pair<int, int>> extraPairs;

  static void closeIfActive(shared_ptr<TcpSocketHandler> handler, int fd) {
    auto active = handler->getActiveSockets();
    if (std::find(active.begin(), active.end(), fd) != active.end()) {
      handler->close(fd);
    }
  }
};
}  // namespace pcd

#endif  // __PCD_LOOPBACK_CONNECTION__
