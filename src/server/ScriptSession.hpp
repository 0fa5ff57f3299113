#ifndef __PCD_SCRIPT_SESSION__
#define __PCD_SCRIPT_SESSION__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace pcd {
class DaemonServer;

/**
 * @brief Serves a local script: answers ScriptRequests about the connected
 * devices until the script disconnects or the server stops.  Owns the socket
 * and closes it when done.
 */
class ScriptSession {
 public:
  ScriptSession(DaemonServer* _server,
                shared_ptr<SocketHandler> _socketHandler, int _socketFd);

  ~ScriptSession();

  void run();

  ScriptResponse handleRequest(const ScriptRequest& request);

 protected:
  DaemonServer* server;
  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
};
}  // namespace pcd

#endif  // __PCD_SCRIPT_SESSION__
