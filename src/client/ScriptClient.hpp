#ifndef __PCD_SCRIPT_CLIENT__
#define __PCD_SCRIPT_CLIENT__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace pcd {
/**
 * @brief Local client for the daemon's script protocol.
 *
 * Must connect from this host (or be run against a daemon whose LAN address
 * matches) so the daemon routes it as a script rather than a device.
 */
class ScriptClient {
 public:
  ScriptClient(shared_ptr<SocketHandler> _socketHandler,
               const SocketEndpoint& _serverEndpoint);

  ~ScriptClient();

  /** @return false when the daemon cannot be reached. */
  bool connect();

  void close();

  inline bool isConnected() const { return socketFd != -1; }

  /**
   * @brief Sends one request and waits for its response.
   * @throws std::runtime_error when not connected or the exchange fails.
   */
  ScriptResponse request(ScriptRequest request);

  ScriptResponse serverStatus();
  ScriptResponse deviceStatus(const string& uniqueIdentifier);
  ScriptResponse listDevices();
  ScriptResponse sendToDevice(const string& uniqueIdentifier,
                              const string& payload);
  ScriptResponse disconnectDevice(const string& uniqueIdentifier);

 protected:
  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  int socketFd;
};
}  // namespace pcd

#endif  // __PCD_SCRIPT_CLIENT__
