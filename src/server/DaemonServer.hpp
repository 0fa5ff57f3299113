#ifndef __PCD_DAEMON_SERVER__
#define __PCD_DAEMON_SERVER__

#include "ConnectionClassifier.hpp"
#include "Device.hpp"
#include "DeviceRegistry.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace pcd {
enum class ServerState {
  CREATED,
  LISTENING,
  ACCEPTING,
  STOPPED,
};

/**
 * @brief The daemon: accepts connections on one port and routes them.
 *
 * Connections from loopback or from the host's own LAN address become script
 * sessions, everything else becomes a device session.  Each accepted
 * connection gets its own thread.  Device sessions register themselves through
 * addDevice() and the server owns the registry of connected devices.
 *
 * Lifecycle: CREATED -> listen() -> LISTENING -> run() -> ACCEPTING, and
 * stop() moves any state to STOPPED.
 */
class DaemonServer {
 public:
  DaemonServer(std::shared_ptr<SocketHandler> _socketHandler,
               const SocketEndpoint& _serverEndpoint);

  /** @brief Stops the server and joins every thread it started. */
  virtual ~DaemonServer();

  /** @brief listen() followed by run().  Blocks until stop(). */
  void start();

  /**
   * @brief Resolves the local address and opens the listening sockets.
   * @throws StartupError when the local address cannot be resolved or the
   * port cannot be bound.
   */
  void listen();

  /** @brief Accept loop.  Returns after stop() once handler threads exit. */
  void run();

  /**
   * @brief Stops accepting, closes the listening sockets and evicts every
   * registered device.  Safe to call more than once or before listen().
   */
  void stop();

  /**
   * @brief Accepts one pending connection on a listening fd and dispatches
   * it to a handler thread.
   * @return false when nothing was dispatched.
   */
  bool acceptNewConnection(int fd);

  /** @brief Entry point of the thread serving a local script connection. */
  void scriptHandler(int clientSocketFd);

  /**
   * @brief Entry point of the thread serving a remote device connection:
   * performs the handshake and registers the device.
   */
  void deviceHandler(int clientSocketFd, const string& peerAddress);

  /**
   * @brief Registers the device (evicting a previous holder of its id) and
   * runs its session on a new thread.  Refused once the server is stopped.
   */
  void addDevice(shared_ptr<Device> device);

  /**
   * @brief Called by a session that ended.  Only removes the registry entry
   * when it still belongs to this device.
   */
  bool removeDevice(shared_ptr<Device> device);

  /** @brief Evicts whatever device is registered under the identifier. */
  bool removeDevice(const string& uniqueIdentifier);

  /** @brief Liveness-checked lookup, nullptr when not connected. */
  shared_ptr<Device> getDevice(const string& uniqueIdentifier);

  int getDeviceCount();

  /** @brief Open connections of any kind, listening sockets excluded. */
  int getConnectionCount();

  vector<shared_ptr<Device>> listDevices();

  inline int64_t getStartTimestamp() const { return startTimestamp; }

  inline shared_ptr<SocketHandler> getSocketHandler() { return socketHandler; }

  /** @brief When set, every connection is treated as a remote device. */
  void setAllRemoteConnections(bool allRemote);

  bool getAllRemoteConnections();

  /** @brief Uses the given address instead of resolving the host name. */
  void setLocalAddressOverride(const string& address);

  string getLocalAddress();

  ServerState getState();

  bool isStopped();

 protected:
  struct HandlerThread {
    shared_ptr<thread> t;
    shared_ptr<atomic<bool>> finished;
  };

  /** @brief Host address used to classify local connections. */
  virtual string resolveLocalAddress();

  /** @brief Starts a named thread tracked by the server. */
  void startThread(const string& name, std::function<void()> fn);

  /** @brief Joins threads that have already finished. */
  void reapThreads();

  /** @brief Joins every tracked thread, waiting for the running ones. */
  void joinThreads();

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  const int64_t startTimestamp;
  DeviceRegistry registry;

  /** @brief Guards the state, the flags and the addresses below. */
  recursive_mutex serverMutex;
  ServerState state;
  bool allRemoteConnections;
  string localAddressOverride;
  string localAddress;
  set<int> listenFds;

  mutex threadMutex;
  vector<HandlerThread> handlerThreads;
};
}  // namespace pcd

#endif  // __PCD_DAEMON_SERVER__
