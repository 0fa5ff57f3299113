#ifndef __PCD_DEVICE_SESSION__
#define __PCD_DEVICE_SESSION__

#include "Device.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace pcd {
/**
 * @brief Server side of a connected remote device after its handshake.
 *
 * Reads DevicePackets until the device says goodbye, disconnects, stays
 * silent for longer than DEVICE_KEEP_ALIVE_TIMEOUT or is stopped.  Keepalives
 * are echoed back.  Messages can be pushed to the device from other threads
 * with sendMessage().
 */
class DeviceSession : public Device {
 public:
  DeviceSession(shared_ptr<SocketHandler> _socketHandler,
                const string& _uniqueIdentifier, const string& _name,
                const string& _peerAddress, int _socketFd);

  virtual ~DeviceSession();

  virtual bool isActive();
  virtual void stop();
  virtual void closeSocket();
  virtual void run();

  /**
   * @brief Pushes a MESSAGE packet to the device.
   * @throws std::runtime_error when the device is gone or the write fails.
   */
  void sendMessage(const string& payload);

  inline const string& getName() const { return name; }

  inline const string& getPeerAddress() const { return peerAddress; }

  int getSocketFd();

  inline bool isShuttingDown() {
    lock_guard<std::recursive_mutex> guard(deviceMutex);
    return shuttingDown;
  }

 protected:
  /**
   * @brief Reacts to one packet from the device.
   * @return false when the session should end.
   */
  bool handlePacket(const DevicePacket& packet);

  void writePacket(const DevicePacket& packet);

  /** @brief Closes the fd for good. */
  void releaseSocket();

  shared_ptr<SocketHandler> socketHandler;
  const string name;
  const string peerAddress;
  int socketFd;
  // Set once the transport is unusable.  The fd itself stays open until
  // run() returns when another thread closed it.
  bool socketClosed;
  /** @brief True while run() owns the fd. */
  bool running;
  std::thread::id runThreadId;
  bool shuttingDown;
  std::atomic<time_t> lastActivity;
  /** @brief Guards the socket state and shuttingDown. */
  recursive_mutex deviceMutex;
};
}  // namespace pcd

#endif  // __PCD_DEVICE_SESSION__
