#ifndef __PCD_TCP_SOCKET_HANDLER__
#define __PCD_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace pcd {
/**
 * @brief Implements IPv4/IPv6 socket operations built on top of
 * UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Connects to the first resolved address that answers within 3
   * seconds.
   * @return The fd, or -1 when nothing could be reached.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on the endpoint's address (all addresses when the
   * name is empty) for the given port.
   * @throws std::runtime_error when any address cannot be bound.  Nothing is
   * left open in that case.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the requested port and closes all related fds.
   * Calling it for a port that is not listening is a no-op.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks all listening sockets created per TCP port. */
  map<int, set<int>> portServerSockets;

  /**
   * @brief Performs additional TCP-specific socket configuration (NODELAY).
   */
  virtual void initSocket(int fd);

  /** @brief One connection attempt.  Returns a blocking fd or -1. */
  int connectTo(const addrinfo* address, const SocketEndpoint& endpoint);
};
}  // namespace pcd

#endif  // __PCD_TCP_SOCKET_HANDLER__
