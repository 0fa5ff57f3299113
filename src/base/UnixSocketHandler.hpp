#ifndef __PCD_UNIX_SOCKET_HANDLER__
#define __PCD_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace pcd {
/**
 * @brief SocketHandler over POSIX stream sockets.
 *
 * Every socket it hands out is tracked with its own mutex.  Reads and writes
 * on a descriptor that was closed through this handler fail with EPIPE
 * instead of touching whatever now owns the number.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes all `count` bytes unless the peer stalls for 5 seconds. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  virtual string getPeerAddress(int fd);
  virtual void shutdown(int fd);
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

 protected:
  /** @brief Starts tracking a new descriptor.  Caller holds globalMutex. */
  void addToActiveSockets(int fd);

  /** @brief The mutex of a tracked descriptor, nullptr if it is not tracked. */
  shared_ptr<recursive_mutex> getSocketMutex(int fd);

  /** @brief Non-blocking mode and SIGPIPE suppression. */
  virtual void initSocket(int fd);
  virtual void initServerSocket(int fd);

  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards activeSocketMutexes. */
  recursive_mutex globalMutex;
};
}  // namespace pcd

#endif  // __PCD_UNIX_SOCKET_HANDLER__
