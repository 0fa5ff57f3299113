#ifndef __PCD_SOCKET_HANDLER__
#define __PCD_SOCKET_HANDLER__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace pcd {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeout Whether to enforce the internal transfer timeout while
   * waiting.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads a length-prefixed protobuf from the socket.
   * @tparam T Protobuf message type.
   * @throws std::runtime_error on invalid length or parse failure.
   */
  template <typename T>
  inline T readProto(int fd, bool timeout) {
    T t;
    int64_t length;
    readAll(fd, &length, sizeof(int64_t), timeout);
    if (length < 0 || length > 128 * 1024 * 1024) {
      // If the message is < 0 or too big, assume this is a bad packet and
      // throw
      string s = string("Invalid size (<0 or >128 MB): ") + to_string(length);
      throw std::runtime_error(s.c_str());
    }
    if (length == 0) {
      return t;
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, timeout);
    if (!t.ParseFromString(s)) {
      throw std::runtime_error("Invalid proto");
    }
    return t;
  }

  /**
   * @brief Serializes and writes a length-prefixed protobuf message.
   */
  template <typename T>
  inline void writeProto(int fd, const T& t, bool timeout) {
    string s;
    if (!t.SerializeToString(&s)) {
      STFATAL << "Serialization of " << t.GetTypeName() << " failed!";
    }
    int64_t length = s.length();
    if (length < 0 || length > 128 * 1024 * 1024) {
      STFATAL << "Invalid proto length: " << length << " For proto "
              << t.GetTypeName();
    }
    writeAllOrThrow(fd, &length, sizeof(int64_t), timeout);
    if (length > 0) {
      writeAllOrThrow(fd, &s[0], length, timeout);
    }
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint and returns the active listen fds.
   * @throws std::runtime_error when the port cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on the given listening fd.
   * @return The client fd, or -1 with errno set when nothing was accepted.
   */
  virtual int accept(int fd) = 0;
  /**
   * @brief Returns the numeric address of the remote end of a connected
   * socket.
   * @throws std::runtime_error when the peer is no longer connected.
   */
  virtual string getPeerAddress(int fd) = 0;
  /**
   * @brief Stops accepting new connections on the given endpoint.
   */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Ends both directions of a connection without releasing the
   * descriptor.  Blocked readers wake up and see end of file.
   */
  virtual void shutdown(int fd) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace pcd

#endif  // __PCD_SOCKET_HANDLER__
