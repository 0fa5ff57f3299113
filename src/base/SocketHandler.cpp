#include "SocketHandler.hpp"

namespace pcd {
namespace {
// Seconds a transfer may go without progress before it is abandoned
const int TRANSFER_STALL_TIMEOUT = 10;

bool stalled(time_t lastProgress) {
  return time(NULL) > lastProgress + TRANSFER_STALL_TIMEOUT;
}
}  // namespace

void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  char* out = (char*)buf;
  size_t got = 0;
  time_t lastProgress = time(NULL);
  while (got < count) {
    if (!waitOnSocketData(fd)) {
      if (timeout && stalled(lastProgress)) {
        throw std::runtime_error("Socket Timeout");
      }
      continue;
    }
    ssize_t n = read(fd, out + got, count - got);
    if (n > 0) {
      got += n;
      lastProgress = time(NULL);
      continue;
    }
    if (n == 0) {
      throw std::runtime_error("Connection closed by peer");
    }
    int readErrno = errno;
    if (readErrno == EAGAIN || readErrno == EWOULDBLOCK) {
      continue;
    }
    VLOG(1) << "readAll on " << fd << " failed: " << strerror(readErrno);
    throw std::runtime_error(string("Failed a call to readAll: ") +
                             strerror(readErrno));
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  const char* in = (const char*)buf;
  size_t sent = 0;
  time_t lastProgress = time(NULL);
  while (sent < count) {
    if (timeout && stalled(lastProgress)) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t n = write(fd, in + sent, count - sent);
    if (n > 0) {
      sent += n;
      lastProgress = time(NULL);
      continue;
    }
    if (n == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    }
    int writeErrno = errno;
    if (writeErrno == EAGAIN || writeErrno == EWOULDBLOCK) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      continue;
    }
    LOG(WARNING) << "writeAll on " << fd << " failed: " << strerror(writeErrno);
    throw std::runtime_error(string("Failed a call to writeAll: ") +
                             strerror(writeErrno));
  }
}
}  // namespace pcd
