#include "UnixSocketHandler.hpp"

namespace pcd {
namespace {
const int WRITE_STALL_TIMEOUT_MS = 5000;
}

UnixSocketHandler::UnixSocketHandler() {}

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketMutex(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return shared_ptr<recursive_mutex>();
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Read on untracked socket " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ssize_t bytesRead = ::read(fd, buf, count);
  int readErrno = errno;
  if (bytesRead < 0 && readErrno != EAGAIN && readErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading " << fd << ": " << readErrno << " "
                 << strerror(readErrno);
  }
  errno = readErrno;
  return bytesRead;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Write on untracked socket " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  const char *data = (const char *)buf;
  size_t written = 0;
  while (written < count) {
#ifdef MSG_NOSIGNAL
    ssize_t w = ::send(fd, data + written, count - written, MSG_NOSIGNAL);
#else
    ssize_t w = ::write(fd, data + written, count - written);
#endif
    if (w >= 0) {
      written += w;
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      return -1;
    }
    // Kernel buffer is full, wait for the peer to drain it
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, WRITE_STALL_TIMEOUT_MS);
    if (rc == 0) {
      LOG(WARNING) << "Write to " << fd << " stalled, giving up";
      errno = ETIMEDOUT;
      return -1;
    }
    if (rc == -1 && errno != EINTR) {
      return -1;
    }
  }
  return ssize_t(count);
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Tried to track an fd twice: " << fd;
  }
  activeSocketMutexes[fd] = make_shared<recursive_mutex>();
}

int UnixSocketHandler::accept(int listenFd) {
  sockaddr_storage client;
  socklen_t clientLen = sizeof(client);
  int clientFd = ::accept(listenFd, (sockaddr *)&client, &clientLen);
  if (clientFd < 0) {
    int acceptErrno = errno;
    if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK) {
      VLOG(1) << "accept() on " << listenFd << " failed: " << acceptErrno
              << " " << strerror(acceptErrno);
    }
    errno = acceptErrno;
    return -1;
  }
  // close() drops the map entry under this lock, so a recycled number is
  // never still tracked here.
  lock_guard<std::recursive_mutex> guard(globalMutex);
  addToActiveSockets(clientFd);
  initSocket(clientFd);
  VLOG(3) << "Accepted " << clientFd << " on " << listenFd;
  return clientFd;
}

string UnixSocketHandler::getPeerAddress(int fd) {
  sockaddr_storage peer;
  socklen_t len = sizeof(sockaddr_storage);
  memset(&peer, 0, sizeof(peer));
  if (::getpeername(fd, (sockaddr *)&peer, &len) == -1) {
    auto localErrno = errno;
    throw std::runtime_error(string("Could not get peer address: ") +
                             strerror(localErrno));
  }
  char buf[INET6_ADDRSTRLEN];
  const char *result = NULL;
  if (peer.ss_family == AF_INET) {
    result = inet_ntop(AF_INET, &((sockaddr_in *)&peer)->sin_addr, buf,
                       sizeof(buf));
  } else if (peer.ss_family == AF_INET6) {
    result = inet_ntop(AF_INET6, &((sockaddr_in6 *)&peer)->sin6_addr, buf,
                       sizeof(buf));
  } else {
    throw std::runtime_error("Unsupported peer address family: " +
                             to_string(peer.ss_family));
  }
  if (result == NULL) {
    auto localErrno = errno;
    throw std::runtime_error(string("Could not format peer address: ") +
                             strerror(localErrno));
  }
  return string(buf);
}

void UnixSocketHandler::shutdown(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) == activeSocketMutexes.end()) {
    LOG(INFO) << "Tried to shut down a socket that has been closed: " << fd;
    return;
  }
  if (::shutdown(fd, SHUT_RDWR) == -1 && GetErrno() != ENOTCONN) {
    LOG(WARNING) << "Error shutting down " << fd << ": " << GetErrno() << " "
                 << strerror(GetErrno());
  }
}

void UnixSocketHandler::close(int fd) {
  if (fd == -1) {
    return;
  }
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    STERROR << "Tried to close a socket that is not tracked: " << fd;
    return;
  }
  // Wait for an in-flight read or write on this fd to finish
  auto socketMutex = it->second;
  lock_guard<std::recursive_mutex> socketGuard(*socketMutex);
  VLOG(1) << "Closing socket " << fd;
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(it);
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  vector<int> fds;
  fds.reserve(activeSocketMutexes.size());
  for (const auto &it : activeSocketMutexes) {
    fds.push_back(it.first);
  }
  return fds;
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  int noSigPipe = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&noSigPipe,
                 sizeof(noSigPipe)) == -1) {
    ::signal(SIGPIPE, SIG_IGN);
  }
#endif
  int flags = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(flags);
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void UnixSocketHandler::initServerSocket(int fd) {
  initSocket(fd);
  int reuse = 1;
  FATAL_FAIL(
      setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, (char *)&reuse, sizeof(reuse)));
}
}  // namespace pcd
