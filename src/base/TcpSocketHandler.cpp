#include "TcpSocketHandler.hpp"

namespace pcd {
namespace {
const int CONNECT_TIMEOUT_MS = 3000;

void setBlocking(int fd, bool blocking) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  opts = blocking ? (opts & ~O_NONBLOCK) : (opts | O_NONBLOCK);
  FATAL_FAIL(fcntl(fd, F_SETFL, opts));
}

string numericHost(const addrinfo *info) {
  char host[NI_MAXHOST];
  if (getnameinfo(info->ai_addr, info->ai_addrlen, host, sizeof(host), NULL, 0,
                  NI_NUMERICHOST) != 0) {
    return "?";
  }
  return string(host);
}
}  // namespace

TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_V4MAPPED | AI_ADDRCONFIG);

  // Pick up resolver changes made while the process is running
  ::res_init();
  addrinfo *results = NULL;
  int rc = getaddrinfo(endpoint.getName().c_str(),
                       to_string(endpoint.getPort()).c_str(), &hints, &results);
  if (rc != 0) {
    LOG(WARNING) << "Cannot resolve " << endpoint << ": " << gai_strerror(rc);
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  int sockFd = -1;
  for (addrinfo *p = results; p != NULL && sockFd == -1; p = p->ai_next) {
    sockFd = connectTo(p, endpoint);
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(ERROR) << "Could not connect to " << endpoint;
    return -1;
  }
  LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
  addToActiveSockets(sockFd);
  return sockFd;
}

int TcpSocketHandler::connectTo(const addrinfo *address,
                                const SocketEndpoint &endpoint) {
  int sockFd =
      socket(address->ai_family, address->ai_socktype, address->ai_protocol);
  if (sockFd == -1) {
    LOG(INFO) << "Error creating socket: " << strerror(errno);
    return -1;
  }

  // Non-blocking only while connecting, so a dead host cannot hang us
  setBlocking(sockFd, false);
  int connectErrno = 0;
  if (::connect(sockFd, address->ai_addr, address->ai_addrlen) == -1) {
    connectErrno = errno;
  }
  if (connectErrno == EINPROGRESS) {
    pollfd pending;
    pending.fd = sockFd;
    pending.events = POLLOUT;
    pending.revents = 0;
    int ready = poll(&pending, 1, CONNECT_TIMEOUT_MS);
    if (ready == 1) {
      socklen_t len = sizeof(connectErrno);
      FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &connectErrno,
                              &len));
    } else {
      connectErrno = (ready == 0) ? ETIMEDOUT : errno;
    }
  }
  if (connectErrno != 0) {
    LOG(INFO) << "Error connecting to " << endpoint << " ("
              << numericHost(address) << "): " << strerror(connectErrno);
    ::close(sockFd);
    return -1;
  }
  setBlocking(sockFd, true);
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  int port = endpoint.getPort();
  if (portServerSockets.count(port)) {
    throw std::runtime_error("Already listening on port " + to_string(port));
  }

  addrinfo hints;
  memset(&hints, 0, sizeof hints);
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  string portname = to_string(port);
  const char *bindName =
      endpoint.getName().empty() ? NULL : endpoint.getName().c_str();
  addrinfo *servinfo = NULL;
  int rc = getaddrinfo(bindName, portname.c_str(), &hints, &servinfo);
  if (rc != 0) {
    string error = "Cannot resolve " + endpoint.getName() + ":" + portname +
                   ": " + gai_strerror(rc);
    LOG(ERROR) << error;
    throw std::runtime_error(error);
  }

  set<int> serverSockets;
  string bindError;
  for (addrinfo *p = servinfo; p != NULL; p = p->ai_next) {
    int sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (sockFd == -1) {
      LOG(INFO) << "Skipping address family " << p->ai_family << ": "
                << strerror(errno);
      continue;
    }
    initServerSocket(sockFd);
    if (p->ai_family == AF_INET6) {
      // IPv4 gets its own socket
      int flag = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, (char *)&flag,
                            sizeof(int)));
    }
    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1 ||
        ::listen(sockFd, 32) == -1) {
      bindError = "Cannot bind " + numericHost(p) + ":" + portname + ": " +
                  strerror(errno);
      ::close(sockFd);
      break;
    }
    LOG(INFO) << "Listening on " << numericHost(p) << ":" << port;
    addToActiveSockets(sockFd);
    serverSockets.insert(sockFd);
  }
  freeaddrinfo(servinfo);

  if (bindError.empty() && serverSockets.empty()) {
    bindError = "No usable address for port " + portname;
  }
  if (!bindError.empty()) {
    LOG(ERROR) << bindError;
    // All or nothing
    for (int openFd : serverSockets) {
      close(openFd);
    }
    throw std::runtime_error(bindError);
  }

  portServerSockets[port] = serverSockets;
  return serverSockets;
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = portServerSockets.find(endpoint.getPort());
  if (it == portServerSockets.end()) {
    VLOG(1) << "Not listening on port " << endpoint.getPort();
    return;
  }
  for (int sockFd : it->second) {
    close(sockFd);
  }
  portServerSockets.erase(it);
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace pcd
