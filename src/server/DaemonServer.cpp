#include "DaemonServer.hpp"

#include "DeviceSession.hpp"
#include "NetworkUtils.hpp"
#include "ScriptSession.hpp"

namespace pcd {
DaemonServer::DaemonServer(std::shared_ptr<SocketHandler> _socketHandler,
                           const SocketEndpoint& _serverEndpoint)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      startTimestamp(nowMillis()),
      state(ServerState::CREATED),
      allRemoteConnections(false) {}

DaemonServer::~DaemonServer() {
  stop();
  joinThreads();
}

void DaemonServer::start() {
  listen();
  run();
}

void DaemonServer::listen() {
  lock_guard<recursive_mutex> guard(serverMutex);
  if (state == ServerState::STOPPED) {
    LOG(INFO) << "Server was stopped before it started listening";
    return;
  }
  if (state != ServerState::CREATED) {
    STFATAL << "Tried to listen twice";
  }

  if (localAddressOverride.empty()) {
    localAddress = resolveLocalAddress();
  } else {
    localAddress = NetworkUtils::normalizeAddress(localAddressOverride);
  }
  if (localAddress.empty()) {
    LOG(ERROR) << "Unable to determine local IP";
    throw StartupError("Unable to determine local IP",
                       EXIT_CODE_LOCAL_ADDRESS);
  }

  try {
    listenFds = socketHandler->listen(serverEndpoint);
  } catch (const std::runtime_error& err) {
    LOG(ERROR) << "Could not listen on port: " << serverEndpoint.getPort();
    throw StartupError(string("Could not listen on port ") +
                           to_string(serverEndpoint.getPort()) + ": " +
                           err.what(),
                       EXIT_CODE_BIND_FAILURE);
  }
  state = ServerState::LISTENING;
  LOG(INFO) << "Listening on " << localAddress << ":"
            << serverEndpoint.getPort();
}

void DaemonServer::run() {
  set<int> serverPortFds;
  {
    lock_guard<recursive_mutex> guard(serverMutex);
    if (state == ServerState::STOPPED) {
      LOG(INFO) << "Server stopped before the accept loop started";
      joinThreads();
      return;
    }
    if (state != ServerState::LISTENING) {
      STFATAL << "Tried to run the accept loop without listening first";
    }
    state = ServerState::ACCEPTING;
    serverPortFds = listenFds;
  }

  // poll has no FD_SETSIZE ceiling on the descriptor numbers
  vector<pollfd> pollFds;
  for (int i : serverPortFds) {
    pollfd entry;
    entry.fd = i;
    entry.events = POLLIN;
    entry.revents = 0;
    pollFds.push_back(entry);
  }

  while (!isStopped()) {
    // The timeout bounds how long it takes to notice stop()
    int numReady = poll(pollFds.data(), pollFds.size(), 10);
    if (numReady == -1) {
      auto pollErrno = GetErrno();
      if (isStopped()) {
        break;
      }
      if (pollErrno != EINTR) {
        LOG(WARNING) << "Waiting for connections failed: " << pollErrno << " "
                     << strerror(pollErrno);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      continue;
    }

    reapThreads();
    if (numReady == 0) {
      continue;
    }

    for (auto& entry : pollFds) {
      // POLLNVAL means stop() already closed the socket
      if ((entry.revents & POLLIN) && !(entry.revents & POLLNVAL)) {
        acceptNewConnection(entry.fd);
      }
    }
  }

  LOG(INFO) << "Accept loop finished";
  joinThreads();
}

void DaemonServer::stop() {
  lock_guard<recursive_mutex> guard(serverMutex);
  if (state == ServerState::STOPPED) {
    return;
  }
  LOG(INFO) << "Server shutting down...";
  bool listening =
      (state == ServerState::LISTENING || state == ServerState::ACCEPTING);
  state = ServerState::STOPPED;
  if (listening) {
    socketHandler->stopListening(serverEndpoint);
    listenFds.clear();
  }
  registry.removeAll();
}

string DaemonServer::resolveLocalAddress() {
  return NetworkUtils::resolveLocalAddress();
}

bool DaemonServer::acceptNewConnection(int fd) {
  VLOG(1) << "Accepting connection";
  int clientSocketFd = socketHandler->accept(fd);
  if (clientSocketFd < 0) {
    auto acceptErrno = GetErrno();
    if (isStopped()) {
      return false;
    }
    if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK) {
      LOG(WARNING) << "Accept failed: " << acceptErrno << " "
                   << strerror(acceptErrno);
    }
    return false;
  }
  VLOG(1) << "SERVER: got client socket fd: " << clientSocketFd;

  try {
    string peerAddress = socketHandler->getPeerAddress(clientSocketFd);
    bool allRemote;
    string local;
    {
      lock_guard<recursive_mutex> guard(serverMutex);
      allRemote = allRemoteConnections;
      local = localAddress;
    }
    ConnectionType type = classifyConnection(peerAddress, allRemote, local);
    if (type == ConnectionType::LOCAL_SCRIPT) {
      LOG(INFO) << "New local script connection";
      startThread("script-" + to_string(clientSocketFd),
                  [this, clientSocketFd]() { scriptHandler(clientSocketFd); });
    } else {
      LOG(INFO) << "New device connection (" << peerAddress << ")";
      startThread("device-" + to_string(clientSocketFd),
                  [this, clientSocketFd, peerAddress]() {
                    deviceHandler(clientSocketFd, peerAddress);
                  });
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << "Unable to manage the new connection: " << e.what();
    socketHandler->close(clientSocketFd);
    return false;
  }
  return true;
}

void DaemonServer::scriptHandler(int clientSocketFd) {
  ScriptSession session(this, socketHandler, clientSocketFd);
  session.run();
}

void DaemonServer::deviceHandler(int clientSocketFd,
                                 const string& peerAddress) {
  shared_ptr<DeviceSession> device;
  try {
    DeviceHello hello =
        socketHandler->readProto<DeviceHello>(clientSocketFd, true);
    DeviceHelloResponse response;
    if (hello.version() != PROTOCOL_VERSION) {
      LOG(WARNING) << "Got a device hello but the version does not match.  "
                      "Device: "
                   << hello.version() << " != Server: " << PROTOCOL_VERSION;
      std::ostringstream errorStream;
      errorStream << "Mismatched protocol versions.  Device: "
                  << hello.version() << " != Server: " << PROTOCOL_VERSION;
      response.set_status(MISMATCHED_PROTOCOL);
      response.set_error(errorStream.str());
      socketHandler->writeProto(clientSocketFd, response, true);
      socketHandler->close(clientSocketFd);
      return;
    }
    if (hello.uniqueidentifier().empty()) {
      LOG(WARNING) << "Got a device hello without an identifier from "
                   << peerAddress;
      response.set_status(INVALID_IDENTIFIER);
      response.set_error("Missing unique identifier");
      socketHandler->writeProto(clientSocketFd, response, true);
      socketHandler->close(clientSocketFd);
      return;
    }

    LOG(INFO) << "Got device with id: " << hello.uniqueidentifier();
    device.reset(new DeviceSession(socketHandler, hello.uniqueidentifier(),
                                   hello.name(), peerAddress,
                                   clientSocketFd));
    response.set_status(ACCEPTED);
    socketHandler->writeProto(clientSocketFd, response, true);
    addDevice(device);
  } catch (const std::runtime_error& err) {
    LOG(WARNING) << "Error handling new device: " << err.what();
    if (device) {
      device->closeSocket();
    } else {
      socketHandler->close(clientSocketFd);
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << "Got an unexpected error handling new device: " << e.what();
    if (device) {
      device->closeSocket();
    } else {
      socketHandler->close(clientSocketFd);
    }
  }
}

void DaemonServer::addDevice(shared_ptr<Device> device) {
  lock_guard<recursive_mutex> guard(serverMutex);
  if (state == ServerState::STOPPED) {
    LOG(INFO) << "Server is stopped, refusing device "
              << device->getUniqueIdentifier();
    device->stop();
    device->closeSocket();
    return;
  }
  registry.insert(device);
  try {
    startThread(device->getUniqueIdentifier(), [this, device]() {
      device->run();
      removeDevice(device);
    });
  } catch (const std::system_error& se) {
    LOG(ERROR) << "Could not start the session for device "
               << device->getUniqueIdentifier() << ": " << se.what();
    registry.remove(device);
  }
}

bool DaemonServer::removeDevice(shared_ptr<Device> device) {
  return registry.remove(device);
}

bool DaemonServer::removeDevice(const string& uniqueIdentifier) {
  return registry.remove(uniqueIdentifier);
}

shared_ptr<Device> DaemonServer::getDevice(const string& uniqueIdentifier) {
  return registry.lookup(uniqueIdentifier);
}

int DaemonServer::getDeviceCount() { return registry.count(); }

int DaemonServer::getConnectionCount() {
  size_t listening;
  {
    lock_guard<recursive_mutex> guard(serverMutex);
    listening = listenFds.size();
  }
  size_t open = socketHandler->getActiveSockets().size();
  return open > listening ? int(open - listening) : 0;
}

vector<shared_ptr<Device>> DaemonServer::listDevices() {
  return registry.list();
}

void DaemonServer::setAllRemoteConnections(bool allRemote) {
  lock_guard<recursive_mutex> guard(serverMutex);
  allRemoteConnections = allRemote;
}

bool DaemonServer::getAllRemoteConnections() {
  lock_guard<recursive_mutex> guard(serverMutex);
  return allRemoteConnections;
}

void DaemonServer::setLocalAddressOverride(const string& address) {
  lock_guard<recursive_mutex> guard(serverMutex);
  localAddressOverride = address;
}

string DaemonServer::getLocalAddress() {
  lock_guard<recursive_mutex> guard(serverMutex);
  return localAddress;
}

ServerState DaemonServer::getState() {
  lock_guard<recursive_mutex> guard(serverMutex);
  return state;
}

bool DaemonServer::isStopped() {
  lock_guard<recursive_mutex> guard(serverMutex);
  return state == ServerState::STOPPED;
}

void DaemonServer::startThread(const string& name, std::function<void()> fn) {
  shared_ptr<atomic<bool>> finished(new atomic<bool>(false));
  shared_ptr<thread> t(new thread([name, fn, finished]() {
    el::Helpers::setThreadName(name);
    try {
      fn();
    } catch (const std::exception& e) {
      LOG(ERROR) << "Thread " << name << " ended with an error: " << e.what();
    }
    *finished = true;
  }));
  lock_guard<mutex> guard(threadMutex);
  handlerThreads.push_back(HandlerThread{t, finished});
}

void DaemonServer::reapThreads() {
  vector<HandlerThread> done;
  {
    lock_guard<mutex> guard(threadMutex);
    auto it = handlerThreads.begin();
    while (it != handlerThreads.end()) {
      if (*(it->finished)) {
        done.push_back(*it);
        it = handlerThreads.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& handlerThread : done) {
    handlerThread.t->join();
  }
}

void DaemonServer::joinThreads() {
  while (true) {
    vector<HandlerThread> toJoin;
    {
      lock_guard<mutex> guard(threadMutex);
      if (handlerThreads.empty()) {
        break;
      }
      toJoin.swap(handlerThreads);
    }
    VLOG(1) << "Waiting for " << toJoin.size() << " handler threads";
    for (auto& handlerThread : toJoin) {
      if (handlerThread.t->get_id() == std::this_thread::get_id()) {
        STFATAL << "A handler thread tried to join itself";
      }
      handlerThread.t->join();
    }
  }
}
}  // namespace pcd
