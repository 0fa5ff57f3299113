#include "DeviceSession.hpp"

namespace pcd {
DeviceSession::DeviceSession(shared_ptr<SocketHandler> _socketHandler,
                             const string& _uniqueIdentifier,
                             const string& _name, const string& _peerAddress,
                             int _socketFd)
    : Device(_uniqueIdentifier),
      socketHandler(_socketHandler),
      name(_name),
      peerAddress(_peerAddress),
      socketFd(_socketFd),
      socketClosed(false),
      running(false),
      shuttingDown(false),
      lastActivity(time(NULL)) {}

DeviceSession::~DeviceSession() {
  if (socketFd != -1) {
    LOG(INFO) << "Device session destroyed with an open socket";
    releaseSocket();
  }
}

bool DeviceSession::isActive() {
  lock_guard<std::recursive_mutex> guard(deviceMutex);
  return !shuttingDown && !socketClosed;
}

void DeviceSession::stop() {
  lock_guard<std::recursive_mutex> guard(deviceMutex);
  if (shuttingDown) {
    return;
  }
  VLOG(1) << "Stopping device " << uniqueIdentifier;
  shuttingDown = true;
}

void DeviceSession::closeSocket() {
  lock_guard<std::recursive_mutex> guard(deviceMutex);
  if (socketClosed) {
    VLOG(1) << "Tried to close a dead socket for device " << uniqueIdentifier;
    return;
  }
  socketClosed = true;
  if (running && runThreadId != std::this_thread::get_id()) {
    // The session thread may be inside a read on this fd.  Wake it up and let
    // it release the fd so the number cannot be reused under it.
    socketHandler->shutdown(socketFd);
    VLOG(1) << "Shut down socket for device " << uniqueIdentifier;
    return;
  }
  releaseSocket();
}

void DeviceSession::releaseSocket() {
  lock_guard<std::recursive_mutex> guard(deviceMutex);
  socketClosed = true;
  if (socketFd == -1) {
    return;
  }
  int fd = socketFd;
  socketFd = -1;
  socketHandler->close(fd);
  VLOG(1) << "Closed socket for device " << uniqueIdentifier;
}

int DeviceSession::getSocketFd() {
  lock_guard<std::recursive_mutex> guard(deviceMutex);
  return socketFd;
}

void DeviceSession::run() {
  LOG(INFO) << "Device session started for " << uniqueIdentifier << " ("
            << name << "@" << peerAddress << ")";
  int fd;
  {
    lock_guard<std::recursive_mutex> guard(deviceMutex);
    running = true;
    runThreadId = std::this_thread::get_id();
    fd = socketFd;
  }
  lastActivity = time(NULL);
  while (true) {
    {
      lock_guard<std::recursive_mutex> guard(deviceMutex);
      if (shuttingDown || socketClosed) {
        break;
      }
    }

    if (!waitOnSocketData(fd)) {
      if (time(NULL) > lastActivity + DEVICE_KEEP_ALIVE_TIMEOUT) {
        LOG(INFO) << "Device " << uniqueIdentifier << " timed out after "
                  << DEVICE_KEEP_ALIVE_TIMEOUT << " seconds of silence";
        break;
      }
      continue;
    }

    try {
      DevicePacket packet = socketHandler->readProto<DevicePacket>(fd, true);
      lastActivity = time(NULL);
      if (!handlePacket(packet)) {
        break;
      }
    } catch (const std::runtime_error& re) {
      LOG(INFO) << "Device " << uniqueIdentifier
                << " disconnected: " << re.what();
      break;
    }
  }
  {
    // Only this thread closes the fd once it has started reading from it
    lock_guard<std::recursive_mutex> guard(deviceMutex);
    running = false;
    releaseSocket();
  }
  LOG(INFO) << "Device session ended for " << uniqueIdentifier
            << ", connected since "
            << timestampDifferenceNow(getTimestampConnected());
}

bool DeviceSession::handlePacket(const DevicePacket& packet) {
  switch (packet.type()) {
    case KEEP_ALIVE: {
      VLOG(2) << "Got keep alive from " << uniqueIdentifier;
      DevicePacket reply;
      reply.set_type(KEEP_ALIVE);
      writePacket(reply);
      return true;
    }
    case MESSAGE: {
      LOG(INFO) << "Message from " << uniqueIdentifier << " ("
                << packet.payload().length() << " bytes)";
      VLOG(1) << "Payload: " << packet.payload();
      return true;
    }
    case GOODBYE: {
      LOG(INFO) << "Device " << uniqueIdentifier << " said goodbye";
      return false;
    }
    default:
      LOG(WARNING) << "Unknown packet type from " << uniqueIdentifier << ": "
                   << int(packet.type());
      return true;
  }
}

void DeviceSession::sendMessage(const string& payload) {
  DevicePacket packet;
  packet.set_type(MESSAGE);
  packet.set_payload(payload);
  writePacket(packet);
}

void DeviceSession::writePacket(const DevicePacket& packet) {
  // Holding the lock keeps the fd from being released during the write
  lock_guard<std::recursive_mutex> guard(deviceMutex);
  if (shuttingDown || socketClosed) {
    throw std::runtime_error("Device " + uniqueIdentifier +
                             " is not connected");
  }
  socketHandler->writeProto(socketFd, packet, true);
}
}  // namespace pcd
