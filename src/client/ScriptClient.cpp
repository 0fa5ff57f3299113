#include "ScriptClient.hpp"

namespace pcd {
ScriptClient::ScriptClient(shared_ptr<SocketHandler> _socketHandler,
                           const SocketEndpoint& _serverEndpoint)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      socketFd(-1) {}

ScriptClient::~ScriptClient() { close(); }

bool ScriptClient::connect() {
  if (socketFd != -1) {
    return true;
  }
  socketFd = socketHandler->connect(serverEndpoint);
  if (socketFd == -1) {
    LOG(WARNING) << "Could not connect to " << serverEndpoint;
    return false;
  }
  return true;
}

void ScriptClient::close() {
  if (socketFd == -1) {
    return;
  }
  socketHandler->close(socketFd);
  socketFd = -1;
}

ScriptResponse ScriptClient::request(ScriptRequest request) {
  if (socketFd == -1) {
    throw std::runtime_error("Not connected to the daemon");
  }
  request.set_version(PROTOCOL_VERSION);
  socketHandler->writeProto(socketFd, request, true);
  return socketHandler->readProto<ScriptResponse>(socketFd, true);
}

ScriptResponse ScriptClient::serverStatus() {
  ScriptRequest r;
  r.set_type(SERVER_STATUS);
  return request(r);
}

ScriptResponse ScriptClient::deviceStatus(const string& uniqueIdentifier) {
  ScriptRequest r;
  r.set_type(DEVICE_STATUS);
  r.set_uniqueidentifier(uniqueIdentifier);
  return request(r);
}

ScriptResponse ScriptClient::listDevices() {
  ScriptRequest r;
  r.set_type(LIST_DEVICES);
  return request(r);
}

ScriptResponse ScriptClient::sendToDevice(const string& uniqueIdentifier,
                                          const string& payload) {
  ScriptRequest r;
  r.set_type(SEND_TO_DEVICE);
  r.set_uniqueidentifier(uniqueIdentifier);
  r.set_payload(payload);
  return request(r);
}

ScriptResponse ScriptClient::disconnectDevice(const string& uniqueIdentifier) {
  ScriptRequest r;
  r.set_type(DISCONNECT_DEVICE);
  r.set_uniqueidentifier(uniqueIdentifier);
  return request(r);
}
}  // namespace pcd
