#include "ScriptSession.hpp"

#include "DaemonServer.hpp"
#include "DeviceSession.hpp"

namespace pcd {
namespace {
void fillDeviceInfo(DeviceInfo* info, const shared_ptr<Device>& device) {
  info->set_uniqueidentifier(device->getUniqueIdentifier());
  info->set_timestampconnected(device->getTimestampConnected());
  info->set_active(device->isActive());
}
}  // namespace

ScriptSession::ScriptSession(DaemonServer* _server,
                             shared_ptr<SocketHandler> _socketHandler,
                             int _socketFd)
    : server(_server), socketHandler(_socketHandler), socketFd(_socketFd) {}

ScriptSession::~ScriptSession() {
  if (socketFd != -1) {
    socketHandler->close(socketFd);
    socketFd = -1;
  }
}

void ScriptSession::run() {
  while (!server->isStopped()) {
    if (!waitOnSocketData(socketFd)) {
      continue;
    }
    ScriptRequest request;
    try {
      request = socketHandler->readProto<ScriptRequest>(socketFd, true);
    } catch (const std::runtime_error& re) {
      VLOG(1) << "Script disconnected: " << re.what();
      break;
    }
    ScriptResponse response = handleRequest(request);
    try {
      socketHandler->writeProto(socketFd, response, true);
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Could not answer script: " << re.what();
      break;
    }
  }
  socketHandler->close(socketFd);
  socketFd = -1;
}

ScriptResponse ScriptSession::handleRequest(const ScriptRequest& request) {
  ScriptResponse response;
  if (request.version() != PROTOCOL_VERSION) {
    std::ostringstream errorStream;
    errorStream << "Mismatched protocol versions.  Script: "
                << request.version() << " != Server: " << PROTOCOL_VERSION;
    LOG(WARNING) << errorStream.str();
    response.set_success(false);
    response.set_error(errorStream.str());
    return response;
  }

  VLOG(1) << "Script request " << int(request.type()) << " for '"
          << request.uniqueidentifier() << "'";
  switch (request.type()) {
    case SERVER_STATUS: {
      response.set_success(true);
      response.set_starttimestamp(server->getStartTimestamp());
      response.set_devicecount(server->getDeviceCount());
      response.set_connectioncount(server->getConnectionCount());
      response.set_localaddress(server->getLocalAddress());
      break;
    }
    case DEVICE_STATUS: {
      auto device = server->getDevice(request.uniqueidentifier());
      if (!device) {
        response.set_success(false);
        response.set_error("Device not connected: " +
                           request.uniqueidentifier());
        break;
      }
      response.set_success(true);
      fillDeviceInfo(response.add_devices(), device);
      break;
    }
    case LIST_DEVICES: {
      response.set_success(true);
      for (const auto& device : server->listDevices()) {
        fillDeviceInfo(response.add_devices(), device);
      }
      response.set_devicecount(response.devices_size());
      break;
    }
    case SEND_TO_DEVICE: {
      auto device = server->getDevice(request.uniqueidentifier());
      if (!device) {
        response.set_success(false);
        response.set_error("Device not connected: " +
                           request.uniqueidentifier());
        break;
      }
      auto session = dynamic_pointer_cast<DeviceSession>(device);
      if (!session) {
        response.set_success(false);
        response.set_error("Device does not accept messages: " +
                           request.uniqueidentifier());
        break;
      }
      try {
        session->sendMessage(request.payload());
        response.set_success(true);
      } catch (const std::runtime_error& re) {
        LOG(WARNING) << "Could not send to " << request.uniqueidentifier()
                     << ": " << re.what();
        response.set_success(false);
        response.set_error(re.what());
      }
      break;
    }
    case DISCONNECT_DEVICE: {
      if (server->removeDevice(request.uniqueidentifier())) {
        response.set_success(true);
      } else {
        response.set_success(false);
        response.set_error("Device not connected: " +
                           request.uniqueidentifier());
      }
      break;
    }
    default:
      response.set_success(false);
      response.set_error("Unknown request type: " +
                         to_string(int(request.type())));
      break;
  }
  return response;
}
}  // namespace pcd
