#include "DaemonServer.hpp"
#include "FakeDevice.hpp"
#include "ScriptClient.hpp"
#include "TcpSocketHandler.hpp"
#include "TestHeaders.hpp"

namespace pcd {
namespace {
/**
 * @brief A listening daemon on a free loopback port with its accept loop
 * running on a background thread.
 */
class RunningDaemon {
 public:
  explicit RunningDaemon(
      shared_ptr<SocketHandler> handler =
          shared_ptr<SocketHandler>(new TcpSocketHandler()))
      : port(pickFreePort()),
        serverHandler(handler),
        server(new DaemonServer(serverHandler, SocketEndpoint(port))) {
    server->setLocalAddressOverride("127.0.0.1");
    server->listen();
    acceptThread.reset(new thread([this]() { server->run(); }));
    REQUIRE(waitFor(
        [this]() { return server->getState() == ServerState::ACCEPTING; }));
  }

  ~RunningDaemon() {
    server->stop();
    acceptThread->join();
  }

  SocketEndpoint endpoint() const { return SocketEndpoint("127.0.0.1", port); }

  int port;
  shared_ptr<SocketHandler> serverHandler;
  shared_ptr<DaemonServer> server;
  shared_ptr<thread> acceptThread;
};

/** @brief Fails the first few accepts as if the peer had given up. */
class FlakyAcceptSocketHandler : public TcpSocketHandler {
 public:
  explicit FlakyAcceptSocketHandler(int _failures) : failures(_failures) {}

  virtual int accept(int fd) {
    if (failures > 0) {
      --failures;
      errno = ECONNABORTED;
      return -1;
    }
    return TcpSocketHandler::accept(fd);
  }

  atomic<int> failures;
};

class UnresolvableDaemonServer : public DaemonServer {
 public:
  UnresolvableDaemonServer(shared_ptr<SocketHandler> _socketHandler,
                           const SocketEndpoint& _serverEndpoint)
      : DaemonServer(_socketHandler, _serverEndpoint) {}

 protected:
  virtual string resolveLocalAddress() { return ""; }
};

/** @brief The remote end of a device connection. */
class DeviceClient {
 public:
  explicit DeviceClient(const SocketEndpoint& endpoint)
      : socketHandler(new TcpSocketHandler()), fd(-1) {
    fd = socketHandler->connect(endpoint);
    REQUIRE(fd > 0);
  }

  ~DeviceClient() {
    auto active = socketHandler->getActiveSockets();
    if (std::find(active.begin(), active.end(), fd) != active.end()) {
      socketHandler->close(fd);
    }
  }

  DeviceHelloResponse hello(const string& id,
                            int version = PROTOCOL_VERSION) {
    DeviceHello hello;
    hello.set_version(version);
    hello.set_uniqueidentifier(id);
    hello.set_name("test device");
    socketHandler->writeProto(fd, hello, true);
    return socketHandler->readProto<DeviceHelloResponse>(fd, true);
  }

  DevicePacket readPacket() {
    return socketHandler->readProto<DevicePacket>(fd, true);
  }

  shared_ptr<SocketHandler> socketHandler;
  int fd;
};
}  // namespace

TEST_CASE("Local connections are scripts and leave the registry alone",
          "[DaemonServer]") {
  RunningDaemon daemon;
  ScriptClient client(shared_ptr<SocketHandler>(new TcpSocketHandler()),
                      daemon.endpoint());
  REQUIRE(client.connect());

  ScriptResponse status = client.serverStatus();
  REQUIRE(status.success());
  REQUIRE(status.devicecount() == 0);
  // The script's own connection
  REQUIRE(status.connectioncount() == 1);
  REQUIRE(status.localaddress() == "127.0.0.1");
  REQUIRE(status.starttimestamp() == daemon.server->getStartTimestamp());
  REQUIRE(daemon.server->getDeviceCount() == 0);

  ScriptResponse list = client.listDevices();
  REQUIRE(list.success());
  REQUIRE(list.devices_size() == 0);
  client.close();
}

TEST_CASE("Devices register, replace each other and are evicted on stop",
          "[DaemonServer]") {
  RunningDaemon daemon;
  daemon.server->setAllRemoteConnections(true);

  DeviceClient first(daemon.endpoint());
  REQUIRE(first.hello("A").status() == ACCEPTED);
  REQUIRE(waitFor([&daemon]() { return daemon.server->getDeviceCount() == 1; }));
  auto firstDevice = daemon.server->getDevice("A");
  REQUIRE(firstDevice != nullptr);

  DeviceClient second(daemon.endpoint());
  REQUIRE(second.hello("A").status() == ACCEPTED);
  REQUIRE(waitFor([&daemon, firstDevice]() {
    auto current = daemon.server->getDevice("A");
    return current != nullptr && current != firstDevice;
  }));

  // The replaced connection is closed by the daemon
  REQUIRE_THROWS_AS(first.readPacket(), std::runtime_error);
  REQUIRE_FALSE(firstDevice->isActive());
  REQUIRE(daemon.server->getDeviceCount() == 1);

  // The replaced session finishing must not take the new one with it
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(daemon.server->getDeviceCount() == 1);
  REQUIRE(daemon.server->getDevice("A") != nullptr);

  daemon.server->stop();
  REQUIRE(daemon.server->getDeviceCount() == 0);
  REQUIRE(daemon.server->getState() == ServerState::STOPPED);
  REQUIRE_THROWS_AS(second.readPacket(), std::runtime_error);
}

TEST_CASE("Scripts can message and disconnect devices", "[DaemonServer]") {
  RunningDaemon daemon;
  daemon.server->setAllRemoteConnections(true);
  DeviceClient device(daemon.endpoint());
  REQUIRE(device.hello("lamp").status() == ACCEPTED);
  REQUIRE(waitFor([&daemon]() { return daemon.server->getDeviceCount() == 1; }));

  // Classification happens per connection
  daemon.server->setAllRemoteConnections(false);
  ScriptClient client(shared_ptr<SocketHandler>(new TcpSocketHandler()),
                      daemon.endpoint());
  REQUIRE(client.connect());

  ScriptResponse status = client.deviceStatus("lamp");
  REQUIRE(status.success());
  REQUIRE(status.devices(0).uniqueidentifier() == "lamp");

  REQUIRE(client.sendToDevice("lamp", "on").success());
  DevicePacket packet = device.readPacket();
  REQUIRE(packet.type() == MESSAGE);
  REQUIRE(packet.payload() == "on");

  REQUIRE(client.disconnectDevice("lamp").success());
  REQUIRE_THROWS_AS(device.readPacket(), std::runtime_error);
  REQUIRE(daemon.server->getDeviceCount() == 0);

  ScriptResponse missing = client.deviceStatus("lamp");
  REQUIRE_FALSE(missing.success());
  client.close();
}

TEST_CASE("Bad handshakes are refused", "[DaemonServer]") {
  RunningDaemon daemon;
  daemon.server->setAllRemoteConnections(true);

  DeviceClient wrongVersion(daemon.endpoint());
  DeviceHelloResponse response = wrongVersion.hello("A", PROTOCOL_VERSION + 1);
  REQUIRE(response.status() == MISMATCHED_PROTOCOL);
  REQUIRE_FALSE(response.error().empty());

  DeviceClient noId(daemon.endpoint());
  REQUIRE(noId.hello("").status() == INVALID_IDENTIFIER);

  REQUIRE(daemon.server->getDeviceCount() == 0);
}

TEST_CASE("A device going away is removed from the registry",
          "[DaemonServer]") {
  RunningDaemon daemon;
  daemon.server->setAllRemoteConnections(true);
  {
    DeviceClient device(daemon.endpoint());
    REQUIRE(device.hello("A").status() == ACCEPTED);
    REQUIRE(
        waitFor([&daemon]() { return daemon.server->getDeviceCount() == 1; }));
  }
  REQUIRE(waitFor([&daemon]() { return daemon.server->getDeviceCount() == 0; }));
}

TEST_CASE("Binding a busy port is a startup error", "[DaemonServer]") {
  int port = pickFreePort();
  TcpSocketHandler squatter;
  squatter.listen(SocketEndpoint(port));

  DaemonServer server(shared_ptr<SocketHandler>(new TcpSocketHandler()),
                      SocketEndpoint(port));
  server.setLocalAddressOverride("127.0.0.1");
  try {
    server.listen();
    FAIL("listen() should have thrown");
  } catch (const StartupError& se) {
    REQUIRE(se.getExitCode() == EXIT_CODE_BIND_FAILURE);
  }
  squatter.stopListening(SocketEndpoint(port));
}

TEST_CASE("An unresolvable local address is a startup error",
          "[DaemonServer]") {
  int port = pickFreePort();
  UnresolvableDaemonServer server(
      shared_ptr<SocketHandler>(new TcpSocketHandler()), SocketEndpoint(port));
  try {
    server.listen();
    FAIL("listen() should have thrown");
  } catch (const StartupError& se) {
    REQUIRE(se.getExitCode() == EXIT_CODE_LOCAL_ADDRESS);
  }
  REQUIRE(server.getState() == ServerState::CREATED);

  // Nothing was bound
  TcpSocketHandler other;
  REQUIRE(other.listen(SocketEndpoint(port)).size() > 0);
  other.stopListening(SocketEndpoint(port));
}

TEST_CASE("A failed accept does not end the accept loop", "[DaemonServer]") {
  shared_ptr<FlakyAcceptSocketHandler> flaky(new FlakyAcceptSocketHandler(3));
  RunningDaemon daemon(flaky);

  ScriptClient client(shared_ptr<SocketHandler>(new TcpSocketHandler()),
                      daemon.endpoint());
  REQUIRE(client.connect());
  ScriptResponse status = client.serverStatus();
  REQUIRE(status.success());
  REQUIRE(flaky->failures == 0);
  REQUIRE(daemon.server->getState() == ServerState::ACCEPTING);
  client.close();
}

TEST_CASE("Stopping before listening is safe", "[DaemonServer]") {
  DaemonServer server(shared_ptr<SocketHandler>(new TcpSocketHandler()),
                      SocketEndpoint(pickFreePort()));
  server.stop();
  server.stop();
  REQUIRE(server.isStopped());
  server.listen();
  server.run();
  REQUIRE(server.getState() == ServerState::STOPPED);
}

TEST_CASE("Devices are refused once the server is stopped", "[DaemonServer]") {
  DaemonServer server(shared_ptr<SocketHandler>(new TcpSocketHandler()),
                      SocketEndpoint(pickFreePort()));
  server.stop();

  auto device = make_shared<FakeDevice>("late");
  server.addDevice(device);
  REQUIRE(server.getDeviceCount() == 0);
  REQUIRE(device->isStopped());
  REQUIRE(device->getCloseCalls() == 1);
}
}  // namespace pcd
