#include "DeviceSession.hpp"
#include "LoopbackConnection.hpp"
#include "TestHeaders.hpp"

#include <sys/resource.h>

using namespace pcd;

namespace {
shared_ptr<DeviceSession> makeSession(LoopbackConnection& connection) {
  return make_shared<DeviceSession>(connection.serverHandler, "pc-1", "den",
                                    "127.0.0.1", connection.serverFd);
}

void sendPacket(LoopbackConnection& connection, DevicePacketType type,
                const string& payload = "") {
  DevicePacket packet;
  packet.set_type(type);
  packet.set_payload(payload);
  connection.clientHandler->writeProto(connection.clientFd, packet, true);
}
}  // namespace

TEST_CASE("Keepalives are echoed and goodbye ends the session",
          "[DeviceSession]") {
  LoopbackConnection connection;
  auto session = makeSession(connection);
  REQUIRE(session->isActive());
  thread sessionThread([session]() { session->run(); });

  sendPacket(connection, KEEP_ALIVE);
  DevicePacket reply = connection.clientHandler->readProto<DevicePacket>(
      connection.clientFd, true);
  REQUIRE(reply.type() == KEEP_ALIVE);

  sendPacket(connection, MESSAGE, "hello daemon");
  sendPacket(connection, GOODBYE);
  sessionThread.join();

  REQUIRE_FALSE(session->isActive());
  REQUIRE(session->getSocketFd() == -1);
}

TEST_CASE("A peer disconnect ends the session", "[DeviceSession]") {
  LoopbackConnection connection;
  auto session = makeSession(connection);
  thread sessionThread([session]() { session->run(); });

  connection.clientHandler->close(connection.clientFd);
  sessionThread.join();
  REQUIRE_FALSE(session->isActive());
}

TEST_CASE("Eviction ends the session and the peer sees EOF",
          "[DeviceSession]") {
  LoopbackConnection connection;
  auto session = makeSession(connection);
  thread sessionThread([session]() { session->run(); });

  session->stop();
  session->closeSocket();
  sessionThread.join();

  REQUIRE_FALSE(session->isActive());
  REQUIRE(session->isShuttingDown());
  REQUIRE_THROWS_AS(connection.clientHandler->readProto<DevicePacket>(
                        connection.clientFd, true),
                    std::runtime_error);
}

TEST_CASE("stop and closeSocket are idempotent", "[DeviceSession]") {
  LoopbackConnection connection;
  auto session = makeSession(connection);
  session->stop();
  session->stop();
  session->closeSocket();
  session->closeSocket();
  REQUIRE_FALSE(session->isActive());
  REQUIRE(session->getSocketFd() == -1);
}

TEST_CASE("sendMessage pushes a message packet", "[DeviceSession]") {
  LoopbackConnection connection;
  auto session = makeSession(connection);
  session->sendMessage("turn off");

  DevicePacket packet = connection.clientHandler->readProto<DevicePacket>(
      connection.clientFd, true);
  REQUIRE(packet.type() == MESSAGE);
  REQUIRE(packet.payload() == "turn off");

  session->stop();
  REQUIRE_THROWS_AS(session->sendMessage("too late"), std::runtime_error);
  session->closeSocket();
}

TEST_CASE("An evicted session never reads from a reused descriptor",
          "[DeviceSession]") {
  LoopbackConnection connection;
  auto session = makeSession(connection);
  thread sessionThread([session]() { session->run(); });

  // Leave the session waiting for the body of a packet
  int64_t length = 64;
  connection.clientHandler->writeAllOrThrow(connection.clientFd, &length,
                                            sizeof(int64_t), true);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  session->stop();
  session->closeSocket();

  // A new peer may be handed the same descriptor number
  pair<int, int> next = connection.connectAnother();
  DeviceHello hello;
  hello.set_version(PROTOCOL_VERSION);
  hello.set_uniqueidentifier("pc-2");
  hello.set_name("attic");
  connection.clientHandler->writeProto(next.second, hello, true);

  sessionThread.join();
  REQUIRE(session->getSocketFd() == -1);

  DeviceHello received =
      connection.serverHandler->readProto<DeviceHello>(next.first, true);
  REQUIRE(received.version() == PROTOCOL_VERSION);
  REQUIRE(received.uniqueidentifier() == "pc-2");
  REQUIRE(received.name() == "attic");

  REQUIRE_THROWS_AS(connection.clientHandler->readProto<DevicePacket>(
                        connection.clientFd, true),
                    std::runtime_error);
}

TEST_CASE("Sessions work on descriptors above FD_SETSIZE", "[DeviceSession]") {
  struct rlimit savedLimit;
  REQUIRE(getrlimit(RLIMIT_NOFILE, &savedLimit) == 0);
  rlim_t wanted = FD_SETSIZE + 64;
  if (savedLimit.rlim_cur < wanted) {
    if (savedLimit.rlim_max != RLIM_INFINITY && savedLimit.rlim_max < wanted) {
      WARN("Cannot raise the descriptor limit above " << savedLimit.rlim_max);
      return;
    }
    struct rlimit raised = savedLimit;
    raised.rlim_cur = wanted;
    REQUIRE(setrlimit(RLIMIT_NOFILE, &raised) == 0);
  }

  vector<int> fillers;
  while (true) {
    int fd = ::open("/dev/null", O_RDONLY);
    REQUIRE(fd != -1);
    fillers.push_back(fd);
    if (fd >= FD_SETSIZE) {
      break;
    }
  }

  {
    LoopbackConnection connection;
    REQUIRE(connection.serverFd >= FD_SETSIZE);
    auto session = makeSession(connection);
    thread sessionThread([session]() { session->run(); });

    sendPacket(connection, KEEP_ALIVE);
    DevicePacket reply = connection.clientHandler->readProto<DevicePacket>(
        connection.clientFd, true);
    REQUIRE(reply.type() == KEEP_ALIVE);

    sendPacket(connection, GOODBYE);
    sessionThread.join();
  }

  for (int fd : fillers) {
    ::close(fd);
  }
  setrlimit(RLIMIT_NOFILE, &savedLimit);
}
