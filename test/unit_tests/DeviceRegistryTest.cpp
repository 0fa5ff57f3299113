#include "DeviceRegistry.hpp"
#include "FakeDevice.hpp"
#include "TestHeaders.hpp"

using namespace pcd;

TEST_CASE("Registering a second device with the same id evicts the first",
          "[DeviceRegistry]") {
  DeviceRegistry registry;
  auto first = make_shared<FakeDevice>("A");
  auto second = make_shared<FakeDevice>("A");

  registry.insert(first);
  REQUIRE(registry.count() == 1);
  registry.insert(second);

  REQUIRE(registry.count() == 1);
  REQUIRE(first->getStopCalls() == 1);
  REQUIRE(first->getCloseCalls() == 1);
  REQUIRE(second->getStopCalls() == 0);
  REQUIRE(registry.lookup("A") == second);
}

TEST_CASE("Inserting the registered instance again is a no-op",
          "[DeviceRegistry]") {
  DeviceRegistry registry;
  auto device = make_shared<FakeDevice>("A");
  registry.insert(device);
  registry.insert(device);
  REQUIRE(registry.count() == 1);
  REQUIRE(device->getStopCalls() == 0);
  REQUIRE(registry.lookup("A") == device);
}

TEST_CASE("Insert stamps the connection time", "[DeviceRegistry]") {
  DeviceRegistry registry;
  auto device = make_shared<FakeDevice>("A");
  device->setTimestampConnected(0);
  int64_t before = nowMillis();
  registry.insert(device);
  REQUIRE(device->getTimestampConnected() >= before);
}

TEST_CASE("Lookup evicts inactive devices", "[DeviceRegistry]") {
  DeviceRegistry registry;
  auto live = make_shared<FakeDevice>("live");
  auto dead = make_shared<FakeDevice>("dead");
  registry.insert(live);
  registry.insert(dead);
  dead->dropConnection();

  REQUIRE(registry.lookup("live") == live);
  REQUIRE(registry.count() == 2);

  REQUIRE(registry.lookup("dead") == nullptr);
  REQUIRE(registry.count() == 1);
  REQUIRE(dead->getStopCalls() == 1);
  REQUIRE(dead->getCloseCalls() == 1);

  REQUIRE(registry.lookup("missing") == nullptr);
}

TEST_CASE("Removing by id is idempotent", "[DeviceRegistry]") {
  DeviceRegistry registry;
  auto device = make_shared<FakeDevice>("A");
  registry.insert(device);

  REQUIRE(registry.remove("A"));
  REQUIRE(registry.count() == 0);
  REQUIRE(device->getStopCalls() == 1);
  REQUIRE(device->getCloseCalls() == 1);

  REQUIRE_FALSE(registry.remove("A"));
  REQUIRE(device->getStopCalls() == 1);
}

TEST_CASE("Removing a replaced instance keeps its replacement",
          "[DeviceRegistry]") {
  DeviceRegistry registry;
  auto first = make_shared<FakeDevice>("A");
  auto second = make_shared<FakeDevice>("A");
  registry.insert(first);
  registry.insert(second);

  // The first session ending late must not evict the second
  REQUIRE_FALSE(registry.remove(first));
  REQUIRE(registry.count() == 1);
  REQUIRE(registry.lookup("A") == second);
  REQUIRE(second->getStopCalls() == 0);

  REQUIRE(registry.remove(second));
  REQUIRE(registry.count() == 0);
  REQUIRE(second->getStopCalls() == 1);
}

TEST_CASE("removeAll evicts every device even when some fail",
          "[DeviceRegistry]") {
  DeviceRegistry registry;
  vector<shared_ptr<FakeDevice>> devices;
  for (int i = 0; i < 5; i++) {
    devices.push_back(make_shared<FakeDevice>("device-" + to_string(i)));
    registry.insert(devices.back());
  }
  devices[1]->setThrowOnStop(true);
  devices[2]->setThrowOnClose(true);
  devices[3]->dropConnection();

  registry.removeAll();

  REQUIRE(registry.count() == 0);
  for (auto& device : devices) {
    REQUIRE(device->getStopCalls() == 1);
    REQUIRE(device->getCloseCalls() == 1);
  }
}

TEST_CASE("list returns a snapshot", "[DeviceRegistry]") {
  DeviceRegistry registry;
  registry.insert(make_shared<FakeDevice>("A"));
  registry.insert(make_shared<FakeDevice>("B"));

  auto snapshot = registry.list();
  REQUIRE(snapshot.size() == 2);
  registry.removeAll();
  REQUIRE(snapshot.size() == 2);

  set<string> ids;
  for (auto& device : snapshot) {
    ids.insert(device->getUniqueIdentifier());
  }
  REQUIRE(ids == set<string>({"A", "B"}));
}

TEST_CASE("Concurrent inserts keep one device per id", "[DeviceRegistry]") {
  DeviceRegistry registry;
  vector<thread> threads;
  for (int t = 0; t < 4; t++) {
    threads.push_back(thread([&registry]() {
      for (int i = 0; i < 50; i++) {
        registry.insert(make_shared<FakeDevice>("id-" + to_string(i % 10)));
        registry.lookup("id-" + to_string((i + 3) % 10));
      }
    }));
  }
  for (auto& t : threads) {
    t.join();
  }
  REQUIRE(registry.count() == 10);
  registry.removeAll();
}
