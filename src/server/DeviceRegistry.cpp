#include "DeviceRegistry.hpp"

namespace pcd {
DeviceRegistry::DeviceRegistry() {}

DeviceRegistry::~DeviceRegistry() {
  lock_guard<recursive_mutex> guard(registryMutex);
  if (!devices.empty()) {
    LOG(WARNING) << "Destroying a registry with " << devices.size()
                 << " devices still registered";
  }
}

void DeviceRegistry::insert(shared_ptr<Device> device) {
  lock_guard<recursive_mutex> guard(registryMutex);
  const string& id = device->getUniqueIdentifier();
  auto it = devices.find(id);
  if (it != devices.end()) {
    if (it->second == device) {
      VLOG(1) << "Device " << id << " is already registered";
      return;
    }
    LOG(INFO) << "Device with uniqueIdentifier = " << id
              << " already in list.";
    evict(it);
  }
  device->setTimestampConnected(nowMillis());
  devices.insert(make_pair(id, device));
  VLOG(1) << "Registered device " << id << ", " << devices.size()
          << " devices connected";
}

shared_ptr<Device> DeviceRegistry::lookup(const string& uniqueIdentifier) {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = devices.find(uniqueIdentifier);
  if (it == devices.end()) {
    return shared_ptr<Device>();
  }
  if (it->second->isActive()) {
    return it->second;
  }
  LOG(INFO) << "Device with uniqueIdentifier = " << uniqueIdentifier
            << " found, but not active";
  evict(it);
  return shared_ptr<Device>();
}

bool DeviceRegistry::remove(const string& uniqueIdentifier) {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = devices.find(uniqueIdentifier);
  if (it == devices.end()) {
    return false;
  }
  evict(it);
  return true;
}

bool DeviceRegistry::remove(shared_ptr<Device> device) {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = devices.find(device->getUniqueIdentifier());
  if (it != devices.end() && it->second == device) {
    evict(it);
    return true;
  }
  VLOG(1) << "Device " << device->getUniqueIdentifier()
          << " is not the registered instance, closing it only";
  stopAndClose(device);
  return false;
}

void DeviceRegistry::removeAll() {
  lock_guard<recursive_mutex> guard(registryMutex);
  LOG(INFO) << "Removing all " << devices.size() << " devices";
  while (!devices.empty()) {
    evict(devices.begin());
  }
}

int DeviceRegistry::count() {
  lock_guard<recursive_mutex> guard(registryMutex);
  return int(devices.size());
}

vector<shared_ptr<Device>> DeviceRegistry::list() {
  lock_guard<recursive_mutex> guard(registryMutex);
  vector<shared_ptr<Device>> snapshot;
  snapshot.reserve(devices.size());
  for (const auto& it : devices) {
    snapshot.push_back(it.second);
  }
  return snapshot;
}

void DeviceRegistry::evict(
    unordered_map<string, shared_ptr<Device>>::iterator it) {
  // Keep the device alive past the erase
  shared_ptr<Device> device = it->second;
  LOG(INFO) << "Removing device with uniqueIdentifier = "
            << device->getUniqueIdentifier() << ", connected since "
            << timestampDifferenceNow(device->getTimestampConnected());
  devices.erase(it);
  stopAndClose(device);
}

void DeviceRegistry::stopAndClose(const shared_ptr<Device>& device) {
  try {
    device->stop();
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error stopping device " << device->getUniqueIdentifier()
               << ": " << e.what();
  }
  try {
    device->closeSocket();
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error closing device " << device->getUniqueIdentifier()
               << ": " << e.what();
  }
}
}  // namespace pcd
