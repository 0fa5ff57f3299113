#ifndef __PCD_DEVICE_REGISTRY__
#define __PCD_DEVICE_REGISTRY__

#include "Device.hpp"
#include "Headers.hpp"

namespace pcd {
/**
 * @brief Thread-safe map from unique identifier to the live Device session.
 *
 * Holds at most one device per identifier.  Every removal path goes through
 * eviction: the entry is erased, then the device is stopped and its socket
 * closed.  A device whose stop() or closeSocket() throws is still removed.
 */
class DeviceRegistry {
 public:
  DeviceRegistry();
  ~DeviceRegistry();

  /**
   * @brief Registers the device, evicting any device already registered with
   * the same identifier.  Stamps the device's connection time.
   */
  void insert(shared_ptr<Device> device);

  /**
   * @brief Returns the registered device if it is still active.  An inactive
   * entry is evicted and nullptr is returned.
   */
  shared_ptr<Device> lookup(const string& uniqueIdentifier);

  /**
   * @brief Evicts the device registered under the identifier.
   * @return false when nothing was registered.
   */
  bool remove(const string& uniqueIdentifier);

  /**
   * @brief Evicts the device only if it is the instance currently registered
   * under its identifier.  Otherwise the device is stopped and closed but the
   * registry is left untouched.
   * @return true when the registry entry was removed.
   */
  bool remove(shared_ptr<Device> device);

  /** @brief Evicts every registered device. */
  void removeAll();

  int count();

  /** @brief Snapshot of the registered devices, active or not. */
  vector<shared_ptr<Device>> list();

 protected:
  void evict(unordered_map<string, shared_ptr<Device>>::iterator it);

  /** @brief Stops and closes a device, logging instead of propagating. */
  static void stopAndClose(const shared_ptr<Device>& device);

  unordered_map<string, shared_ptr<Device>> devices;
  recursive_mutex registryMutex;
};
}  // namespace pcd

#endif  // __PCD_DEVICE_REGISTRY__
