#ifndef __PCD_DEVICE__
#define __PCD_DEVICE__

#include "Headers.hpp"

namespace pcd {
/**
 * @brief A remote peer session that can be tracked by the DeviceRegistry.
 *
 * The identifier is fixed for the life of the object.  stop() and
 * closeSocket() must be safe to call more than once and from any thread,
 * since both the registry (on eviction) and the session itself (on natural
 * termination) call them.
 */
class Device {
 public:
  explicit Device(const string& _uniqueIdentifier)
      : uniqueIdentifier(_uniqueIdentifier), timestampConnected(nowMillis()) {}

  virtual ~Device() {}

  inline const string& getUniqueIdentifier() const { return uniqueIdentifier; }

  /** @brief Milliseconds since epoch when the device was registered. */
  inline int64_t getTimestampConnected() const { return timestampConnected; }

  inline void setTimestampConnected(int64_t timestamp) {
    timestampConnected = timestamp;
  }

  /** @brief False once the transport is unusable or the device was stopped. */
  virtual bool isActive() = 0;

  /** @brief Signals the session logic to terminate. */
  virtual void stop() = 0;

  /** @brief Releases the transport. */
  virtual void closeSocket() = 0;

  /**
   * @brief Session entry point.  Runs on a thread of its own until the
   * device disconnects or is stopped.
   */
  virtual void run() = 0;

 protected:
  const string uniqueIdentifier;
  std::atomic<int64_t> timestampConnected;
};
}  // namespace pcd

#endif  // __PCD_DEVICE__
