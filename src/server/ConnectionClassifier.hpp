#ifndef __PCD_CONNECTION_CLASSIFIER__
#define __PCD_CONNECTION_CLASSIFIER__

#include "Headers.hpp"

namespace pcd {
enum class ConnectionType {
  LOCAL_SCRIPT,
  REMOTE_DEVICE,
};

/**
 * @brief Decides which handler an accepted connection is routed to.
 *
 * With allowRemoteOverride set every connection is a device.  Otherwise a peer
 * on the loopback address, or one whose address is exactly the host's LAN
 * address, is a local script and anything else is a remote device.
 */
ConnectionType classifyConnection(const string& peerAddress,
                                  bool allowRemoteOverride,
                                  const string& localAddress);

inline ostream& operator<<(ostream& os, ConnectionType type) {
  switch (type) {
    case ConnectionType::LOCAL_SCRIPT:
      return os << "LOCAL_SCRIPT";
    case ConnectionType::REMOTE_DEVICE:
      return os << "REMOTE_DEVICE";
  }
  return os << "UNKNOWN";
}
}  // namespace pcd

#endif  // __PCD_CONNECTION_CLASSIFIER__
