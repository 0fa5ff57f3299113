#include "ConnectionClassifier.hpp"

#include "NetworkUtils.hpp"

namespace pcd {
ConnectionType classifyConnection(const string& peerAddress,
                                  bool allowRemoteOverride,
                                  const string& localAddress) {
  if (allowRemoteOverride) {
    return ConnectionType::REMOTE_DEVICE;
  }
  if (NetworkUtils::isLoopbackAddress(peerAddress) ||
      NetworkUtils::sameAddress(peerAddress, localAddress)) {
    return ConnectionType::LOCAL_SCRIPT;
  }
  return ConnectionType::REMOTE_DEVICE;
}
}  // namespace pcd
