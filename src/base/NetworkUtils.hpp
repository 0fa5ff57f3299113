#ifndef __PCD_NETWORK_UTILS__
#define __PCD_NETWORK_UTILS__

#include "Headers.hpp"

namespace pcd {
/**
 * @brief Numeric address helpers used to tell local peers from remote ones.
 */
class NetworkUtils {
 public:
  /**
   * @brief Resolves the address of this host's name (the LAN address).
   * @return The numeric address, or an empty string when the host name cannot
   * be resolved.
   */
  static string resolveLocalAddress();

  /**
   * @brief Returns the canonical numeric form of an address.  IPv4-mapped IPv6
   * addresses are reduced to IPv4.  Strings that are not numeric addresses are
   * returned unchanged.
   */
  static string normalizeAddress(const string& address);

  /** @brief True for 127.0.0.0/8, ::1 and IPv4-mapped loopback addresses. */
  static bool isLoopbackAddress(const string& address);

  /** @brief Exact address equality after normalization. */
  static bool sameAddress(const string& a, const string& b);
};
}  // namespace pcd
#endif  // __PCD_NETWORK_UTILS__
