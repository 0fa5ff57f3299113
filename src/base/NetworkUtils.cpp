#include "NetworkUtils.hpp"

namespace pcd {
string NetworkUtils::resolveLocalAddress() {
  char hostname[256];
  memset(hostname, 0, sizeof(hostname));
  if (::gethostname(hostname, sizeof(hostname) - 1) == -1) {
    LOG(ERROR) << "Unable to get the host name: " << strerror(GetErrno());
    return "";
  }

  addrinfo hints;
  addrinfo* results = NULL;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  int rc = getaddrinfo(hostname, NULL, &hints, &results);
  if (rc != 0) {
    LOG(ERROR) << "Unable to resolve host name " << hostname << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return "";
  }

  // Prefer the first IPv4 result, fall back to whatever came first.
  addrinfo* chosen = results;
  for (addrinfo* p = results; p != NULL; p = p->ai_next) {
    if (p->ai_family == AF_INET) {
      chosen = p;
      break;
    }
  }
  string address;
  if (chosen != NULL) {
    char host[NI_MAXHOST];
    if (getnameinfo(chosen->ai_addr, chosen->ai_addrlen, host, sizeof(host),
                    NULL, 0, NI_NUMERICHOST) == 0) {
      address = normalizeAddress(host);
    }
  }
  freeaddrinfo(results);
  VLOG(1) << "Local address for " << hostname << " is " << address;
  return address;
}

string NetworkUtils::normalizeAddress(const string& address) {
  in_addr v4;
  if (inet_pton(AF_INET, address.c_str(), &v4) == 1) {
    char buf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &v4, buf, sizeof(buf));
    return string(buf);
  }
  in6_addr v6;
  if (inet_pton(AF_INET6, address.c_str(), &v6) == 1) {
    char buf[INET6_ADDRSTRLEN];
    if (IN6_IS_ADDR_V4MAPPED(&v6)) {
      inet_ntop(AF_INET, &v6.s6_addr[12], buf, sizeof(buf));
    } else {
      inet_ntop(AF_INET6, &v6, buf, sizeof(buf));
    }
    return string(buf);
  }
  return address;
}

bool NetworkUtils::isLoopbackAddress(const string& address) {
  string normalized = normalizeAddress(address);
  in_addr v4;
  if (inet_pton(AF_INET, normalized.c_str(), &v4) == 1) {
    return (ntohl(v4.s_addr) >> 24) == 127;
  }
  in6_addr v6;
  if (inet_pton(AF_INET6, normalized.c_str(), &v6) == 1) {
    return IN6_IS_ADDR_LOOPBACK(&v6);
  }
  return false;
}

bool NetworkUtils::sameAddress(const string& a, const string& b) {
  return normalizeAddress(a) == normalizeAddress(b);
}
}  // namespace pcd
