#ifndef __PCD_SOCKET_ENDPOINT__
#define __PCD_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace pcd {
class SocketEndpoint {
 public:
  explicit SocketEndpoint(int _port) : name(""), port(_port) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getPort() >= 0) {
    return os << self.getName() << ":" << self.getPort(), os;
  } else {
    return os << self.getName(), os;
  }
}
}  // namespace pcd

#endif  // __PCD_SOCKET_ENDPOINT__
