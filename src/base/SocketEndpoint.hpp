#ifndef __MW_SOCKET_ENDPOINT__
#define __MW_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace mw {
/**
 * @brief Host/port pair identifying the messaging server.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), port(-1) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getPort() >= 0) {
    return os << self.getName() << ":" << self.getPort();
  }
  return os << self.getName();
}
}  // namespace mw

#endif  // __MW_SOCKET_ENDPOINT__
