#ifndef __MW_TCP_SOCKET_HANDLER__
#define __MW_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace mw {
/**
 * @brief Opens IPv4/IPv6 client connections on top of UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects non-blockingly to the
   * server, waiting up to three seconds per address.
   */
  virtual int connect(const SocketEndpoint& endpoint);

 protected:
  /**
   * @brief Adds TCP_NODELAY so small frames are not held back by Nagle.
   */
  virtual void initSocket(int fd);

  /** @brief Serializes connect() calls. */
  recursive_mutex connectMutex;
};
}  // namespace mw

#endif  // __MW_TCP_SOCKET_HANDLER__
