#ifndef __MW_SOCKET_HANDLER__
#define __MW_SOCKET_HANDLER__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace mw {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  /** @brief Ensures derived handlers can clean up platform-specific resources.
   */
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks for at most the given time until fd becomes readable.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) = 0;
  /**
   * @brief Returns true when the kernel reports data ready to read on a
   * descriptor.
   */
  virtual bool hasData(int fd) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace mw

#endif  // __MW_SOCKET_HANDLER__
