#ifndef __MW_CONNECTION__
#define __MW_CONNECTION__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace mw {
/**
 * @brief Owns the single duplex socket a client talks over.
 *
 * Writes are serialized so two callers can never interleave frame bytes on
 * the wire.  Reads are only ever issued by the frame reader.  The socket is
 * closed when the connection is destroyed if nobody closed it earlier.
 */
class Connection {
 public:
  /**
   * @brief Takes ownership of an already connected descriptor.
   */
  Connection(shared_ptr<SocketHandler> _socketHandler, int _socketFd);

  virtual ~Connection();

  /**
   * @brief Writes one frame's text in full.
   * @throws std::runtime_error if the socket is closed or the write fails.
   */
  virtual void writeFrame(const string& text);

  /**
   * @brief Waits at most `timeoutMs` for inbound bytes.
   */
  virtual bool waitForData(int timeoutMs);

  /**
   * @brief Appends whatever bytes are available to `out`.
   * @return false once the stream has ended or failed.
   */
  virtual bool readSome(string* out);

  /**
   * @brief Closes the socket.  Safe to call more than once.
   */
  virtual void closeSocket();

  inline shared_ptr<SocketHandler> getSocketHandler() { return socketHandler; }

  /** @brief File descriptor of the connected socket or -1. */
  int getSocketFd() {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    return socketFd;
  }

  inline bool isDisconnected() { return getSocketFd() == -1; }

 protected:
  /** @brief Socket API used for every read, write and close. */
  shared_ptr<SocketHandler> socketHandler;
  /** @brief Active socket descriptor, -1 once closed. */
  int socketFd;
  /** @brief Held for the duration of a frame write. */
  std::mutex writeMutex;
  /** @brief Guards `socketFd`. */
  recursive_mutex connectionMutex;
};
}  // namespace mw

#endif  // __MW_CONNECTION__
