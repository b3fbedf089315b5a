#include "Connection.hpp"

namespace mw {
namespace {
const size_t READ_CHUNK_SIZE = 64 * 1024;

inline bool isRetryableError(int err_no) {
  return (err_no == EAGAIN || err_no == EWOULDBLOCK || err_no == EINTR);
}
}  // namespace

Connection::Connection(shared_ptr<SocketHandler> _socketHandler,
                       int _socketFd)
    : socketHandler(_socketHandler), socketFd(_socketFd) {}

Connection::~Connection() {
  if (socketFd != -1) {
    LOG(INFO) << "Connection destroyed";
    closeSocket();
  }
}

void Connection::writeFrame(const string& text) {
  lock_guard<std::mutex> writeGuard(writeMutex);
  int fd = getSocketFd();
  if (fd == -1) {
    throw std::runtime_error("Tried to write a frame to a closed connection");
  }
  VLOG(2) << "Writing frame: " << text;
  socketHandler->writeAllOrThrow(fd, text.data(), text.size(), true);
}

bool Connection::waitForData(int timeoutMs) {
  int fd = getSocketFd();
  if (fd == -1) {
    return false;
  }
  return socketHandler->waitForData(fd, timeoutMs / 1000,
                                    (timeoutMs % 1000) * 1000);
}

bool Connection::readSome(string* out) {
  int fd = getSocketFd();
  if (fd == -1) {
    return false;
  }
  char buf[READ_CHUNK_SIZE];
  ssize_t bytesRead = socketHandler->read(fd, buf, sizeof(buf));
  if (bytesRead > 0) {
    out->append(buf, bytesRead);
    return true;
  }
  if (bytesRead == 0) {
    LOG(INFO) << "Remote side closed the connection on fd " << fd;
    return false;
  }
  auto localErrno = errno;
  if (isRetryableError(localErrno)) {
    return true;
  }
  LOG(WARNING) << "Read failed on fd " << fd << ": " << localErrno << " "
               << strerror(localErrno);
  return false;
}

void Connection::closeSocket() {
  // Let an in-flight frame finish before the descriptor goes away
  lock_guard<std::mutex> writeGuard(writeMutex);
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (socketFd == -1) {
    VLOG(1) << "Tried to close a dead socket";
    return;
  }
  int fd = socketFd;
  socketFd = -1;
  socketHandler->close(fd);
  VLOG(1) << "Closed socket";
}
}  // namespace mw
