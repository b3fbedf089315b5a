#ifndef __MW_FAKE_SERVER__
#define __MW_FAKE_SERVER__

#include "Frame.hpp"
#include "FrameSplitter.hpp"
#include "Headers.hpp"
#include "UnixSocketHandler.hpp"

namespace mw {
// Socket handler whose connect() hands out one end of a fresh socketpair.
// The other end is kept for a FakeServer to drive.
class SocketPairHandler : public UnixSocketHandler {
 public:
  int connect(const SocketEndpoint&) override {
    int fds[2];
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    addToActiveSockets(fds[0]);
    initSocket(fds[0]);
    lock_guard<std::mutex> guard(serverFdMutex);
    serverFds.push_back(fds[1]);
    return fds[0];
  }

  // Server end of the most recent connect(), or -1.
  int takeServerFd() {
    lock_guard<std::mutex> guard(serverFdMutex);
    if (serverFds.empty()) {
      return -1;
    }
    int fd = serverFds.front();
    serverFds.pop_front();
    return fd;
  }

 private:
  std::deque<int> serverFds;
  std::mutex serverFdMutex;
};

// Scripted peer on the blocking server end of a socketpair.
class FakeServer {
 public:
  explicit FakeServer(int _fd) : fd(_fd) {}

  ~FakeServer() { close(); }

  Frame readFrame(int timeoutMs = 5000) {
    return Frame::parse(readFrameText(timeoutMs));
  }

  json readFrameJson(int timeoutMs = 5000) {
    return json::parse(readFrameText(timeoutMs));
  }

  string readFrameText(int timeoutMs = 5000) {
    string text;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeoutMs);
    while (!splitter.next(&text)) {
      if (std::chrono::steady_clock::now() > deadline) {
        throw std::runtime_error("Timed out waiting for a frame");
      }
      fd_set input;
      FD_ZERO(&input);
      FD_SET(fd, &input);
      timeval tv = {0, 50 * 1000};
      if (select(fd + 1, &input, NULL, NULL, &tv) <= 0) {
        continue;
      }
      char buf[4096];
      ssize_t n = ::read(fd, buf, sizeof(buf));
      if (n <= 0) {
        throw std::runtime_error("Client closed the stream");
      }
      splitter.feed(buf, n);
    }
    return text;
  }

  // True when nothing arrives within `timeoutMs`.
  bool isQuiet(int timeoutMs) {
    try {
      readFrameText(timeoutMs);
    } catch (const std::runtime_error&) {
      return true;
    }
    return false;
  }

  void sendRaw(const string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
      ssize_t n = ::write(fd, text.data() + pos, text.size() - pos);
      if (n <= 0) {
        throw std::runtime_error("Write to client failed");
      }
      pos += n;
    }
  }

  void sendFrame(const Frame& frame) { sendRaw(frame.serialize()); }

  void replyTo(const Frame& request, const json& payload,
               int command = FRAME_COMMAND_RESPONSE) {
    sendFrame(
        Frame(command, request.getSequence(), request.getOpcode(), payload));
  }

  void push(int64_t sequence, int opcode, const json& payload) {
    sendFrame(Frame(FRAME_COMMAND_REQUEST, sequence, opcode, payload));
  }

  void close() {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }

 private:
  int fd;
  FrameSplitter splitter;
};

// Polls `condition` for up to five seconds.
template <class F>
bool waitFor(F condition, int timeoutMs = 5000) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}
}  // namespace mw

#endif  // __MW_FAKE_SERVER__
