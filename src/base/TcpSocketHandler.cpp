#include "TcpSocketHandler.hpp"

namespace mw {
TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(connectMutex);
  int sockFd = -1;
  addrinfo *results = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_CANONNAME | AI_V4MAPPED | AI_ADDRCONFIG);
  std::string portname = std::to_string(endpoint.getPort());
  std::string hostname = endpoint.getName();

  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  // loop through all the results and connect to the first we can
  for (addrinfo *p = results; p != NULL; p = p->ai_next) {
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }

    // Nonblocking connect so an unreachable address cannot hang us
    {
      int opts = fcntl(sockFd, F_GETFL);
      FATAL_FAIL(opts);
      FATAL_FAIL(fcntl(sockFd, F_SETFL, opts | O_NONBLOCK));
    }
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1 &&
        errno != EINPROGRESS) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << errno << " "
                << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }

    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(sockFd, &fdset);
    timeval tv;
    tv.tv_sec = 3; /* 3 second timeout */
    tv.tv_usec = 0;
    VLOG(4) << "Before selecting sockFd";
    select(sockFd + 1, NULL, &fdset, NULL, &tv);

    int so_error = ETIMEDOUT;
    if (FD_ISSET(sockFd, &fdset)) {
      socklen_t len = sizeof so_error;
      FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &so_error, &len));
    }
    if (so_error == 0) {
      LOG(INFO) << "Connected to server: " << endpoint << " using fd "
                << sockFd;
      break;
    }
    LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error << " "
              << strerror(so_error);
    ::close(sockFd);
    sockFd = -1;
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(ERROR) << "Could not connect to " << endpoint;
    return -1;
  }
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace mw
