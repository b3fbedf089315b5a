#ifndef __MW_HEADERS__
#define __MW_HEADERS__

#if __APPLE__
#include <sys/ucred.h>
#endif

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <pthread.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ThreadPool.h"
#include "easylogging++.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// The wire protocol version spoken by this client
static const int PROTOCOL_VERSION = 11;

// Largest JSON frame we are willing to buffer before giving up on the stream
const int64_t MAX_FRAME_SIZE = 128 * 1024 * 1024;

// How long the frame reader waits for bytes before re-checking its state
const int READER_POLL_INTERVAL_MS = 100;

// Default deadline for correlated requests
const int DEFAULT_REQUEST_TIMEOUT_MS = 10 * 1000;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef MW_VERSION
#define MW_VERSION "unknown"
#endif

namespace mw {
/** @brief ASCII lower-casing used by the text and command filters. */
inline string toLowerAscii(const string &s) {
  string retval(s);
  for (auto &c : retval) {
    if (c >= 'A' && c <= 'Z') {
      c = char(c - 'A' + 'a');
    }
  }
  return retval;
}

/** @brief Wall-clock milliseconds since the epoch (client message ids). */
inline int64_t currentTimeMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace mw

#endif  // __MW_HEADERS__
