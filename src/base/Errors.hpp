#ifndef __MW_ERRORS__
#define __MW_ERRORS__

#include "Headers.hpp"

namespace mw {
/**
 * @brief Thrown when an inbound frame cannot be decoded.  Fatal to the
 * connection: once one frame is bad the stream boundaries cannot be trusted.
 */
class FrameDecodeError : public std::runtime_error {
 public:
  explicit FrameDecodeError(const string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Thrown when a sequence number is registered twice while pending.
 * This means the sequence allocator handed out a duplicate and is a logic
 * fault, not something a caller can recover from.
 */
class DuplicateSequenceError : public std::logic_error {
 public:
  explicit DuplicateSequenceError(int64_t _sequence)
      : std::logic_error("Sequence already pending: " + to_string(_sequence)),
        sequence(_sequence) {}

  int64_t getSequence() const { return sequence; }

 protected:
  int64_t sequence;
};

/**
 * @brief Thrown when an operation needs the authenticated identity before
 * login has completed.
 */
class UnauthenticatedError : public std::runtime_error {
 public:
  UnauthenticatedError()
      : std::runtime_error(
            "No authenticated user found. Please authenticate first.") {}
};

/**
 * @brief Raised when a reply payload carries a server-side error.
 */
class ServerError : public std::runtime_error {
 public:
  ServerError(const string& _error, const string& _title,
              const string& _localizedMessage = "")
      : std::runtime_error(_title + " (" + _error + ")"),
        error(_error),
        title(_title),
        localizedMessage(_localizedMessage) {}

  /** @brief Machine-readable error id, e.g. "verify.code.wrong". */
  const string& getError() const { return error; }
  const string& getTitle() const { return title; }
  const string& getLocalizedMessage() const { return localizedMessage; }

 protected:
  string error;
  string title;
  string localizedMessage;
};
}  // namespace mw

#endif  // __MW_ERRORS__
