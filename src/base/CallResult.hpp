#ifndef __MW_CALL_RESULT__
#define __MW_CALL_RESULT__

#include "Frame.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace mw {
/** @brief How a correlated call finished. */
enum class CallStatus {
  OK = 0,
  TIMEOUT = 1,
  CONNECTION_CLOSED = 2,
};

inline string callStatusToString(CallStatus status) {
  switch (status) {
    case CallStatus::OK:
      return "Ok";
    case CallStatus::TIMEOUT:
      return "Timeout";
    case CallStatus::CONNECTION_CLOSED:
      return "ConnectionClosed";
  }
  return "Unknown";
}

/**
 * @brief Outcome of a correlated call.  Timeouts and closed connections are
 * expected outcomes and travel here instead of as exceptions.
 */
class CallResult {
 public:
  CallResult()
      : status(CallStatus::OK),
        command(FRAME_COMMAND_RESPONSE),
        payload(json::object()) {}

  /** @brief A reply frame arrived for the call. */
  static CallResult reply(int command, const json& payload) {
    CallResult result;
    result.command = command;
    result.payload = payload;
    return result;
  }

  /** @brief The call ended without a reply. */
  static CallResult failure(CallStatus status, const string& error) {
    CallResult result;
    result.status = status;
    result.error = error;
    return result;
  }

  bool ok() const { return status == CallStatus::OK; }
  CallStatus getStatus() const { return status; }
  /** @brief `cmd` of the reply frame (response or error). */
  int getCommand() const { return command; }
  const json& getPayload() const { return payload; }
  /** @brief Why the call failed; empty on success. */
  const string& getError() const { return error; }

 protected:
  CallStatus status;
  int command;
  json payload;
  string error;
};

/**
 * @brief Thrown by typed client operations when a correlated call did not
 * produce a reply.
 */
class CallError : public std::runtime_error {
 public:
  explicit CallError(const CallResult& result)
      : std::runtime_error(callStatusToString(result.getStatus()) + ": " +
                           result.getError()),
        status(result.getStatus()) {}

  CallStatus getStatus() const { return status; }

 protected:
  CallStatus status;
};
}  // namespace mw

#endif  // __MW_CALL_RESULT__
