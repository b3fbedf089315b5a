#ifndef __MW_PENDING_REQUEST_TABLE__
#define __MW_PENDING_REQUEST_TABLE__

#include "CallResult.hpp"
#include "Errors.hpp"
#include "Headers.hpp"

namespace mw {
/**
 * @brief Tracks correlated calls that are waiting for their reply frame.
 *
 * Every entry is removed and resolved exactly once.  Whichever of resolve(),
 * expire() or cancelAll() removes an entry first fulfils its slot; the others
 * find nothing and return false.
 */
class PendingRequestTable {
 public:
  typedef std::chrono::steady_clock::time_point Deadline;

  PendingRequestTable();

  /**
   * @brief Adds a pending entry for `sequence` and returns the future the
   * caller blocks on.  Once the table is closed the future is already
   * resolved with CONNECTION_CLOSED.
   * @throws DuplicateSequenceError if `sequence` is already pending.
   */
  std::future<CallResult> registerRequest(
      int64_t sequence, std::optional<Deadline> deadline = std::nullopt);

  /**
   * @brief Delivers a reply to the caller waiting on `sequence`.
   * @return false if nothing is pending under that sequence.
   */
  bool resolve(int64_t sequence, int command, const json& payload);

  /**
   * @brief Resolves the entry with a TIMEOUT failure.
   * @return false if the entry was already resolved.
   */
  bool expire(int64_t sequence);

  /**
   * @brief Resolves one entry with CONNECTION_CLOSED, e.g. when its request
   * frame could not be written.
   * @return false if the entry was already resolved.
   */
  bool cancel(int64_t sequence, const string& reason);

  /**
   * @brief Expires every entry whose deadline is at or before `now`.
   * @return The number of entries expired.
   */
  int expireOverdue(Deadline now);

  /**
   * @brief Fails every outstanding call with CONNECTION_CLOSED and refuses
   * new registrations until reopen().
   */
  void cancelAll(const string& reason);

  /** @brief Accepts registrations again after a cancelAll(). */
  void reopen();

  bool isClosed();

  int size();

 protected:
  struct PendingRequest {
    int64_t sequence;
    std::promise<CallResult> resultSlot;
    std::optional<Deadline> deadline;
  };

  /** @brief Detaches an entry so it can be fulfilled outside the lock. */
  shared_ptr<PendingRequest> take(int64_t sequence);

  /** @brief In-flight calls keyed by sequence number. */
  unordered_map<int64_t, shared_ptr<PendingRequest>> pending;
  /** @brief Set by cancelAll() and cleared by reopen(). */
  bool closed;
  /** @brief Reason handed to calls registered while closed. */
  string closedReason;
  /** @brief Guards all table state. */
  std::mutex tableMutex;
};
}  // namespace mw

#endif  // __MW_PENDING_REQUEST_TABLE__
