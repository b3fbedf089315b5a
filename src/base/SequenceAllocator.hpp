#ifndef __MW_SEQUENCE_ALLOCATOR__
#define __MW_SEQUENCE_ALLOCATOR__

#include "Headers.hpp"

namespace mw {
/**
 * @brief Hands out the `seq` of every outbound frame.
 *
 * Values are strictly increasing for the lifetime of a connection and no two
 * callers ever observe the same value.  Reply correlation depends on that.
 */
class SequenceAllocator {
 public:
  static constexpr int64_t INITIAL_SEQUENCE = 0;

  SequenceAllocator() : counter(INITIAL_SEQUENCE) {}

  /** @brief Returns the next unused sequence number. */
  int64_t next() { return counter.fetch_add(1); }

  /** @brief Peeks at the value the next call to next() would return. */
  int64_t peek() const { return counter.load(); }

  /**
   * @brief Rewinds to the initial value.  Only valid on a full reconnect,
   * when nothing is pending.
   */
  void reset() { counter.store(INITIAL_SEQUENCE); }

 protected:
  std::atomic<int64_t> counter;
};
}  // namespace mw

#endif  // __MW_SEQUENCE_ALLOCATOR__
