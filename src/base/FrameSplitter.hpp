#ifndef __MW_FRAME_SPLITTER__
#define __MW_FRAME_SPLITTER__

#include "Errors.hpp"
#include "Headers.hpp"

namespace mw {
/**
 * @brief Cuts an inbound byte stream into complete top-level JSON objects.
 *
 * Frames carry no length prefix or delimiter, so the splitter tracks brace
 * depth, string literals and escapes to find where each object ends.
 */
class FrameSplitter {
 public:
  FrameSplitter();

  /**
   * @brief Appends raw bytes read from the socket.
   * @throws FrameDecodeError on bytes outside an object or an oversized frame.
   */
  void feed(const char* buf, size_t count);

  inline void feed(const string& s) { feed(s.data(), s.size()); }

  /**
   * @brief Pops the next complete object text.
   * @return false when no complete frame is buffered.
   */
  bool next(string* frameText);

  /** @brief Bytes of the partial frame still waiting for its end. */
  size_t bufferedBytes() const { return current.size(); }

  /** @brief Drops all state, e.g. after the stream has been reset. */
  void clear();

 protected:
  /** @brief Complete frames not yet handed out. */
  std::deque<string> ready;
  /** @brief The object currently being assembled. */
  string current;
  /** @brief Brace/bracket nesting depth inside `current`. */
  int depth;
  bool inString;
  bool escaped;
};
}  // namespace mw

#endif  // __MW_FRAME_SPLITTER__
