#include "FrameSplitter.hpp"

namespace mw {
FrameSplitter::FrameSplitter() : depth(0), inString(false), escaped(false) {}

void FrameSplitter::feed(const char* buf, size_t count) {
  for (size_t i = 0; i < count; i++) {
    char c = buf[i];
    if (depth == 0) {
      if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
        continue;
      }
      if (c != '{') {
        throw FrameDecodeError(string("Unexpected byte between frames: ") +
                               to_string(int((unsigned char)c)));
      }
      current.push_back(c);
      depth = 1;
      continue;
    }

    current.push_back(c);
    if (inString) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        inString = false;
      }
      continue;
    }

    switch (c) {
      case '"':
        inString = true;
        break;
      case '{':
      case '[':
        depth++;
        break;
      case '}':
      case ']':
        depth--;
        if (depth == 0) {
          VLOG(4) << "Split frame of " << current.size() << " bytes";
          ready.push_back(std::move(current));
          current.clear();
        }
        break;
      default:
        break;
    }
  }

  if (int64_t(current.size()) > MAX_FRAME_SIZE) {
    string s("Frame exceeds maximum size (>128 MB): ");
    s += to_string(current.size());
    throw FrameDecodeError(s);
  }
}

bool FrameSplitter::next(string* frameText) {
  if (ready.empty()) {
    return false;
  }
  *frameText = std::move(ready.front());
  ready.pop_front();
  return true;
}

void FrameSplitter::clear() {
  ready.clear();
  current.clear();
  depth = 0;
  inString = false;
  escaped = false;
}
}  // namespace mw
