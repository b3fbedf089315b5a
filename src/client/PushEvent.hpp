#ifndef __MW_PUSH_EVENT__
#define __MW_PUSH_EVENT__

#include "Domain.hpp"
#include "Frame.hpp"
#include "Headers.hpp"
#include "Opcodes.hpp"

namespace mw {
/**
 * @brief A server-initiated frame handed to the handler registry.
 */
struct PushEvent {
  int opcode = -1;
  int64_t sequence = -1;
  json payload = json::object();
  /** @brief Decoded message for new-message notifications. */
  std::optional<Message> message;

  /**
   * @brief Wraps a decoded frame, decoding the message of a notification
   * when it has one.
   */
  static PushEvent fromFrame(const Frame& frame) {
    PushEvent event;
    event.opcode = frame.getOpcode();
    event.sequence = frame.getSequence();
    event.payload = frame.getPayload();
    if (event.opcode == OPCODE_NOTIF_MESSAGE && event.payload.is_object()) {
      auto messageIt = event.payload.find("message");
      if (messageIt != event.payload.end() && messageIt->is_object()) {
        int64_t chatId = 0;
        auto chatIt = event.payload.find("chatId");
        if (chatIt != event.payload.end() && chatIt->is_number_integer()) {
          chatId = chatIt->get<int64_t>();
        }
        event.message = Message::fromJson(chatId, *messageIt);
      }
    }
    return event;
  }

  /** @brief Convenience for building synthetic events. */
  static PushEvent forMessage(const Message& message) {
    PushEvent event;
    event.opcode = OPCODE_NOTIF_MESSAGE;
    event.message = message;
    return event;
  }
};
}  // namespace mw

#endif  // __MW_PUSH_EVENT__
