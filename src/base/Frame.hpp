#ifndef __MW_FRAME_H__
#define __MW_FRAME_H__

#include "Errors.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace mw {
/** @brief `cmd` of client requests and server-initiated frames. */
const int FRAME_COMMAND_REQUEST = 0;
/** @brief `cmd` of a successful reply. */
const int FRAME_COMMAND_RESPONSE = 1;
/** @brief `cmd` of a reply that carries an error payload. */
const int FRAME_COMMAND_ERROR = 3;

/**
 * @brief One unit of wire exchange: `{ver, cmd, seq, opcode, payload}`.
 */
class Frame {
 public:
  /** @brief Constructs an empty request frame. */
  Frame()
      : version(PROTOCOL_VERSION),
        command(FRAME_COMMAND_REQUEST),
        sequence(-1),
        opcode(-1),
        payload(json::object()),
        commandPresent(true) {}
  /**
   * @brief Builds an outbound request frame.
   */
  Frame(int64_t _sequence, int _opcode, const json& _payload)
      : version(PROTOCOL_VERSION),
        command(FRAME_COMMAND_REQUEST),
        sequence(_sequence),
        opcode(_opcode),
        payload(_payload),
        commandPresent(true) {}
  /**
   * @brief Builds a frame with an explicit command, as the server sends them.
   */
  Frame(int _command, int64_t _sequence, int _opcode, const json& _payload)
      : version(PROTOCOL_VERSION),
        command(_command),
        sequence(_sequence),
        opcode(_opcode),
        payload(_payload),
        commandPresent(true) {}

  /**
   * @brief Decodes one JSON object text into a frame.
   * @throws FrameDecodeError when the text is not JSON or lacks an integer
   * `seq`/`opcode`.
   */
  static Frame parse(const string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
      throw FrameDecodeError("Invalid JSON frame (" + to_string(text.size()) +
                             " bytes)");
    }
    if (!j.is_object()) {
      throw FrameDecodeError("Frame is not a JSON object");
    }
    auto seqIt = j.find("seq");
    if (seqIt == j.end() || !seqIt->is_number_integer()) {
      throw FrameDecodeError("Frame is missing an integer seq");
    }
    auto opcodeIt = j.find("opcode");
    if (opcodeIt == j.end() || !opcodeIt->is_number_integer()) {
      throw FrameDecodeError("Frame is missing an integer opcode");
    }
    Frame frame;
    frame.sequence = integerInRange(*seqIt, "seq",
                                    std::numeric_limits<int64_t>::min(),
                                    std::numeric_limits<int64_t>::max());
    frame.opcode = int(integerInRange(*opcodeIt, "opcode",
                                      std::numeric_limits<int>::min(),
                                      std::numeric_limits<int>::max()));
    // Servers often omit cmd; a missing cmd reads as a reply and is remembered
    // so keepalives without one are still answered.
    auto cmdIt = j.find("cmd");
    if (cmdIt != j.end() && cmdIt->is_number_integer()) {
      frame.command = int(integerInRange(*cmdIt, "cmd",
                                         std::numeric_limits<int>::min(),
                                         std::numeric_limits<int>::max()));
      frame.commandPresent = true;
    } else {
      frame.command = FRAME_COMMAND_RESPONSE;
      frame.commandPresent = false;
    }
    auto verIt = j.find("ver");
    if (verIt != j.end() && verIt->is_number_integer()) {
      frame.version = int(integerInRange(*verIt, "ver",
                                         std::numeric_limits<int>::min(),
                                         std::numeric_limits<int>::max()));
    }
    auto payloadIt = j.find("payload");
    if (payloadIt != j.end() && !payloadIt->is_null()) {
      frame.payload = *payloadIt;
    }
    return frame;
  }

  /**
   * @brief Serializes the frame into its wire text.
   */
  string serialize() const {
    json j = {
        {"ver", version},   {"cmd", command},     {"seq", sequence},
        {"opcode", opcode}, {"payload", payload},
    };
    return j.dump();
  }

  int getVersion() const { return version; }
  int getCommand() const { return command; }
  int64_t getSequence() const { return sequence; }
  int getOpcode() const { return opcode; }
  const json& getPayload() const { return payload; }

  /** @brief True for frames the server originates rather than answers. */
  bool isRequest() const { return command == FRAME_COMMAND_REQUEST; }

  /** @brief False when an inbound frame carried no `cmd` field. */
  bool hasCommand() const { return commandPresent; }

 protected:
  static int64_t integerInRange(const json& value, const char* field,
                                int64_t low, int64_t high) {
    if (value.is_number_unsigned()) {
      uint64_t unsignedValue = value.get<uint64_t>();
      if (unsignedValue > uint64_t(high)) {
        throw FrameDecodeError(string("Frame ") + field + " is out of range");
      }
      return int64_t(unsignedValue);
    }
    int64_t signedValue = value.get<int64_t>();
    if (signedValue < low || signedValue > high) {
      throw FrameDecodeError(string("Frame ") + field + " is out of range");
    }
    return signedValue;
  }

  int version;
  int command;
  int64_t sequence;
  int opcode;
  json payload;
  bool commandPresent;
};
}  // namespace mw

#endif  // __MW_FRAME_H__
