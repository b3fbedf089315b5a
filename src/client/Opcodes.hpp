#ifndef __MW_OPCODES_H__
#define __MW_OPCODES_H__

/**
 * @brief Opcodes that tag every frame exchanged with the messaging server.
 */
namespace mw {
/** @brief Both directions: keepalive ping and its acknowledgement. */
const int OPCODE_PING = 1;
/** @brief Client -> server: user agent and device id, first frame sent. */
const int OPCODE_SESSION_INIT = 6;
/** @brief Client -> server: asks for a verification code by SMS. */
const int OPCODE_AUTH_REQUEST = 17;
/** @brief Client -> server: submits the verification code. */
const int OPCODE_AUTH_CHECK_CODE = 18;
/** @brief Client -> server: logs in with a session token. */
const int OPCODE_LOGIN = 19;
/** @brief Client -> server: terminates the session token. */
const int OPCODE_LOGOUT = 20;
/** @brief Client -> server: updates account settings (chat pinning). */
const int OPCODE_CONFIG = 22;
/** @brief Client -> server: looks up contacts by id. */
const int OPCODE_CONTACT_INFO = 32;
/** @brief Client -> server: looks up a contact by phone number. */
const int OPCODE_CONTACT_BY_PHONE = 46;
/** @brief Client -> server: sends a message to a chat. */
const int OPCODE_MSG_SEND = 64;
/** @brief Client -> server: deletes messages. */
const int OPCODE_MSG_DELETE = 66;
/** @brief Client -> server: edits a message. */
const int OPCODE_MSG_EDIT = 67;
/** @brief Server -> client: a new message arrived in one of our chats. */
const int OPCODE_NOTIF_MESSAGE = 128;
}  // namespace mw

#endif  // __MW_OPCODES_H__
