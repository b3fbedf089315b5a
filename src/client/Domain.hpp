#ifndef __MW_DOMAIN__
#define __MW_DOMAIN__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace mw {
/**
 * @brief One of the names attached to a contact profile.
 */
struct Name {
  string name;
  string firstName;
  string lastName;
  string type;

  static Name fromJson(const json& j);
};

/**
 * @brief A contact profile as returned by the server.
 */
struct Contact {
  int64_t id = 0;
  string accountStatus;
  string baseUrl;
  string baseRawUrl;
  vector<Name> names;
  string phone;
  string description;
  vector<string> options;
  int64_t photoId = 0;
  int64_t updateTime = 0;

  static Contact fromJson(const json& j);
};

/**
 * @brief A user is a thin wrapper around its contact profile.
 */
struct User {
  Contact contact;

  static User fromJson(const json& profile);
};

/**
 * @brief A chat message, either received in a push or returned by a send or
 * edit.
 */
struct Message {
  int64_t chatId = 0;
  int64_t sender = 0;
  string id;
  int64_t time = 0;
  std::optional<string> text;
  string type;
  int64_t updateTime = 0;
  int64_t options = 0;
  int64_t cid = 0;
  json attaches = json::array();
  json link;

  /**
   * @brief Builds a message from the `message` object of a payload.  The chat
   * id lives beside it in the payload, so it is passed separately.
   */
  static Message fromJson(int64_t chatId, const json& j);
};

ostream& operator<<(ostream& os, const Message& message);
}  // namespace mw

#endif  // __MW_DOMAIN__
