#include "Domain.hpp"

namespace mw {
namespace {
string stringOrEmpty(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return "";
  }
  if (it->is_string()) {
    return it->get<string>();
  }
  // Ids and statuses are sometimes sent as numbers
  return it->dump();
}

int64_t integerOrZero(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) {
    return 0;
  }
  if (it->is_number_unsigned()) {
    uint64_t value = it->get<uint64_t>();
    if (value > uint64_t(std::numeric_limits<int64_t>::max())) {
      LOG(WARNING) << "Ignoring out of range " << key << ": " << value;
      return 0;
    }
    return int64_t(value);
  }
  if (it->is_number_integer()) {
    return it->get<int64_t>();
  }
  if (it->is_number()) {
    double value = it->get<double>();
    // 2^63 is exactly representable; anything at or past it does not fit
    if (!std::isfinite(value) || value >= 9223372036854775808.0 ||
        value < -9223372036854775808.0) {
      LOG(WARNING) << "Ignoring out of range " << key << ": " << value;
      return 0;
    }
    return int64_t(value);
  }
  if (it->is_string()) {
    try {
      return stoll(it->get<string>());
    } catch (const std::logic_error& e) {
      LOG(WARNING) << "Ignoring non-numeric " << key << ": " << e.what();
    }
  }
  return 0;
}
}  // namespace

Name Name::fromJson(const json& j) {
  Name n;
  n.name = stringOrEmpty(j, "name");
  n.firstName = stringOrEmpty(j, "firstName");
  n.lastName = stringOrEmpty(j, "lastName");
  n.type = stringOrEmpty(j, "type");
  return n;
}

Contact Contact::fromJson(const json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("Contact payload is not an object");
  }
  Contact c;
  c.id = integerOrZero(j, "id");
  c.accountStatus = stringOrEmpty(j, "accountStatus");
  c.baseUrl = stringOrEmpty(j, "baseUrl");
  c.baseRawUrl = stringOrEmpty(j, "baseRawUrl");
  c.phone = stringOrEmpty(j, "phone");
  c.description = stringOrEmpty(j, "description");
  c.photoId = integerOrZero(j, "photoId");
  c.updateTime = integerOrZero(j, "updateTime");
  auto namesIt = j.find("names");
  if (namesIt != j.end() && namesIt->is_array()) {
    for (const auto& n : *namesIt) {
      c.names.push_back(Name::fromJson(n));
    }
  }
  auto optionsIt = j.find("options");
  if (optionsIt != j.end() && optionsIt->is_array()) {
    for (const auto& o : *optionsIt) {
      if (o.is_string()) {
        c.options.push_back(o.get<string>());
      }
    }
  }
  return c;
}

User User::fromJson(const json& profile) {
  User u;
  // Login replies wrap the contact, lookups return it bare
  auto contactIt = profile.find("contact");
  if (contactIt != profile.end() && contactIt->is_object()) {
    u.contact = Contact::fromJson(*contactIt);
  } else {
    u.contact = Contact::fromJson(profile);
  }
  return u;
}

Message Message::fromJson(int64_t chatId, const json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("Message payload is not an object");
  }
  Message m;
  m.chatId = chatId;
  m.sender = integerOrZero(j, "sender");
  m.id = stringOrEmpty(j, "id");
  m.time = integerOrZero(j, "time");
  auto textIt = j.find("text");
  if (textIt != j.end() && textIt->is_string()) {
    m.text = textIt->get<string>();
  }
  m.type = stringOrEmpty(j, "type");
  m.updateTime = integerOrZero(j, "updateTime");
  m.options = integerOrZero(j, "options");
  m.cid = integerOrZero(j, "cid");
  auto attachesIt = j.find("attaches");
  if (attachesIt != j.end() && attachesIt->is_array()) {
    m.attaches = *attachesIt;
  }
  auto linkIt = j.find("link");
  if (linkIt != j.end()) {
    m.link = *linkIt;
  }
  return m;
}

ostream& operator<<(ostream& os, const Message& message) {
  os << "Message(chat=" << message.chatId << ", id=" << message.id
     << ", sender=" << message.sender << ", type=" << message.type << ")";
  return os;
}
}  // namespace mw
