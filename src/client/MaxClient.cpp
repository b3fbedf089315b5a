#include "MaxClient.hpp"

#include "Opcodes.hpp"

namespace mw {
namespace {
void throwIfServerError(const json& payload) {
  if (!payload.is_object()) {
    return;
  }
  auto errorIt = payload.find("error");
  if (errorIt == payload.end() || errorIt->is_null()) {
    return;
  }
  string error = errorIt->is_string() ? errorIt->get<string>() : errorIt->dump();
  string title = payload.value("title", error);
  string localizedMessage = payload.value("localizedMessage", "");
  throw ServerError(error, title, localizedMessage);
}

const json& requireField(const json& payload, const char* key, int opcode) {
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    throw std::runtime_error("Reply to opcode " + to_string(opcode) +
                             " has no " + key);
  }
  return *it;
}
}  // namespace

MaxClient::MaxClient(shared_ptr<SocketHandler> _socketHandler,
                     const ClientConfig& _config)
    : socketHandler(_socketHandler),
      config(_config),
      clientState(new ClientState()),
      handlers(new HandlerRegistry()),
      sequences(new SequenceAllocator()),
      deviceId(sole::uuid4().str()),
      connected(false) {}

MaxClient::~MaxClient() {
  disconnect();
  multiplexer.reset();
  retiredMultiplexers.clear();
}

void MaxClient::connect() {
  ConnectCallback callback;
  {
    lock_guard<recursive_mutex> guard(clientMutex);
    if (connected) {
      return;
    }
    if (!multiplexer || !multiplexer->isRunning()) {
      openSession();
    }
    login();
    connected = true;
    callback = connectCallback;
  }
  LOG(INFO) << "Connected to " << config.host << ":" << config.port;
  if (callback) {
    callback();
  }
}

void MaxClient::openSession() {
  retireMultiplexer();
  sequences->reset();

  SocketEndpoint endpoint(config.host, config.port);
  int socketFd = socketHandler->connect(endpoint);
  if (socketFd < 0) {
    throw std::runtime_error("Could not connect to " + config.host + ":" +
                             to_string(config.port));
  }
  shared_ptr<Connection> connection(new Connection(socketHandler, socketFd));
  multiplexer.reset(new Multiplexer(connection, clientState, handlers,
                                    sequences, config.timeoutMs));
  multiplexer->setConnectionLostCallback([this](const string& reason) {
    LOG(WARNING) << "Lost connection to the server: " << reason;
    connected = false;
  });
  multiplexer->start();

  json payload = {
      {"userAgent", config.userAgent.toJson()},
      {"deviceId", deviceId},
  };
  call(OPCODE_SESSION_INIT, payload);
  VLOG(1) << "Session initialized for device " << deviceId;
}

void MaxClient::retireMultiplexer() {
  // Sessions retired by an earlier handler-driven reconnect can be released
  // from any thread other than their own dispatch worker.
  retiredMultiplexers.erase(
      std::remove_if(retiredMultiplexers.begin(), retiredMultiplexers.end(),
                     [](const shared_ptr<Multiplexer>& retired) {
                       return !retired->isDispatchThread();
                     }),
      retiredMultiplexers.end());
  if (!multiplexer) {
    return;
  }
  multiplexer->stop();
  if (multiplexer->isDispatchThread()) {
    // A push handler is reconnecting: its worker cannot join itself
    VLOG(1) << "Deferring release of the session that runs this handler";
    retiredMultiplexers.push_back(multiplexer);
  }
  multiplexer.reset();
}

void MaxClient::login() {
  if (config.token.empty()) {
    throw std::runtime_error(
        "No auth token provided. Please authenticate first.");
  }
  json payload = {
      {"interactive", true},  {"token", config.token}, {"chatsSync", 0},
      {"contactsSync", 0},    {"presenceSync", 0},     {"draftsSync", 0},
      {"chatsCount", 0},
  };
  json reply = call(OPCODE_LOGIN, payload);
  User me = User::fromJson(requireField(reply, "profile", OPCODE_LOGIN));
  clientState->setSelf(me);
  LOG(INFO) << "Logged in as contact " << me.contact.id;
}

void MaxClient::disconnect() {
  lock_guard<recursive_mutex> guard(clientMutex);
  if (!multiplexer) {
    return;
  }
  multiplexer->stop();
  sequences->reset();
  clientState->clear();
  if (connected.exchange(false)) {
    LOG(INFO) << "Disconnected";
  }
}

bool MaxClient::isConnected() const { return connected; }

void MaxClient::setToken(const string& token) {
  lock_guard<recursive_mutex> guard(clientMutex);
  config.token = token;
}

string MaxClient::getToken() {
  lock_guard<recursive_mutex> guard(clientMutex);
  return config.token;
}

string MaxClient::startAuth(const string& phone) {
  lock_guard<recursive_mutex> guard(clientMutex);
  if (clientState->isAuthenticated()) {
    throw std::runtime_error("Client is logged in now");
  }
  if (!multiplexer || !multiplexer->isRunning()) {
    openSession();
  }
  json payload = {
      {"phone", phone},
      {"type", "START_AUTH"},
      {"language", config.userAgent.locale},
  };
  json reply = call(OPCODE_AUTH_REQUEST, payload);
  const json& token = requireField(reply, "token", OPCODE_AUTH_REQUEST);
  LOG(INFO) << "Verification code requested for " << phone;
  return token.get<string>();
}

User MaxClient::checkCode(const string& verifyToken, const string& code) {
  lock_guard<recursive_mutex> guard(clientMutex);
  json payload = {
      {"token", verifyToken},
      {"verifyCode", code},
      {"authTokenType", "CHECK_CODE"},
  };
  json reply = call(OPCODE_AUTH_CHECK_CODE, payload);
  const json& tokenAttrs = requireField(reply, "tokenAttrs",
                                        OPCODE_AUTH_CHECK_CODE);
  string loginToken = tokenAttrs.at("LOGIN").at("token").get<string>();
  User me = User::fromJson(
      requireField(reply, "profile", OPCODE_AUTH_CHECK_CODE));
  config.token = loginToken;
  clientState->setSelf(me);
  connected = true;
  LOG(INFO) << "Authenticated as contact " << me.contact.id;
  return me;
}

Message MaxClient::sendMessage(int64_t chatId, const string& text,
                               const std::optional<string>& replyId,
                               bool notify) {
  json message = {
      {"text", text},
      {"cid", currentTimeMillis()},
      {"elements", json::array()},
      {"attaches", json::array()},
  };
  if (replyId) {
    message["link"] = {{"type", "REPLY"}, {"messageId", *replyId}};
  }
  json payload = {
      {"chatId", chatId},
      {"message", message},
      {"notify", notify},
  };
  json reply = call(OPCODE_MSG_SEND, payload);
  int64_t replyChatId = reply.value("chatId", chatId);
  return Message::fromJson(replyChatId,
                           requireField(reply, "message", OPCODE_MSG_SEND));
}

Message MaxClient::editMessage(int64_t chatId, const string& messageId,
                               const string& text) {
  json payload = {
      {"chatId", chatId},
      {"messageId", messageId},
      {"text", text},
      {"elements", json::array()},
      {"attachments", json::array()},
  };
  json reply = call(OPCODE_MSG_EDIT, payload);
  return Message::fromJson(chatId,
                           requireField(reply, "message", OPCODE_MSG_EDIT));
}

bool MaxClient::deleteMessage(int64_t chatId, const vector<string>& messageIds,
                              bool forMe) {
  json payload = {
      {"chatId", chatId},
      {"messageIds", messageIds},
      {"forMe", forMe},
  };
  return send(OPCODE_MSG_DELETE, payload);
}

json MaxClient::configPayload(int64_t chatId, int64_t favIndex) const {
  json chats = json::object();
  chats[to_string(chatId)] = {{"favIndex", favIndex}};
  return {{"settings", {{"chats", chats}}}};
}

bool MaxClient::pinChat(int64_t chatId) {
  return send(OPCODE_CONFIG, configPayload(chatId, currentTimeMillis()));
}

bool MaxClient::unpinChat(int64_t chatId) {
  return send(OPCODE_CONFIG, configPayload(chatId, 0));
}

User MaxClient::getUserById(int64_t contactId) {
  json payload = {{"contactIds", json::array({contactId})}};
  json reply = call(OPCODE_CONTACT_INFO, payload);
  auto contactsIt = reply.find("contacts");
  if (contactsIt == reply.end() || !contactsIt->is_array() ||
      contactsIt->empty()) {
    throw ServerError("user.not.found",
                      "No contact with id " + to_string(contactId));
  }
  User user;
  user.contact = Contact::fromJson(contactsIt->at(0));
  return user;
}

User MaxClient::getUserByPhone(const string& phone) {
  json payload = {{"phone", phone}};
  json reply = call(OPCODE_CONTACT_BY_PHONE, payload);
  auto contactIt = reply.find("contact");
  if (contactIt == reply.end() || !contactIt->is_object()) {
    throw ServerError("user.not.found", "No contact with phone " + phone);
  }
  User user;
  user.contact = Contact::fromJson(*contactIt);
  // The lookup reply omits the number it was asked about
  user.contact.phone = phone;
  return user;
}

User MaxClient::getUserByChat(int64_t chatId) {
  int64_t selfId = clientState->getSelfId();
  return getUserById(selfId ^ chatId);
}

bool MaxClient::sessionExit() {
  bool sent = send(OPCODE_LOGOUT, json::object());
  disconnect();
  return sent;
}

Message MaxClient::reply(const Message& message, const string& text) {
  return sendMessage(message.chatId, text, message.id);
}

Message MaxClient::answer(const Message& message, const string& text) {
  return sendMessage(message.chatId, text);
}

bool MaxClient::deleteMessage(const Message& message, bool forMe) {
  return deleteMessage(message.chatId, {message.id}, forMe);
}

Message MaxClient::editMessage(const Message& message, const string& text) {
  return editMessage(message.chatId, message.id, text);
}

void MaxClient::onMessage(FilterPtr filter, MessageHandler handler,
                          FilterErrorHandler onFilterError) {
  if (!filter || !handler) {
    throw std::invalid_argument("onMessage needs a filter and a handler");
  }
  FilterPtr hasMessage = FilterNode::custom(
      [](const ClientState&, const PushEvent& event) {
        return bool(event.message);
      });
  handlers->registerHandler(
      FilterNode::allOf({hasMessage, filter}),
      [this, handler](const PushEvent& event) { handler(*this, *event.message); },
      onFilterError);
}

void MaxClient::onConnect(ConnectCallback callback) {
  lock_guard<recursive_mutex> guard(clientMutex);
  connectCallback = callback;
}

void MaxClient::run() {
  connect();
  auto current = getMultiplexer();
  if (current) {
    current->waitUntilStopped();
  }
  LOG(INFO) << "Client stopped";
}

shared_ptr<Multiplexer> MaxClient::getMultiplexer() {
  lock_guard<recursive_mutex> guard(clientMutex);
  return multiplexer;
}

json MaxClient::call(int opcode, const json& payload) {
  auto current = getMultiplexer();
  if (!current) {
    throw CallError(CallResult::failure(CallStatus::CONNECTION_CLOSED,
                                        "ConnectionClosed: not connected"));
  }
  CallResult result = current->sendAndAwait(opcode, payload);
  if (!result.ok()) {
    throw CallError(result);
  }
  throwIfServerError(result.getPayload());
  return result.getPayload();
}

bool MaxClient::send(int opcode, const json& payload) {
  auto current = getMultiplexer();
  if (!current) {
    LOG(WARNING) << "Not connected, dropping opcode " << opcode;
    return false;
  }
  return current->sendFireAndForget(opcode, payload);
}
}  // namespace mw
