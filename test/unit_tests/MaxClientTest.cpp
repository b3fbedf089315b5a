#include "FakeServer.hpp"
#include "MaxClient.hpp"
#include "Opcodes.hpp"
#include "TestHeaders.hpp"

using namespace mw;

namespace {
const int64_t SELF_ID = 4242;

json profileJson(int64_t id, const string& name) {
  return {{"id", id},
          {"phone", "+70000000000"},
          {"accountStatus", 0},
          {"names", json::array({{{"name", name},
                                  {"firstName", name},
                                  {"type", "ONEME"}}})}};
}

struct MaxClientFixture {
  MaxClientFixture() : socketHandler(new SocketPairHandler()) {
    config.token = "secret-token";
    config.timeoutMs = 2000;
    client.reset(new MaxClient(socketHandler, config));
  }

  ~MaxClientFixture() { client.reset(); }

  void connect() {
    auto connecting =
        std::async(std::launch::async, [this]() { client->connect(); });
    serveHandshake();
    connecting.get();
  }

  // Plays the server side of session init and login on the next socket.
  void serveHandshake() {
    REQUIRE(waitFor([this]() {
      int fd = socketHandler->takeServerFd();
      if (fd < 0) {
        return false;
      }
      server.reset(new FakeServer(fd));
      return true;
    }));
    Frame init = server->readFrame();
    REQUIRE(init.getOpcode() == OPCODE_SESSION_INIT);
    REQUIRE(init.getSequence() == 0);
    sessionInitPayload = init.getPayload();
    server->replyTo(init, {{"location", "RU"}});

    Frame login = server->readFrame();
    REQUIRE(login.getOpcode() == OPCODE_LOGIN);
    loginPayload = login.getPayload();
    server->replyTo(login, {{"profile", profileJson(SELF_ID, "Me")},
                            {"token", "secret-token"}});
  }

  ClientConfig config;
  shared_ptr<SocketPairHandler> socketHandler;
  shared_ptr<MaxClient> client;
  shared_ptr<FakeServer> server;
  json sessionInitPayload;
  json loginPayload;
};
}  // namespace

TEST_CASE("Connect performs the handshake and login", "[MaxClient]") {
  MaxClientFixture f;
  bool connectCalled = false;
  f.client->onConnect([&connectCalled]() { connectCalled = true; });
  f.connect();

  REQUIRE(f.sessionInitPayload["userAgent"]["deviceType"] == "WEB");
  REQUIRE(f.sessionInitPayload["deviceId"].get<string>().size() == 36);
  REQUIRE(f.loginPayload["token"] == "secret-token");
  REQUIRE(f.loginPayload["interactive"] == true);
  REQUIRE(f.loginPayload["chatsCount"] == 0);

  REQUIRE(connectCalled);
  REQUIRE(f.client->isConnected());
  auto me = f.client->getMe();
  REQUIRE(me);
  REQUIRE(me->contact.id == SELF_ID);
  REQUIRE(me->contact.names[0].name == "Me");

  // Already connected: nothing goes over the wire
  f.client->connect();
  REQUIRE(f.server->isQuiet(100));

  f.client->disconnect();
  REQUIRE_FALSE(f.client->isConnected());
  REQUIRE_FALSE(f.client->getMe());
}

TEST_CASE("Login errors surface as server errors", "[MaxClient]") {
  MaxClientFixture f;
  auto connecting =
      std::async(std::launch::async, [&f]() { f.client->connect(); });
  REQUIRE(waitFor([&f]() {
    int fd = f.socketHandler->takeServerFd();
    if (fd < 0) {
      return false;
    }
    f.server.reset(new FakeServer(fd));
    return true;
  }));
  f.server->replyTo(f.server->readFrame(), json::object());
  f.server->replyTo(f.server->readFrame(),
                    {{"error", "login.token"}, {"title", "Bad token"}},
                    FRAME_COMMAND_ERROR);
  try {
    connecting.get();
    FAIL("connect() should have thrown");
  } catch (const ServerError& se) {
    REQUIRE(se.getError() == "login.token");
    REQUIRE(se.getTitle() == "Bad token");
  }
  REQUIRE_FALSE(f.client->isConnected());
}

TEST_CASE("Send message builds the message payload", "[MaxClient]") {
  MaxClientFixture f;
  f.connect();

  auto sending = std::async(std::launch::async, [&f]() {
    return f.client->sendMessage(77, "hello", string("555"), false);
  });
  Frame request = f.server->readFrame();
  REQUIRE(request.getOpcode() == OPCODE_MSG_SEND);
  const json& payload = request.getPayload();
  REQUIRE(payload["chatId"] == 77);
  REQUIRE(payload["notify"] == false);
  REQUIRE(payload["message"]["text"] == "hello");
  REQUIRE(payload["message"]["cid"].get<int64_t>() > 0);
  REQUIRE(payload["message"]["elements"].empty());
  REQUIRE(payload["message"]["attaches"].empty());
  REQUIRE(payload["message"]["link"]["type"] == "REPLY");
  REQUIRE(payload["message"]["link"]["messageId"] == "555");

  f.server->replyTo(request,
                    {{"chatId", 77},
                     {"message",
                      {{"id", "9000"},
                       {"sender", SELF_ID},
                       {"text", "hello"},
                       {"type", "USER"},
                       {"time", 1700000000000LL}}}});
  Message sent = sending.get();
  REQUIRE(sent.chatId == 77);
  REQUIRE(sent.id == "9000");
  REQUIRE(sent.sender == SELF_ID);
  REQUIRE(*sent.text == "hello");
}

TEST_CASE("Edit, delete and pin payloads", "[MaxClient]") {
  MaxClientFixture f;
  f.connect();

  auto editing = std::async(std::launch::async, [&f]() {
    return f.client->editMessage(5, "12", "changed");
  });
  Frame edit = f.server->readFrame();
  REQUIRE(edit.getOpcode() == OPCODE_MSG_EDIT);
  REQUIRE(edit.getPayload()["messageId"] == "12");
  REQUIRE(edit.getPayload()["text"] == "changed");
  REQUIRE(edit.getPayload()["attachments"].empty());
  f.server->replyTo(edit, {{"message", {{"id", "12"}, {"text", "changed"}}}});
  Message edited = editing.get();
  REQUIRE(edited.chatId == 5);
  REQUIRE(*edited.text == "changed");

  REQUIRE(f.client->deleteMessage(5, {"12", "13"}, true));
  Frame del = f.server->readFrame();
  REQUIRE(del.getOpcode() == OPCODE_MSG_DELETE);
  REQUIRE(del.getPayload()["messageIds"] == json::array({"12", "13"}));
  REQUIRE(del.getPayload()["forMe"] == true);

  REQUIRE(f.client->pinChat(5));
  Frame pin = f.server->readFrame();
  REQUIRE(pin.getOpcode() == OPCODE_CONFIG);
  REQUIRE(pin.getPayload()["settings"]["chats"]["5"]["favIndex"].get<int64_t>() >
          0);

  REQUIRE(f.client->unpinChat(5));
  Frame unpin = f.server->readFrame();
  REQUIRE(unpin.getPayload()["settings"]["chats"]["5"]["favIndex"] == 0);
  REQUIRE(f.client->getMultiplexer()->getPendingRequests()->size() == 0);
}

TEST_CASE("User lookups", "[MaxClient]") {
  MaxClientFixture f;
  f.connect();

  SECTION("By chat uses the dialog id") {
    const int64_t otherId = 1234;
    auto lookup = std::async(std::launch::async, [&f, otherId]() {
      return f.client->getUserByChat(SELF_ID ^ otherId);
    });
    Frame request = f.server->readFrame();
    REQUIRE(request.getOpcode() == OPCODE_CONTACT_INFO);
    REQUIRE(request.getPayload()["contactIds"][0] == otherId);
    f.server->replyTo(request,
                      {{"contacts", json::array({profileJson(otherId, "Bob")})}});
    User user = lookup.get();
    REQUIRE(user.contact.id == otherId);
    REQUIRE(user.contact.names[0].firstName == "Bob");
  }

  SECTION("By phone fills in the phone number") {
    auto lookup = std::async(std::launch::async, [&f]() {
      return f.client->getUserByPhone("+79990001122");
    });
    Frame request = f.server->readFrame();
    REQUIRE(request.getOpcode() == OPCODE_CONTACT_BY_PHONE);
    REQUIRE(request.getPayload()["phone"] == "+79990001122");
    f.server->replyTo(request, {{"contact", {{"id", 99}}}});
    User user = lookup.get();
    REQUIRE(user.contact.id == 99);
    REQUIRE(user.contact.phone == "+79990001122");
  }

  SECTION("An empty contact list is user.not.found") {
    auto lookup = std::async(std::launch::async,
                             [&f]() { return f.client->getUserById(1); });
    f.server->replyTo(f.server->readFrame(),
                      {{"contacts", json::array()}});
    REQUIRE_THROWS_AS(lookup.get(), ServerError);
  }
}

TEST_CASE("Lookup by chat needs a login", "[MaxClient]") {
  MaxClientFixture f;
  REQUIRE_THROWS_AS(f.client->getUserByChat(1), UnauthenticatedError);
}

TEST_CASE("Calls without a session fail fast", "[MaxClient]") {
  MaxClientFixture f;
  try {
    f.client->sendMessage(1, "x");
    FAIL("sendMessage() should have thrown");
  } catch (const CallError& ce) {
    REQUIRE(ce.getStatus() == CallStatus::CONNECTION_CLOSED);
  }
  REQUIRE_FALSE(f.client->pinChat(1));
}

TEST_CASE("Verification code flow", "[MaxClient]") {
  ClientConfig config;
  config.timeoutMs = 2000;
  auto socketHandler = make_shared<SocketPairHandler>();
  MaxClient client(socketHandler, config);

  auto starting = std::async(std::launch::async, [&client]() {
    return client.startAuth("+70001112233");
  });
  shared_ptr<FakeServer> server;
  REQUIRE(waitFor([&]() {
    int fd = socketHandler->takeServerFd();
    if (fd < 0) {
      return false;
    }
    server.reset(new FakeServer(fd));
    return true;
  }));
  server->replyTo(server->readFrame(), json::object());
  Frame start = server->readFrame();
  REQUIRE(start.getOpcode() == OPCODE_AUTH_REQUEST);
  REQUIRE(start.getPayload()["type"] == "START_AUTH");
  REQUIRE(start.getPayload()["phone"] == "+70001112233");
  server->replyTo(start, {{"token", "verify-token"}});
  REQUIRE(starting.get() == "verify-token");

  SECTION("A wrong code is reported with its error id") {
    auto checking = std::async(std::launch::async, [&client]() {
      return client.checkCode("verify-token", "000000");
    });
    Frame check = server->readFrame();
    REQUIRE(check.getOpcode() == OPCODE_AUTH_CHECK_CODE);
    REQUIRE(check.getPayload()["authTokenType"] == "CHECK_CODE");
    server->replyTo(check,
                    {{"error", "verify.code.wrong"},
                     {"title", "Wrong code"},
                     {"localizedMessage", "Try again"}},
                    FRAME_COMMAND_ERROR);
    try {
      checking.get();
      FAIL("checkCode() should have thrown");
    } catch (const ServerError& se) {
      REQUIRE(se.getError() == "verify.code.wrong");
      REQUIRE(se.getLocalizedMessage() == "Try again");
    }
    REQUIRE_FALSE(client.getMe());
  }

  SECTION("A good code stores the login token") {
    auto checking = std::async(std::launch::async, [&client]() {
      return client.checkCode("verify-token", "123456");
    });
    Frame check = server->readFrame();
    REQUIRE(check.getPayload()["verifyCode"] == "123456");
    server->replyTo(check,
                    {{"tokenAttrs", {{"LOGIN", {{"token", "login-token"}}}}},
                     {"profile", profileJson(SELF_ID, "Me")}});
    User me = checking.get();
    REQUIRE(me.contact.id == SELF_ID);
    REQUIRE(client.getToken() == "login-token");
    REQUIRE(client.isConnected());
    REQUIRE_THROWS(client.startAuth("+70001112233"));
  }
  client.disconnect();
}

TEST_CASE("Message handlers see decoded messages", "[MaxClient]") {
  MaxClientFixture f;
  std::promise<Message> received;
  f.client->onMessage(FilterNode::command("ping"),
                      [&received](MaxClient& c, const Message& message) {
                        received.set_value(message);
                      });
  f.connect();

  // Not a message: skipped by the binding
  f.server->push(1000, 999, json::object());
  f.server->push(1001, OPCODE_NOTIF_MESSAGE,
                 {{"chatId", 31},
                  {"message",
                   {{"id", "77"},
                    {"sender", 5},
                    {"text", "/ping"},
                    {"type", "USER"}}}});
  auto future = received.get_future();
  REQUIRE(future.wait_for(std::chrono::seconds(5)) ==
          std::future_status::ready);
  Message message = future.get();
  REQUIRE(message.chatId == 31);

  auto replying = std::async(std::launch::async, [&f, message]() {
    return f.client->reply(message, "pong");
  });
  Frame reply = f.server->readFrame();
  REQUIRE(reply.getPayload()["chatId"] == 31);
  REQUIRE(reply.getPayload()["message"]["text"] == "pong");
  REQUIRE(reply.getPayload()["message"]["link"]["messageId"] == "77");
  f.server->replyTo(reply, {{"chatId", 31}, {"message", {{"id", "78"}}}});
  REQUIRE(replying.get().id == "78");
}

TEST_CASE("A handler can reconnect the client", "[MaxClient]") {
  MaxClientFixture f;
  std::promise<bool> reconnected;
  std::atomic<int> calls(0);
  f.client->onMessage(FilterNode::any(),
                      [&](MaxClient& c, const Message&) {
                        if (calls++ > 0) {
                          return;
                        }
                        c.stop();
                        c.connect();
                        reconnected.set_value(c.isConnected());
                      });
  f.connect();
  // Only the client may own the first session, so it is released by the client
  Multiplexer* firstSession = f.client->getMultiplexer().get();

  f.server->push(1, OPCODE_NOTIF_MESSAGE,
                 {{"chatId", 2}, {"message", {{"text", "again"}}}});
  f.serveHandshake();
  auto future = reconnected.get_future();
  REQUIRE(future.wait_for(std::chrono::seconds(5)) ==
          std::future_status::ready);
  REQUIRE(future.get());
  REQUIRE(f.client->getMultiplexer().get() != firstSession);

  // Pushes on the new session still reach the handler
  f.server->push(2, OPCODE_NOTIF_MESSAGE,
                 {{"chatId", 2}, {"message", {{"text", "later"}}}});
  REQUIRE(waitFor([&calls]() { return calls == 2; }));
}

TEST_CASE("Session exit logs out and disconnects", "[MaxClient]") {
  MaxClientFixture f;
  f.connect();
  REQUIRE(f.client->sessionExit());
  Frame logout = f.server->readFrame();
  REQUIRE(logout.getOpcode() == OPCODE_LOGOUT);
  REQUIRE_FALSE(f.client->isConnected());
}

TEST_CASE("Run returns once stopped", "[MaxClient]") {
  MaxClientFixture f;
  auto running = std::async(std::launch::async, [&f]() { f.client->run(); });
  REQUIRE(waitFor([&f]() {
    int fd = f.socketHandler->takeServerFd();
    if (fd < 0) {
      return false;
    }
    f.server.reset(new FakeServer(fd));
    return true;
  }));
  f.server->replyTo(f.server->readFrame(), json::object());
  f.server->replyTo(f.server->readFrame(),
                    {{"profile", profileJson(SELF_ID, "Me")}});
  REQUIRE(waitFor([&f]() { return f.client->isConnected(); }));

  f.client->stop();
  REQUIRE(running.wait_for(std::chrono::seconds(5)) ==
          std::future_status::ready);
  running.get();
}
