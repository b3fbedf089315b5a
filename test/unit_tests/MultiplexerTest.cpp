#include "FakeServer.hpp"
#include "Multiplexer.hpp"
#include "Opcodes.hpp"
#include "TestHeaders.hpp"

using namespace mw;
using Catch::Matchers::StartsWith;

namespace {
struct MultiplexerFixture {
  MultiplexerFixture() : socketHandler(new SocketPairHandler()) {
    int clientFd = socketHandler->connect(SocketEndpoint("fake", 0));
    server.reset(new FakeServer(socketHandler->takeServerFd()));
    connection.reset(new Connection(socketHandler, clientFd));
    multiplexer.reset(new Multiplexer(connection, 2000));
    multiplexer->setConnectionLostCallback([this](const string& reason) {
      lock_guard<std::mutex> guard(lossMutex);
      lossReasons.push_back(reason);
    });
    multiplexer->start();
  }

  ~MultiplexerFixture() { multiplexer.reset(); }

  vector<string> getLossReasons() {
    lock_guard<std::mutex> guard(lossMutex);
    return lossReasons;
  }

  shared_ptr<SocketPairHandler> socketHandler;
  shared_ptr<FakeServer> server;
  shared_ptr<Connection> connection;
  shared_ptr<Multiplexer> multiplexer;
  std::mutex lossMutex;
  vector<string> lossReasons;
};
}  // namespace

TEST_CASE("Replies reach their own caller", "[Multiplexer]") {
  MultiplexerFixture f;
  auto first = std::async(std::launch::async, [&f]() {
    return f.multiplexer->sendAndAwait(OPCODE_MSG_SEND, {{"n", 1}});
  });
  Frame a = f.server->readFrame();
  auto second = std::async(std::launch::async, [&f]() {
    return f.multiplexer->sendAndAwait(OPCODE_MSG_SEND, {{"n", 2}});
  });
  Frame b = f.server->readFrame();
  REQUIRE(a.getSequence() != b.getSequence());

  // Answer out of order
  f.server->replyTo(b, {{"echo", b.getPayload()["n"]}});
  f.server->replyTo(a, {{"echo", a.getPayload()["n"]}});

  CallResult firstResult = first.get();
  CallResult secondResult = second.get();
  REQUIRE(firstResult.ok());
  REQUIRE(secondResult.ok());
  REQUIRE(firstResult.getPayload()["echo"] == 1);
  REQUIRE(secondResult.getPayload()["echo"] == 2);
  REQUIRE(f.multiplexer->getPendingRequests()->size() == 0);
}

TEST_CASE("Outbound frames carry allocated sequences", "[Multiplexer]") {
  MultiplexerFixture f;
  REQUIRE(f.multiplexer->sendFireAndForget(OPCODE_CONFIG, json::object()));
  REQUIRE(f.multiplexer->sendFireAndForget(OPCODE_CONFIG, json::object()));
  json first = f.server->readFrameJson();
  json second = f.server->readFrameJson();
  REQUIRE(first["ver"] == PROTOCOL_VERSION);
  REQUIRE(first["cmd"] == FRAME_COMMAND_REQUEST);
  REQUIRE(first["seq"] == 0);
  REQUIRE(second["seq"] == 1);
  REQUIRE(f.multiplexer->getPendingRequests()->size() == 0);
}

TEST_CASE("Stop releases blocked callers", "[Multiplexer]") {
  MultiplexerFixture f;
  auto call = std::async(std::launch::async, [&f]() {
    return f.multiplexer->sendAndAwait(OPCODE_MSG_SEND, json::object(),
                                       Multiplexer::NO_TIMEOUT);
  });
  f.server->readFrame();
  f.multiplexer->stop();

  CallResult result = call.get();
  REQUIRE(result.getStatus() == CallStatus::CONNECTION_CLOSED);
  REQUIRE_FALSE(f.multiplexer->isRunning());
  REQUIRE(f.connection->isDisconnected());
  REQUIRE_NOTHROW(f.multiplexer->stop());

  CallResult afterStop =
      f.multiplexer->sendAndAwait(OPCODE_MSG_SEND, json::object());
  REQUIRE(afterStop.getStatus() == CallStatus::CONNECTION_CLOSED);
  REQUIRE_FALSE(f.multiplexer->sendFireAndForget(OPCODE_CONFIG, {}));
  // Shutting down on purpose is not a lost connection
  REQUIRE(f.getLossReasons().empty());
}

TEST_CASE("Zero timeout expires and the late reply is dropped",
          "[Multiplexer]") {
  MultiplexerFixture f;
  CallResult result = f.multiplexer->sendAndAwait(OPCODE_MSG_SEND,
                                                  json::object(), 0);
  REQUIRE(result.getStatus() == CallStatus::TIMEOUT);
  Frame late = f.server->readFrame();
  f.server->replyTo(late, {{"late", true}});

  auto next = std::async(std::launch::async, [&f]() {
    return f.multiplexer->sendAndAwait(OPCODE_MSG_EDIT, json::object());
  });
  Frame request = f.server->readFrame();
  REQUIRE(request.getSequence() == late.getSequence() + 1);
  f.server->replyTo(request, {{"late", false}});
  CallResult nextResult = next.get();
  REQUIRE(nextResult.ok());
  REQUIRE(nextResult.getPayload()["late"] == false);
  REQUIRE(f.multiplexer->isRunning());
}

TEST_CASE("Keepalive pings are acknowledged inline", "[Multiplexer]") {
  MultiplexerFixture f;
  std::atomic<int> handled(0);
  f.multiplexer->on(FilterNode::any(),
                    [&handled](const PushEvent&) { handled++; });

  f.server->push(55, OPCODE_PING, json::object());
  json ack = f.server->readFrameJson();
  REQUIRE(ack["opcode"] == OPCODE_PING);
  REQUIRE(ack["cmd"] == FRAME_COMMAND_REQUEST);
  REQUIRE(ack["payload"]["interactive"] == false);
  REQUIRE(ack["seq"] == 0);

  // The server answering our acknowledgement is not a push either
  f.server->replyTo(Frame::parse(ack.dump()), json::object());
  f.server->push(56, 999, json::object());
  REQUIRE(waitFor([&handled]() { return handled == 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(handled == 1);
}

TEST_CASE("Server frames go to push handlers", "[Multiplexer]") {
  MultiplexerFixture f;
  std::mutex eventsMutex;
  vector<PushEvent> events;
  f.multiplexer->on(FilterNode::eventOpcode(OPCODE_NOTIF_MESSAGE),
                    [&](const PushEvent& event) {
                      lock_guard<std::mutex> guard(eventsMutex);
                      events.push_back(event);
                    });

  SECTION("New message notifications decode their message") {
    f.server->push(
        900, OPCODE_NOTIF_MESSAGE,
        {{"chatId", 42},
         {"message",
          {{"sender", 7}, {"id", "1001"}, {"text", "hi"}, {"type", "USER"}}}});
    REQUIRE(waitFor([&]() {
      lock_guard<std::mutex> guard(eventsMutex);
      return events.size() == 1;
    }));
    lock_guard<std::mutex> guard(eventsMutex);
    REQUIRE(events[0].message);
    REQUIRE(events[0].message->chatId == 42);
    REQUIRE(events[0].message->sender == 7);
    REQUIRE(*events[0].message->text == "hi");
  }

  SECTION("A push sharing a pending sequence is still a push") {
    auto call = std::async(std::launch::async, [&f]() {
      return f.multiplexer->sendAndAwait(OPCODE_MSG_SEND, json::object());
    });
    Frame request = f.server->readFrame();
    f.server->push(request.getSequence(), OPCODE_NOTIF_MESSAGE,
                   {{"chatId", 1}, {"message", {{"text", "push"}}}});
    REQUIRE(waitFor([&]() {
      lock_guard<std::mutex> guard(eventsMutex);
      return events.size() == 1;
    }));
    REQUIRE(f.multiplexer->getPendingRequests()->size() == 1);
    f.server->replyTo(request, {{"reply", true}});
    REQUIRE(call.get().getPayload()["reply"] == true);
  }
}

TEST_CASE("Frames without cmd are routed by opcode", "[Multiplexer]") {
  MultiplexerFixture f;
  std::atomic<int> pushes(0);
  f.multiplexer->on(FilterNode::any(),
                    [&pushes](const PushEvent&) { pushes++; });

  auto call = std::async(std::launch::async, [&f]() {
    return f.multiplexer->sendAndAwait(OPCODE_MSG_SEND, {{"text", "hi"}});
  });
  Frame request = f.server->readFrame();
  string seq = to_string(request.getSequence());

  SECTION("A reply resolves its call and a notification is a push") {
    f.server->sendRaw(R"({"seq":)" + seq +
                      R"(,"opcode":64,"payload":{"ok":1}})");
    CallResult result = call.get();
    REQUIRE(result.ok());
    REQUIRE(result.getPayload()["ok"] == 1);

    f.server->sendRaw(
        R"({"ver":11,"seq":555,"opcode":128,"payload":{"chatId":3,)"
        R"("message":{"sender":9,"id":"77","text":"yo"}}})");
    REQUIRE(waitFor([&pushes]() { return pushes == 1; }));
  }

  SECTION("A keepalive sharing a pending sequence leaves the call alone") {
    f.server->sendRaw(R"({"seq":)" + seq + R"(,"opcode":1,"payload":{}})");
    json ack = f.server->readFrameJson();
    REQUIRE(ack["opcode"] == OPCODE_PING);
    REQUIRE(ack["seq"] != request.getSequence());
    REQUIRE(f.multiplexer->getPendingRequests()->size() == 1);
    REQUIRE(pushes == 0);

    f.server->replyTo(request, {{"reply", true}});
    REQUIRE(call.get().getPayload()["reply"] == true);
  }

  SECTION("A notification marked as a reply is still a push") {
    f.server->sendFrame(Frame(FRAME_COMMAND_RESPONSE, request.getSequence(),
                              OPCODE_NOTIF_MESSAGE, {{"chatId", 1}}));
    REQUIRE(waitFor([&pushes]() { return pushes == 1; }));
    REQUIRE(f.multiplexer->getPendingRequests()->size() == 1);
    f.server->replyTo(request, {{"reply", true}});
    REQUIRE(call.get().ok());
  }
}

TEST_CASE("Handlers run in arrival order", "[Multiplexer]") {
  MultiplexerFixture f;
  std::mutex orderMutex;
  vector<int64_t> order;
  f.multiplexer->on(FilterNode::any(), [&](const PushEvent& event) {
    lock_guard<std::mutex> guard(orderMutex);
    order.push_back(event.sequence);
  });
  for (int64_t seq = 100; seq < 120; seq++) {
    f.server->push(seq, 200, json::object());
  }
  REQUIRE(waitFor([&]() {
    lock_guard<std::mutex> guard(orderMutex);
    return order.size() == 20;
  }));
  lock_guard<std::mutex> guard(orderMutex);
  for (int a = 0; a < 20; a++) {
    REQUIRE(order[a] == 100 + a);
  }
}

TEST_CASE("A bad frame tears the connection down", "[Multiplexer]") {
  MultiplexerFixture f;
  auto call = std::async(std::launch::async, [&f]() {
    return f.multiplexer->sendAndAwait(OPCODE_MSG_SEND, json::object(),
                                       Multiplexer::NO_TIMEOUT);
  });
  f.server->readFrame();
  f.server->sendRaw("this is not json");

  CallResult result = call.get();
  REQUIRE(result.getStatus() == CallStatus::CONNECTION_CLOSED);
  REQUIRE_THAT(result.getError(), StartsWith("ProtocolDecodeError"));
  REQUIRE(waitFor([&f]() { return f.getLossReasons().size() == 1; }));
  REQUIRE_THAT(f.getLossReasons()[0], StartsWith("ProtocolDecodeError"));
  REQUIRE_FALSE(f.multiplexer->isRunning());
  REQUIRE(f.connection->isDisconnected());
}

TEST_CASE("A frame missing its sequence is a decode error", "[Multiplexer]") {
  MultiplexerFixture f;
  f.server->sendRaw(R"({"ver":11,"cmd":0,"opcode":128,"payload":{}})");
  REQUIRE(waitFor([&f]() { return f.getLossReasons().size() == 1; }));
  REQUIRE_THAT(f.getLossReasons()[0], StartsWith("ProtocolDecodeError"));
}

TEST_CASE("End of stream is reported once", "[Multiplexer]") {
  MultiplexerFixture f;
  auto call = std::async(std::launch::async, [&f]() {
    return f.multiplexer->sendAndAwait(OPCODE_MSG_SEND, json::object(),
                                       Multiplexer::NO_TIMEOUT);
  });
  f.server->readFrame();
  f.server->close();

  REQUIRE(call.get().getStatus() == CallStatus::CONNECTION_CLOSED);
  REQUIRE(waitFor([&f]() { return !f.getLossReasons().empty(); }));
  f.multiplexer->waitUntilStopped();
  f.multiplexer->stop();
  REQUIRE(f.getLossReasons().size() == 1);
  REQUIRE_THAT(f.getLossReasons()[0], StartsWith("ConnectionClosed"));
}
