#ifndef __MW_MAX_CLIENT__
#define __MW_MAX_CLIENT__

#include "ClientConfig.hpp"
#include "ClientState.hpp"
#include "Domain.hpp"
#include "Errors.hpp"
#include "FilterNode.hpp"
#include "HandlerRegistry.hpp"
#include "Headers.hpp"
#include "Multiplexer.hpp"
#include "SocketHandler.hpp"

namespace mw {
/**
 * @brief Messenger account client: login, messaging and profile lookups on
 * top of a Multiplexer.
 *
 * Handlers and the on-connect callback survive disconnects; every connect()
 * opens a fresh socket and multiplexer.
 */
class MaxClient {
 public:
  typedef std::function<void(MaxClient&, const Message&)> MessageHandler;
  typedef std::function<void()> ConnectCallback;

  MaxClient(shared_ptr<SocketHandler> _socketHandler,
            const ClientConfig& _config);

  virtual ~MaxClient();

  /**
   * @brief Opens the session and logs in with the configured token.  Does
   * nothing when already connected.
   * @throws ServerError if the server rejects the handshake or token.
   * @throws CallError if a reply never arrives.
   */
  void connect();

  /**
   * @brief Stops the multiplexer and forgets the logged in identity.
   */
  void disconnect();

  bool isConnected() const;

  void setToken(const string& token);
  string getToken();

  /**
   * @brief Asks the server to send a verification code to `phone`.
   * @return The verification token to pass to checkCode().
   */
  string startAuth(const string& phone);

  /**
   * @brief Submits the verification code.  On success the login token and
   * profile are stored.
   * @throws ServerError with error "verify.code.wrong" for a bad code.
   */
  User checkCode(const string& verifyToken, const string& code);

  Message sendMessage(int64_t chatId, const string& text,
                      const std::optional<string>& replyId = std::nullopt,
                      bool notify = true);
  Message editMessage(int64_t chatId, const string& messageId,
                      const string& text);
  bool deleteMessage(int64_t chatId, const vector<string>& messageIds,
                     bool forMe = false);

  bool pinChat(int64_t chatId);
  bool unpinChat(int64_t chatId);

  User getUserById(int64_t contactId);
  User getUserByPhone(const string& phone);
  /**
   * @brief Looks up the other member of a dialog.  Dialog ids are the XOR of
   * both member ids.
   * @throws UnauthenticatedError before login.
   */
  User getUserByChat(int64_t chatId);

  /**
   * @brief Invalidates the session token on the server and disconnects.
   */
  bool sessionExit();

  /** @brief Replies to `message` in its chat. */
  Message reply(const Message& message, const string& text);
  /** @brief Posts to the chat of `message` without linking to it. */
  Message answer(const Message& message, const string& text);
  bool deleteMessage(const Message& message, bool forMe = false);
  Message editMessage(const Message& message, const string& text);

  /**
   * @brief Binds a handler for new messages.  Only events carrying a decoded
   * message reach `filter`.
   */
  void onMessage(FilterPtr filter, MessageHandler handler,
                 FilterErrorHandler onFilterError = nullptr);

  void onConnect(ConnectCallback callback);

  /**
   * @brief Connects, then blocks until stop() or the connection is lost.
   */
  void run();

  /** @brief Disconnects.  Callable from any thread, including handlers. */
  void stop() { disconnect(); }

  std::optional<User> getMe() const { return clientState->getSelf(); }
  shared_ptr<ClientState> getClientState() { return clientState; }
  shared_ptr<Multiplexer> getMultiplexer();

 protected:
  /**
   * @brief Connects the socket, starts a multiplexer and sends the
   * session-init frame.
   */
  void openSession();

  /**
   * @brief Stops and drops the current multiplexer.  When called from that
   * multiplexer's own dispatch worker it is kept in `retiredMultiplexers`
   * until a later call or the destructor can release it.
   */
  void retireMultiplexer();

  void login();

  /**
   * @brief Correlated call that turns every failure into an exception.
   * @return The reply payload.
   */
  json call(int opcode, const json& payload);

  /** @brief Fire-and-forget send on the current session. */
  bool send(int opcode, const json& payload);

  json configPayload(int64_t chatId, int64_t favIndex) const;

  shared_ptr<SocketHandler> socketHandler;
  ClientConfig config;
  shared_ptr<ClientState> clientState;
  shared_ptr<HandlerRegistry> handlers;
  shared_ptr<SequenceAllocator> sequences;
  shared_ptr<Multiplexer> multiplexer;
  vector<shared_ptr<Multiplexer>> retiredMultiplexers;
  string deviceId;
  ConnectCallback connectCallback;
  /** @brief True once login completed on the current session. */
  std::atomic<bool> connected;
  /** @brief Serializes connect/disconnect. */
  recursive_mutex clientMutex;
};
}  // namespace mw

#endif  // __MW_MAX_CLIENT__
