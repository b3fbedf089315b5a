#ifndef __MW_MULTIPLEXER__
#define __MW_MULTIPLEXER__

#include "CallResult.hpp"
#include "ClientState.hpp"
#include "Connection.hpp"
#include "FrameReader.hpp"
#include "HandlerRegistry.hpp"
#include "Headers.hpp"
#include "PendingRequestTable.hpp"
#include "SequenceAllocator.hpp"

namespace mw {
/**
 * @brief Correlated calls and push dispatch over one connection.
 *
 * A single FrameReader owns the inbound stream.  Callers block only on the
 * future of their own request; push handlers run in arrival order on a
 * dedicated worker so they never hold up the reader.
 */
class Multiplexer {
 public:
  /** @brief Timeout value that waits for a reply forever. */
  static constexpr int64_t NO_TIMEOUT = -1;

  typedef std::function<void(const string&)> ConnectionLostCallback;

  Multiplexer(shared_ptr<Connection> _connection,
              shared_ptr<ClientState> _clientState,
              shared_ptr<HandlerRegistry> _handlers,
              shared_ptr<SequenceAllocator> _sequences,
              int64_t _defaultTimeoutMs = DEFAULT_REQUEST_TIMEOUT_MS);

  Multiplexer(shared_ptr<Connection> _connection,
              int64_t _defaultTimeoutMs = DEFAULT_REQUEST_TIMEOUT_MS);

  virtual ~Multiplexer();

  /**
   * @brief Sends a request and blocks until its reply, the timeout or the
   * end of the connection, whichever comes first.
   */
  CallResult sendAndAwait(int opcode, const json& payload, int64_t timeoutMs);

  /** @brief sendAndAwait() with the default timeout. */
  CallResult sendAndAwait(int opcode, const json& payload) {
    return sendAndAwait(opcode, payload, defaultTimeoutMs);
  }

  /**
   * @brief Sends a request without waiting for any reply.
   * @return false if the multiplexer is not running or the write failed.
   */
  bool sendFireAndForget(int opcode, const json& payload);

  /** @brief Binds a push handler, see HandlerRegistry::registerHandler. */
  PushHandler on(FilterPtr filter, PushHandler handler,
                 FilterErrorHandler onFilterError = nullptr) {
    return handlers->registerHandler(filter, handler, onFilterError);
  }

  /** @brief Starts the reader.  Calling it twice is harmless. */
  void start();

  /**
   * @brief Stops the reader, fails every pending call with
   * CONNECTION_CLOSED and closes the socket.  Safe to call more than once and
   * from any thread, including push handlers.
   */
  void stop();

  /**
   * @brief Invoked once, on the reader thread, when the stream is lost or a
   * frame cannot be decoded.
   */
  void setConnectionLostCallback(ConnectionLostCallback callback);

  bool isRunning() const;

  /** @brief True on the worker that runs push handlers. */
  bool isDispatchThread() const {
    return std::this_thread::get_id() == dispatchThreadId.load();
  }

  /** @brief Blocks until the multiplexer stops or the stream is lost. */
  void waitUntilStopped();

  shared_ptr<ClientState> getClientState() { return clientState; }
  shared_ptr<HandlerRegistry> getHandlers() { return handlers; }
  shared_ptr<PendingRequestTable> getPendingRequests() {
    return pendingRequests;
  }
  shared_ptr<SequenceAllocator> getSequences() { return sequences; }
  int64_t getDefaultTimeoutMs() const { return defaultTimeoutMs; }

 protected:
  void dispatchPush(const PushEvent& event);
  void onConnectionLost(const string& reason);
  void markStopped();

  shared_ptr<Connection> connection;
  shared_ptr<ClientState> clientState;
  shared_ptr<HandlerRegistry> handlers;
  shared_ptr<SequenceAllocator> sequences;
  shared_ptr<PendingRequestTable> pendingRequests;
  int64_t defaultTimeoutMs;
  /** @brief Single worker so handlers run in arrival order. */
  std::unique_ptr<ThreadPool> dispatchPool;
  std::atomic<std::thread::id> dispatchThreadId;
  std::unique_ptr<FrameReader> reader;
  std::atomic<bool> started;
  ConnectionLostCallback connectionLostCallback;
  std::mutex callbackMutex;
  /** @brief Signalled when the multiplexer stops for any reason. */
  std::condition_variable stoppedCondition;
  std::mutex stoppedMutex;
  bool stopped;
};
}  // namespace mw

#endif  // __MW_MULTIPLEXER__
