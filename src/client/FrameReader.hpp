#ifndef __MW_FRAME_READER__
#define __MW_FRAME_READER__

#include "Connection.hpp"
#include "Frame.hpp"
#include "FrameSplitter.hpp"
#include "Headers.hpp"
#include "PendingRequestTable.hpp"
#include "PushEvent.hpp"
#include "SequenceAllocator.hpp"

namespace mw {
/**
 * @brief The only code that reads from a connection.
 *
 * Runs on its own thread, cuts the stream into frames and routes each one:
 * keepalive pings are acknowledged inline, replies resolve their pending
 * request and everything else the server originates goes to the push sink.
 */
class FrameReader {
 public:
  typedef std::function<void(const PushEvent&)> PushSink;
  typedef std::function<void(const string&)> LossSink;

  FrameReader(shared_ptr<Connection> _connection,
              shared_ptr<PendingRequestTable> _pendingRequests,
              shared_ptr<SequenceAllocator> _sequences, PushSink _pushSink,
              LossSink _lossSink);

  virtual ~FrameReader();

  /** @brief Spawns the reader thread. */
  void start();

  /**
   * @brief Asks the loop to exit after its current wait.  Does not block.
   */
  void requestStop() { running = false; }

  /**
   * @brief Waits for the reader thread to exit.  A no-op on the reader
   * thread itself.
   */
  void join();

  bool isRunning() const { return running; }

  bool isReaderThread() const;

  /**
   * @brief Routes one decoded frame by opcode.
   *
   * Keepalives are answered inline and new-message notifications always go
   * to the push sink.  Any other opcode is a reply matched on `seq`, unless
   * the server marked it as a request with an explicit `cmd` of 0.
   */
  void handleFrame(const Frame& frame);

 protected:
  void run();

  /**
   * @brief Stops the loop after the stream died or went out of sync.  Every
   * pending call fails with `reason`, the socket is closed and the loss sink
   * hears about it once.
   */
  void fail(const string& reason);

  void acknowledgePing();

  void dispatchPush(const Frame& frame);

  shared_ptr<Connection> connection;
  shared_ptr<PendingRequestTable> pendingRequests;
  shared_ptr<SequenceAllocator> sequences;
  PushSink pushSink;
  LossSink lossSink;
  FrameSplitter splitter;
  std::atomic<bool> running;
  std::atomic<bool> lossReported;
  std::unique_ptr<std::thread> readerThread;
  std::thread::id readerThreadId;
  std::mutex threadMutex;
};
}  // namespace mw

#endif  // __MW_FRAME_READER__
