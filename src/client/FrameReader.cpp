#include "FrameReader.hpp"

#include "Opcodes.hpp"

namespace mw {
FrameReader::FrameReader(shared_ptr<Connection> _connection,
                         shared_ptr<PendingRequestTable> _pendingRequests,
                         shared_ptr<SequenceAllocator> _sequences,
                         PushSink _pushSink, LossSink _lossSink)
    : connection(_connection),
      pendingRequests(_pendingRequests),
      sequences(_sequences),
      pushSink(_pushSink),
      lossSink(_lossSink),
      running(false),
      lossReported(false) {}

FrameReader::~FrameReader() {
  requestStop();
  join();
}

void FrameReader::start() {
  lock_guard<std::mutex> guard(threadMutex);
  if (readerThread) {
    LOG(WARNING) << "Frame reader already started";
    return;
  }
  running = true;
  readerThread.reset(new std::thread(&FrameReader::run, this));
  readerThreadId = readerThread->get_id();
}

void FrameReader::join() {
  lock_guard<std::mutex> guard(threadMutex);
  if (!readerThread || !readerThread->joinable()) {
    return;
  }
  if (std::this_thread::get_id() == readerThreadId) {
    // Stopping from a loss callback: the loop exits on its own
    readerThread->detach();
    return;
  }
  readerThread->join();
}

bool FrameReader::isReaderThread() const {
  return std::this_thread::get_id() == readerThreadId;
}

void FrameReader::run() {
  el::Helpers::setThreadName("frame-reader");
  VLOG(1) << "Frame reader started";
  while (running) {
    pendingRequests->expireOverdue(std::chrono::steady_clock::now());
    if (connection->isDisconnected()) {
      fail("ConnectionClosed: socket was closed");
      break;
    }
    if (!connection->waitForData(READER_POLL_INTERVAL_MS)) {
      continue;
    }
    string chunk;
    if (!connection->readSome(&chunk)) {
      fail("ConnectionClosed: stream ended");
      break;
    }
    if (chunk.empty()) {
      continue;
    }
    try {
      splitter.feed(chunk);
      string frameText;
      while (running && splitter.next(&frameText)) {
        VLOG(2) << "Read frame: " << frameText;
        handleFrame(Frame::parse(frameText));
      }
    } catch (const FrameDecodeError& fde) {
      LOG(ERROR) << "Dropping connection after a bad frame: " << fde.what();
      fail(string("ProtocolDecodeError: ") + fde.what());
      break;
    }
  }
  VLOG(1) << "Frame reader exiting";
}

void FrameReader::handleFrame(const Frame& frame) {
  switch (frame.getOpcode()) {
    case OPCODE_PING:
      // Keepalives never touch pending calls, whatever their seq
      if (!frame.hasCommand() || frame.isRequest()) {
        acknowledgePing();
      } else {
        VLOG(1) << "Dropping answer to our keepalive: seq "
                << frame.getSequence();
      }
      return;
    case OPCODE_NOTIF_MESSAGE:
      dispatchPush(frame);
      return;
    default:
      break;
  }
  if (frame.hasCommand() && frame.isRequest()) {
    dispatchPush(frame);
    return;
  }
  if (!pendingRequests->resolve(frame.getSequence(), frame.getCommand(),
                                frame.getPayload())) {
    VLOG(1) << "Dropping reply with no pending request: seq "
            << frame.getSequence() << " opcode " << frame.getOpcode();
  }
}

void FrameReader::dispatchPush(const Frame& frame) {
  if (pushSink) {
    pushSink(PushEvent::fromFrame(frame));
  }
}

void FrameReader::acknowledgePing() {
  Frame ack(sequences->next(), OPCODE_PING, {{"interactive", false}});
  VLOG(2) << "Acknowledging keepalive ping";
  try {
    connection->writeFrame(ack.serialize());
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Could not acknowledge ping: " << re.what();
    fail(string("ConnectionClosed: ") + re.what());
  }
}

void FrameReader::fail(const string& reason) {
  running = false;
  pendingRequests->cancelAll(reason);
  connection->closeSocket();
  if (!lossReported.exchange(true)) {
    LOG(WARNING) << "Connection lost: " << reason;
    if (lossSink) {
      lossSink(reason);
    }
  }
}
}  // namespace mw
