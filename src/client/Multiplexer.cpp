#include "Multiplexer.hpp"

namespace mw {
Multiplexer::Multiplexer(shared_ptr<Connection> _connection,
                         shared_ptr<ClientState> _clientState,
                         shared_ptr<HandlerRegistry> _handlers,
                         shared_ptr<SequenceAllocator> _sequences,
                         int64_t _defaultTimeoutMs)
    : connection(_connection),
      clientState(_clientState),
      handlers(_handlers),
      sequences(_sequences),
      pendingRequests(new PendingRequestTable()),
      defaultTimeoutMs(_defaultTimeoutMs),
      dispatchPool(new ThreadPool(1)),
      dispatchThreadId(std::thread::id()),
      started(false),
      stopped(false) {
  reader.reset(new FrameReader(
      connection, pendingRequests, sequences,
      [this](const PushEvent& event) { dispatchPush(event); },
      [this](const string& reason) { onConnectionLost(reason); }));
  dispatchPool->enqueue([this]() {
    el::Helpers::setThreadName("push-dispatch");
    dispatchThreadId = std::this_thread::get_id();
  });
}

Multiplexer::Multiplexer(shared_ptr<Connection> _connection,
                         int64_t _defaultTimeoutMs)
    : Multiplexer(_connection, make_shared<ClientState>(),
                  make_shared<HandlerRegistry>(),
                  make_shared<SequenceAllocator>(), _defaultTimeoutMs) {}

Multiplexer::~Multiplexer() {
  stop();
  // Drains queued handlers before the registry can go away
  dispatchPool.reset();
  reader.reset();
}

CallResult Multiplexer::sendAndAwait(int opcode, const json& payload,
                                     int64_t timeoutMs) {
  if (!isRunning()) {
    return CallResult::failure(CallStatus::CONNECTION_CLOSED,
                               "ConnectionClosed: multiplexer is not running");
  }
  int64_t sequence = sequences->next();
  std::optional<PendingRequestTable::Deadline> deadline;
  if (timeoutMs != NO_TIMEOUT) {
    deadline = std::chrono::steady_clock::now() +
               std::chrono::milliseconds(timeoutMs);
  }
  auto future = pendingRequests->registerRequest(sequence, deadline);

  Frame frame(sequence, opcode, payload);
  try {
    connection->writeFrame(frame.serialize());
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Failed to send opcode " << opcode << ": " << re.what();
    pendingRequests->cancel(sequence, string("ConnectionClosed: ") + re.what());
    return future.get();
  }

  if (timeoutMs != NO_TIMEOUT &&
      future.wait_for(std::chrono::milliseconds(timeoutMs)) ==
          std::future_status::timeout) {
    pendingRequests->expire(sequence);
  }
  // Whoever resolved the slot first decides the outcome
  CallResult result = future.get();
  VLOG(2) << "Call seq " << sequence << " opcode " << opcode
          << " finished: " << callStatusToString(result.getStatus());
  return result;
}

bool Multiplexer::sendFireAndForget(int opcode, const json& payload) {
  if (!isRunning()) {
    LOG(WARNING) << "Dropping opcode " << opcode
                 << ": multiplexer is not running";
    return false;
  }
  Frame frame(sequences->next(), opcode, payload);
  try {
    connection->writeFrame(frame.serialize());
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Failed to send opcode " << opcode << ": " << re.what();
    return false;
  }
  return true;
}

void Multiplexer::start() {
  if (started.exchange(true)) {
    return;
  }
  if (connection->isDisconnected()) {
    started = false;
    throw std::runtime_error("Cannot start a multiplexer on a closed socket");
  }
  {
    lock_guard<std::mutex> guard(stoppedMutex);
    stopped = false;
  }
  pendingRequests->reopen();
  reader->start();
  LOG(INFO) << "Multiplexer started";
}

void Multiplexer::stop() {
  if (!started.exchange(false)) {
    return;
  }
  LOG(INFO) << "Stopping multiplexer";
  reader->requestStop();
  reader->join();
  pendingRequests->cancelAll("ConnectionClosed: multiplexer stopped");
  connection->closeSocket();
  markStopped();
}

void Multiplexer::setConnectionLostCallback(ConnectionLostCallback callback) {
  lock_guard<std::mutex> guard(callbackMutex);
  connectionLostCallback = callback;
}

bool Multiplexer::isRunning() const { return started && reader->isRunning(); }

void Multiplexer::waitUntilStopped() {
  std::unique_lock<std::mutex> lock(stoppedMutex);
  stoppedCondition.wait(lock, [this] { return stopped; });
}

void Multiplexer::dispatchPush(const PushEvent& event) {
  auto state = clientState;
  auto registry = handlers;
  dispatchPool->enqueue(
      [state, registry, event]() { registry->dispatch(*state, event); });
}

void Multiplexer::onConnectionLost(const string& reason) {
  ConnectionLostCallback callback;
  {
    lock_guard<std::mutex> guard(callbackMutex);
    callback = connectionLostCallback;
  }
  if (callback) {
    callback(reason);
  }
  markStopped();
}

void Multiplexer::markStopped() {
  {
    lock_guard<std::mutex> guard(stoppedMutex);
    stopped = true;
  }
  stoppedCondition.notify_all();
}
}  // namespace mw
