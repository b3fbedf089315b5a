#include "PendingRequestTable.hpp"

namespace mw {
PendingRequestTable::PendingRequestTable() : closed(false) {}

std::future<CallResult> PendingRequestTable::registerRequest(
    int64_t sequence, std::optional<Deadline> deadline) {
  auto request = make_shared<PendingRequest>();
  request->sequence = sequence;
  request->deadline = deadline;
  auto future = request->resultSlot.get_future();

  lock_guard<std::mutex> guard(tableMutex);
  if (closed) {
    VLOG(1) << "Refusing to register " << sequence << ": " << closedReason;
    request->resultSlot.set_value(
        CallResult::failure(CallStatus::CONNECTION_CLOSED, closedReason));
    return future;
  }
  if (!pending.insert(make_pair(sequence, request)).second) {
    throw DuplicateSequenceError(sequence);
  }
  VLOG(3) << "Registered pending request " << sequence;
  return future;
}

shared_ptr<PendingRequestTable::PendingRequest> PendingRequestTable::take(
    int64_t sequence) {
  lock_guard<std::mutex> guard(tableMutex);
  auto it = pending.find(sequence);
  if (it == pending.end()) {
    return nullptr;
  }
  auto request = it->second;
  pending.erase(it);
  return request;
}

bool PendingRequestTable::resolve(int64_t sequence, int command,
                                  const json& payload) {
  auto request = take(sequence);
  if (!request) {
    return false;
  }
  request->resultSlot.set_value(CallResult::reply(command, payload));
  return true;
}

bool PendingRequestTable::expire(int64_t sequence) {
  auto request = take(sequence);
  if (!request) {
    return false;
  }
  VLOG(1) << "Request " << sequence << " timed out";
  request->resultSlot.set_value(CallResult::failure(
      CallStatus::TIMEOUT,
      "No reply for sequence " + to_string(sequence) + " before deadline"));
  return true;
}

bool PendingRequestTable::cancel(int64_t sequence, const string& reason) {
  auto request = take(sequence);
  if (!request) {
    return false;
  }
  request->resultSlot.set_value(
      CallResult::failure(CallStatus::CONNECTION_CLOSED, reason));
  return true;
}

int PendingRequestTable::expireOverdue(Deadline now) {
  vector<int64_t> overdue;
  {
    lock_guard<std::mutex> guard(tableMutex);
    for (const auto& it : pending) {
      if (it.second->deadline && *(it.second->deadline) <= now) {
        overdue.push_back(it.first);
      }
    }
  }
  int expired = 0;
  for (auto sequence : overdue) {
    if (expire(sequence)) {
      expired++;
    }
  }
  return expired;
}

void PendingRequestTable::cancelAll(const string& reason) {
  unordered_map<int64_t, shared_ptr<PendingRequest>> cancelled;
  {
    lock_guard<std::mutex> guard(tableMutex);
    closed = true;
    closedReason = reason;
    cancelled.swap(pending);
  }
  if (!cancelled.empty()) {
    LOG(INFO) << "Cancelling " << cancelled.size()
              << " pending requests: " << reason;
  }
  for (auto& it : cancelled) {
    it.second->resultSlot.set_value(
        CallResult::failure(CallStatus::CONNECTION_CLOSED, reason));
  }
}

void PendingRequestTable::reopen() {
  lock_guard<std::mutex> guard(tableMutex);
  closed = false;
  closedReason.clear();
}

bool PendingRequestTable::isClosed() {
  lock_guard<std::mutex> guard(tableMutex);
  return closed;
}

int PendingRequestTable::size() {
  lock_guard<std::mutex> guard(tableMutex);
  return int(pending.size());
}
}  // namespace mw
