#include "ClientState.hpp"

#include "Errors.hpp"

namespace mw {
std::optional<User> ClientState::getSelf() const {
  lock_guard<std::mutex> guard(stateMutex);
  return self;
}

int64_t ClientState::getSelfId() const {
  lock_guard<std::mutex> guard(stateMutex);
  if (!self || self->contact.id == 0) {
    throw UnauthenticatedError();
  }
  return self->contact.id;
}

bool ClientState::isAuthenticated() const {
  lock_guard<std::mutex> guard(stateMutex);
  return self && self->contact.id != 0;
}

void ClientState::setSelf(const User& user) {
  lock_guard<std::mutex> guard(stateMutex);
  self = user;
}

void ClientState::clear() {
  lock_guard<std::mutex> guard(stateMutex);
  self.reset();
}
}  // namespace mw
