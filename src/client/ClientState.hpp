#ifndef __MW_CLIENT_STATE__
#define __MW_CLIENT_STATE__

#include "Domain.hpp"
#include "Headers.hpp"

namespace mw {
/**
 * @brief Identity of the account a client is logged in as.  Written by the
 * login path and read by filters on the dispatch worker.
 */
class ClientState {
 public:
  ClientState() {}

  /** @brief The authenticated user, if login has completed. */
  std::optional<User> getSelf() const;

  /**
   * @brief Contact id of the authenticated user.
   * @throws UnauthenticatedError before login.
   */
  int64_t getSelfId() const;

  bool isAuthenticated() const;

  void setSelf(const User& user);

  void clear();

 protected:
  std::optional<User> self;
  mutable std::mutex stateMutex;
};
}  // namespace mw

#endif  // __MW_CLIENT_STATE__
